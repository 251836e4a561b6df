#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace remit::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using basis_points_t = uint16_t;

/// Denominator for every basis-point rate (1 bps = 1/10000).
inline constexpr auto kBasisPointsDenominator = uint32_t{10000};

/// Upper bound for any configurable fee rate (100 bps = 1%).
inline constexpr auto kMaxFeeBasisPoints = basis_points_t{100};

/// The null address; never a valid owner, fee receiver or exchange target.
inline constexpr auto kZeroAddress = address_t{};

/// Sentinel token identifier denoting the chain's native currency.
inline constexpr auto kNativeToken =
    address_t{0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE,
              0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE, 0xEE};

constexpr bool is_native(const address_t& token) {
  return token == kNativeToken;
}

constexpr bool is_zero(const address_t& address) {
  return address == kZeroAddress;
}

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(std::string_view bytes);
bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(std::string_view bytes);
/// Raw byte copy, for protobuf `bytes` fields and RocksDB keys.
std::string make_string(const bytes_view_t& bytes);

/// Parse a 20-byte address from hex, with or without a 0x prefix.
std::optional<address_t> try_make_address(std::string_view hex);

/// Parse a decimal amount; std::nullopt on non-digits or overflow.
std::optional<amount_t> try_make_amount(std::string_view decimal);

/// Lower-case hex without prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Accepts an optional 0x prefix and either case.
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Lower-case, 0x-prefixed rendering used in logs and event attributes.
std::string to_string(const address_t& address);
std::string to_string(const amount_t& amount);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace remit::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
