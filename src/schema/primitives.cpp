#include <openssl/crypto.h>
#include <remit/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>

namespace remit::schema {

namespace {

/// Widest decimal string that can still fit in 256 bits.
constexpr auto kMaxAmountDigits = std::size_t{78};

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::optional<address_t> try_make_address(const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != address_t{}.size()) {
    return std::nullopt;
  }
  auto address = address_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(address));
  return address;
}

std::optional<amount_t> try_make_amount(const std::string_view decimal) {
  if (decimal.empty() || decimal.size() > kMaxAmountDigits) {
    return std::nullopt;
  }
  auto value = boost::multiprecision::uint512_t{};
  for (const auto c : decimal) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return std::nullopt;
    }
    value = (value * 10) + static_cast<unsigned>(c - '0');
  }
  if (value > boost::multiprecision::uint512_t{
                  std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

std::string to_hex(const bytes_view_t& bytes) {
  if (bytes.empty()) {
    return {};
  }
  // OpenSSL writes upper-case digits plus a terminating NUL.
  auto out = std::string(bytes.size() * 2 + 1, '\0');
  auto written = std::size_t{};
  if (OPENSSL_buf2hexstr_ex(out.data(), out.size(), &written, bytes.data(),
                            bytes.size(), '\0') != 1) {
    return {};
  }
  out.resize(bytes.size() * 2);
  std::transform(std::begin(out), std::end(out), std::begin(out),
                 [](const char c) {
                   return static_cast<char>(
                       std::tolower(static_cast<unsigned char>(c)));
                 });
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if (hex.empty()) {
    return bytes_t{};
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }
  auto text = std::string{hex};
  auto out = bytes_t(text.size() / 2);
  auto written = std::size_t{};
  if (OPENSSL_hexstr2buf_ex(out.data(), out.size(), &written, text.c_str(),
                            '\0') != 1) {
    return std::nullopt;
  }
  out.resize(written);
  return out;
}

std::string to_string(const address_t& address) {
  return "0x" + to_hex(bytes_view_t{address.data(), address.size()});
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace remit::schema
