#pragma once

#include <remit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: funding path.
// Settlement workflow: the single mechanism used to pull the payer's funds
// into the engine for one intent.
namespace remit::schema {

enum class funding_path_t : uint8_t {
  native_wrap = 0,
  signature_transfer = 1,
  allowance_transfer = 2,
};

inline constexpr auto kFundingPathMappings = std::array{
    std::pair<std::string_view, funding_path_t>{"native_wrap",
                                                funding_path_t::native_wrap},
    std::pair<std::string_view, funding_path_t>{
        "signature_transfer", funding_path_t::signature_transfer},
    std::pair<std::string_view, funding_path_t>{
        "allowance_transfer", funding_path_t::allowance_transfer},
};

template <>
inline std::optional<funding_path_t> try_from_string<funding_path_t>(
    const std::string_view value) {
  return from_string(value, kFundingPathMappings);
}

inline constexpr std::string_view to_string(const funding_path_t value) {
  return to_string(value, kFundingPathMappings).value_or("unknown");
}

}  // namespace remit::schema
