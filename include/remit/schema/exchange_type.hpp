#pragma once

#include <remit/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: exchange type.
// Settlement workflow: discriminator selecting whether acquired funds are
// routed through an external exchange before payout.
namespace remit::schema {

enum class exchange_type_t : uint8_t {
  none = 0,
  exchange = 1,
};

inline constexpr auto kExchangeTypeMappings = std::array{
    std::pair<std::string_view, exchange_type_t>{"none", exchange_type_t::none},
    std::pair<std::string_view, exchange_type_t>{"exchange",
                                                 exchange_type_t::exchange},
};

template <>
inline std::optional<exchange_type_t> try_from_string<exchange_type_t>(
    const std::string_view value) {
  return from_string(value, kExchangeTypeMappings);
}

inline constexpr std::string_view to_string(const exchange_type_t value) {
  return to_string(value, kExchangeTypeMappings).value_or("unknown");
}

}  // namespace remit::schema
