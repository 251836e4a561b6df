#pragma once

#include <remit/schema/primitives.hpp>
#include <tuple>
#include <vector>

// Schema type: settlement config.
// Governance workflow: owner, circuit-breaker flag and fee configuration of
// the settlement engine. Written only by governance operations; persisted at
// commit and restored on startup.
namespace remit::schema {

template <uint16_t Version>
struct settlement_config;

template <>
struct settlement_config<1> final {
  uint16_t version{1};
  address_t owner{};
  bool paused{};
  basis_points_t standard_fee_bps{};
  address_t fee_receiver{};
  std::vector<std::tuple<address_t, basis_points_t>> special_fees;
};

using settlement_config_t = settlement_config<1>;

}  // namespace remit::schema
