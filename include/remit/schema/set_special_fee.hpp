#pragma once
#include <remit/schema/primitives.hpp>

// Schema type: set special fee.
// Governance workflow: per-payee fee override. A zero rate is treated as
// "no override" when fees are resolved.
namespace remit::schema {

template <uint16_t Version>
struct set_special_fee;

template <>
struct set_special_fee<1> final {
  uint16_t version{1};
  address_t account{};
  basis_points_t rate{};
};

using set_special_fee_t = set_special_fee<1>;

}  // namespace remit::schema
