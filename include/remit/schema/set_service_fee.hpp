#pragma once
#include <remit/schema/primitives.hpp>

namespace remit::schema {

template <uint16_t Version>
struct set_service_fee;

template <>
struct set_service_fee<1> final {
  uint16_t version{1};
  basis_points_t rate{};
};

using set_service_fee_t = set_service_fee<1>;

}  // namespace remit::schema
