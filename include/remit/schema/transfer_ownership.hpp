#pragma once
#include <remit/schema/primitives.hpp>

namespace remit::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  address_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

template <uint16_t Version>
struct renounce_ownership;

template <>
struct renounce_ownership<1> final {
  uint16_t version{1};
};

using renounce_ownership_t = renounce_ownership<1>;

}  // namespace remit::schema
