#pragma once
#include <remit/schema/primitives.hpp>

namespace remit::schema {

template <uint16_t Version>
struct set_fee_receiver;

template <>
struct set_fee_receiver<1> final {
  uint16_t version{1};
  address_t fee_receiver{};
};

using set_fee_receiver_t = set_fee_receiver<1>;

}  // namespace remit::schema
