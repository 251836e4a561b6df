#pragma once
#include <remit/schema/payment_intent.hpp>

namespace remit::schema {

template <uint16_t Version>
struct settle_payment;

template <>
struct settle_payment<1> final {
  uint16_t version{1};
  payment_intent_t intent{};
};

using settle_payment_t = settle_payment<1>;

}  // namespace remit::schema
