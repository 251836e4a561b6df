#pragma once
#include <remit/schema/exchange_type.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/signature_transfer_data.hpp>

// Schema type: payment intent.
// Settlement workflow: caller-supplied description of one payment. The payer
// commits `amount_in` of `token_in`; the merchant is owed exactly
// `receipt_amount` of `receipt_token` before fees. Immutable for the duration
// of one settlement.
namespace remit::schema {

template <uint16_t Version>
struct payment_intent;

template <>
struct payment_intent<1> final {
  uint16_t version{1};
  amount_t amount_in{};
  amount_t receipt_amount{};
  timestamp_seconds_t deadline{};
  address_t token_in{};
  address_t receipt_token{};
  address_t exchange_address{};
  bytes_t exchange_call_data;
  exchange_type_t exchange_type{exchange_type_t::none};
  address_t payment_receiver{};
  bytes_t receiver_call_data;
  signature_transfer_data_t signature_transfer_data{};
};

using payment_intent_t = payment_intent<1>;

}  // namespace remit::schema
