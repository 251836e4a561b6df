#pragma once
#include <remit/schema/pause.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/set_fee_receiver.hpp>
#include <remit/schema/set_service_fee.hpp>
#include <remit/schema/set_special_fee.hpp>
#include <remit/schema/settle_payment.hpp>
#include <remit/schema/transfer_ownership.hpp>
#include <variant>

namespace remit::schema {

using transaction_payload_t = std::variant<settle_payment_t,
                                           set_service_fee_t,
                                           set_special_fee_t,
                                           set_fee_receiver_t,
                                           pause_t,
                                           unpause_t,
                                           transfer_ownership_t,
                                           renounce_ownership_t>;

template <uint16_t Version>
struct transaction;

/// Signed envelope submitted to the execution engine. `value` is the native
/// amount attached to the call; only `settle_payment` accepts a non-zero
/// value.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  amount_t value{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace remit::schema
