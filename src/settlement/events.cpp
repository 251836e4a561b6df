#include <remit/settlement/events.hpp>

#include <string>

namespace remit::settlement::events {

remit::schema::transaction_event_t payment_success(
    const payment_success_t& payment) {
  return remit::schema::transaction_event_t{
      .type = "PaymentSuccess",
      .attributes = {
          {.key = "recipient",
           .value = remit::schema::to_string(payment.recipient),
           .index = true},
          {.key = "amount",
           .value = remit::schema::to_string(payment.net_amount)},
          {.key = "receipt_token",
           .value = remit::schema::to_string(payment.receipt_token),
           .index = true},
          {.key = "receipt_amount",
           .value = remit::schema::to_string(payment.receipt_amount)},
          {.key = "fee", .value = remit::schema::to_string(payment.fee_amount)},
          {.key = "payer",
           .value = remit::schema::to_string(payment.payer),
           .index = true},
          {.key = "funding_path",
           .value = std::string{remit::schema::to_string(payment.funding_path)}},
          {.key = "intent_digest",
           .value = remit::schema::to_hex(remit::schema::bytes_view_t{
               payment.intent_digest.data(), payment.intent_digest.size()})}}};
}

remit::schema::transaction_event_t fee_changed(
    const remit::schema::basis_points_t rate) {
  return remit::schema::transaction_event_t{
      .type = "FeeChanged",
      .attributes = {{.key = "rate", .value = std::to_string(rate)}}};
}

remit::schema::transaction_event_t special_fee_changed(
    const remit::schema::address_t& account,
    const remit::schema::basis_points_t rate) {
  return remit::schema::transaction_event_t{
      .type = "SpecialFeeChanged",
      .attributes = {{.key = "account",
                      .value = remit::schema::to_string(account),
                      .index = true},
                     {.key = "rate", .value = std::to_string(rate)}}};
}

remit::schema::transaction_event_t fee_receiver_changed(
    const remit::schema::address_t& fee_receiver) {
  return remit::schema::transaction_event_t{
      .type = "FeeReceiverChanged",
      .attributes = {{.key = "fee_receiver",
                      .value = remit::schema::to_string(fee_receiver),
                      .index = true}}};
}

remit::schema::transaction_event_t paused(
    const remit::schema::address_t& account) {
  return remit::schema::transaction_event_t{
      .type = "Paused",
      .attributes = {
          {.key = "account", .value = remit::schema::to_string(account)}}};
}

remit::schema::transaction_event_t unpaused(
    const remit::schema::address_t& account) {
  return remit::schema::transaction_event_t{
      .type = "Unpaused",
      .attributes = {
          {.key = "account", .value = remit::schema::to_string(account)}}};
}

remit::schema::transaction_event_t ownership_transferred(
    const remit::schema::address_t& previous_owner,
    const remit::schema::address_t& new_owner) {
  return remit::schema::transaction_event_t{
      .type = "OwnershipTransferred",
      .attributes = {{.key = "previous_owner",
                      .value = remit::schema::to_string(previous_owner),
                      .index = true},
                     {.key = "new_owner",
                      .value = remit::schema::to_string(new_owner),
                      .index = true}}};
}

}  // namespace remit::settlement::events
