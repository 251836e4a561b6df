#pragma once
#include <remit/schema/funding_path.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transaction_event.hpp>

// Event records emitted by the settlement engine and its governance surface.
namespace remit::settlement::events {

struct payment_success_t final {
  remit::schema::address_t recipient{};
  remit::schema::amount_t net_amount{};
  remit::schema::amount_t receipt_amount{};
  remit::schema::address_t receipt_token{};
  remit::schema::amount_t fee_amount{};
  remit::schema::address_t payer{};
  remit::schema::funding_path_t funding_path{};
  remit::schema::hash32_t intent_digest{};
};

remit::schema::transaction_event_t payment_success(
    const payment_success_t& payment);
remit::schema::transaction_event_t fee_changed(remit::schema::basis_points_t rate);
remit::schema::transaction_event_t special_fee_changed(
    const remit::schema::address_t& account,
    remit::schema::basis_points_t rate);
remit::schema::transaction_event_t fee_receiver_changed(
    const remit::schema::address_t& fee_receiver);
remit::schema::transaction_event_t paused(
    const remit::schema::address_t& account);
remit::schema::transaction_event_t unpaused(
    const remit::schema::address_t& account);
remit::schema::transaction_event_t ownership_transferred(
    const remit::schema::address_t& previous_owner,
    const remit::schema::address_t& new_owner);

}  // namespace remit::settlement::events
