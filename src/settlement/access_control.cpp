#include <spdlog/spdlog.h>
#include <remit/settlement/access_control.hpp>
#include <remit/settlement/events.hpp>
#include <remit/settlement/settlement_error.hpp>

namespace remit::settlement {

access_control::access_control(ledger::host& host,
                               const remit::schema::address_t& initial_owner)
    : host_{host}, owner_{initial_owner} {
  if (remit::schema::is_zero(initial_owner)) {
    throw settlement_error{remit::schema::transaction_error_code::invalid_owner,
                           "owner must not be the zero address"};
  }
}

const remit::schema::address_t& access_control::owner() const {
  return owner_;
}

void access_control::require_owner(
    const remit::schema::address_t& account) const {
  if (remit::schema::is_zero(owner_) || account != owner_) {
    throw settlement_error{
        remit::schema::transaction_error_code::unauthorized_account,
        remit::schema::to_string(account)};
  }
}

void access_control::transfer_ownership(
    const remit::schema::address_t& caller,
    const remit::schema::address_t& new_owner) {
  require_owner(caller);
  if (remit::schema::is_zero(new_owner)) {
    throw settlement_error{remit::schema::transaction_error_code::invalid_owner,
                           "new owner must not be the zero address"};
  }
  set_owner(new_owner);
}

void access_control::renounce_ownership(
    const remit::schema::address_t& caller) {
  require_owner(caller);
  set_owner(remit::schema::kZeroAddress);
}

void access_control::restore(const remit::schema::address_t& owner) {
  owner_ = owner;
}

void access_control::set_owner(const remit::schema::address_t& new_owner) {
  auto previous = owner_;
  owner_ = new_owner;
  spdlog::info("ownership transferred from {} to {}",
               remit::schema::to_string(previous),
               remit::schema::to_string(new_owner));
  host_.emit(events::ownership_transferred(previous, new_owner));
}

}  // namespace remit::settlement
