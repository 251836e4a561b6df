#pragma once
#include <remit/ledger/call.hpp>
#include <remit/ledger/contract.hpp>
#include <remit/ledger/state.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transaction_event.hpp>
#include <map>
#include <memory>
#include <string>

namespace remit::ledger {

/// In-process runtime the settlement engine and its collaborators execute
/// on. It owns the world state and the contract registry and provides
/// low-level calls with all-or-nothing rollback.
class host final {
 public:
  /// Register `code` at `address`. Fails when the address already has code.
  void deploy(const remit::schema::address_t& address,
              std::shared_ptr<contract> code);
  bool has_code(const remit::schema::address_t& address) const;
  std::shared_ptr<contract> code_at(const remit::schema::address_t& address) const;

  /// Typed view of the contract at `address`; reverts when the address has
  /// no code or the code does not implement `T`.
  template <typename T>
  T& resolve(const remit::schema::address_t& address) const;

  /// Low-level call. Moves `value` from caller to target, then runs the
  /// target's `on_call` when it has code. Never throws for a callee failure:
  /// effects are rolled back and the result reports `success == false`.
  call_result call(const remit::schema::address_t& caller,
                   const remit::schema::address_t& target,
                   const remit::schema::amount_t& value,
                   const remit::schema::bytes_view_t& data);

  /// Move native currency; reverts with "insufficient native balance" or
  /// "native balance overflow".
  void transfer_native(const remit::schema::address_t& from,
                       const remit::schema::address_t& to,
                       const remit::schema::amount_t& amount);

  /// Create native currency out of nothing (genesis and tests); reverts on
  /// overflow.
  void credit_native(const remit::schema::address_t& account,
                     const remit::schema::amount_t& amount);

  void emit(remit::schema::transaction_event_t event);
  remit::schema::timestamp_seconds_t now() const;
  void set_time(remit::schema::timestamp_seconds_t time);

  ledger::state& state();
  const ledger::state& state() const;

 private:
  ledger::state state_;
  std::map<remit::schema::address_t, std::shared_ptr<contract>> contracts_;
};

template <typename T>
T& host::resolve(const remit::schema::address_t& address) const {
  auto code = code_at(address);
  auto* typed = dynamic_cast<T*>(code.get());
  if (typed == nullptr) {
    throw execution_reverted{"no compatible contract at " +
                             remit::schema::to_string(address)};
  }
  return *typed;
}

}  // namespace remit::ledger
