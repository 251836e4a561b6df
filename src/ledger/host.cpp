#include <spdlog/spdlog.h>
#include <remit/ledger/host.hpp>

#include <iterator>
#include <limits>
#include <utility>

namespace remit::ledger {

namespace {

remit::schema::amount_t add_native(const remit::schema::amount_t& balance,
                                   const remit::schema::amount_t& amount) {
  if (amount > std::numeric_limits<remit::schema::amount_t>::max() - balance) {
    throw execution_reverted{"native balance overflow"};
  }
  return balance + amount;
}

}  // namespace

void host::deploy(const remit::schema::address_t& address,
                  std::shared_ptr<contract> code) {
  if (!code) {
    throw execution_reverted{"cannot deploy empty code"};
  }
  if (remit::schema::is_zero(address)) {
    throw execution_reverted{"cannot deploy to the zero address"};
  }
  auto [it, inserted] = contracts_.emplace(address, std::move(code));
  if (!inserted) {
    throw execution_reverted{"address " + remit::schema::to_string(address) +
                             " already has code"};
  }
  spdlog::debug("deployed contract at {}", remit::schema::to_string(address));
}

bool host::has_code(const remit::schema::address_t& address) const {
  return contracts_.contains(address);
}

std::shared_ptr<contract> host::code_at(
    const remit::schema::address_t& address) const {
  auto it = contracts_.find(address);
  if (it == std::end(contracts_)) {
    return nullptr;
  }
  return it->second;
}

call_result host::call(const remit::schema::address_t& caller,
                       const remit::schema::address_t& target,
                       const remit::schema::amount_t& value,
                       const remit::schema::bytes_view_t& data) {
  auto checkpoint = state_.checkpoint();
  try {
    if (value > 0) {
      transfer_native(caller, target, value);
    }
    auto result = call_result{.success = true};
    // Keep the callee alive even if it is replaced during the call.
    if (auto code = code_at(target)) {
      result.return_data =
          code->on_call(*this, call_context{caller, target, value}, data);
    }
    return result;
  } catch (const std::exception& e) {
    state_.revert_to(checkpoint);
    spdlog::debug("call {} -> {} reverted: {}",
                  remit::schema::to_string(caller),
                  remit::schema::to_string(target), e.what());
    return call_result{.success = false, .reason = e.what()};
  }
}

void host::transfer_native(const remit::schema::address_t& from,
                           const remit::schema::address_t& to,
                           const remit::schema::amount_t& amount) {
  auto from_balance = state_.native_balance(from);
  if (from_balance < amount) {
    throw execution_reverted{"insufficient native balance"};
  }
  if (from == to) {
    return;
  }
  auto to_balance = add_native(state_.native_balance(to), amount);
  state_.set_native_balance(from, from_balance - amount);
  state_.set_native_balance(to, to_balance);
}

void host::credit_native(const remit::schema::address_t& account,
                         const remit::schema::amount_t& amount) {
  state_.set_native_balance(account,
                            add_native(state_.native_balance(account), amount));
}

void host::emit(remit::schema::transaction_event_t event) {
  state_.emit(std::move(event));
}

remit::schema::timestamp_seconds_t host::now() const {
  return state_.time();
}

void host::set_time(const remit::schema::timestamp_seconds_t time) {
  state_.set_time(time);
}

ledger::state& host::state() {
  return state_;
}

const ledger::state& host::state() const {
  return state_;
}

}  // namespace remit::ledger
