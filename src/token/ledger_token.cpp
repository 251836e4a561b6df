#include <remit/token/ledger_token.hpp>

#include <limits>
#include <utility>

namespace remit::token {

ledger_token::ledger_token(ledger::host& host,
                           const remit::schema::address_t& self,
                           std::string symbol)
    : host_{host}, self_{self}, symbol_{std::move(symbol)} {}

const remit::schema::address_t& ledger_token::address() const {
  return self_;
}

const std::string& ledger_token::symbol() const {
  return symbol_;
}

remit::schema::amount_t ledger_token::total_supply() const {
  return host_.state().token_supply(self_);
}

remit::schema::amount_t ledger_token::balance_of(
    const remit::schema::address_t& account) const {
  return host_.state().token_balance(self_, account);
}

remit::schema::amount_t ledger_token::allowance(
    const remit::schema::address_t& owner,
    const remit::schema::address_t& spender) const {
  return host_.state().allowance(self_, owner, spender);
}

void ledger_token::transfer(const remit::schema::address_t& sender,
                            const remit::schema::address_t& to,
                            const remit::schema::amount_t& amount) {
  move(sender, to, amount);
}

void ledger_token::transfer_from(const remit::schema::address_t& spender,
                                 const remit::schema::address_t& from,
                                 const remit::schema::address_t& to,
                                 const remit::schema::amount_t& amount) {
  spend_allowance(from, spender, amount);
  move(from, to, amount);
}

void ledger_token::approve(const remit::schema::address_t& owner,
                           const remit::schema::address_t& spender,
                           const remit::schema::amount_t& amount) {
  if (remit::schema::is_zero(spender)) {
    throw ledger::execution_reverted{"invalid spender"};
  }
  host_.state().set_allowance(self_, owner, spender, amount);
  host_.emit(remit::schema::transaction_event_t{
      .type = "Approval",
      .attributes = {
          {.key = "token", .value = remit::schema::to_string(self_)},
          {.key = "owner",
           .value = remit::schema::to_string(owner),
           .index = true},
          {.key = "spender",
           .value = remit::schema::to_string(spender),
           .index = true},
          {.key = "value", .value = remit::schema::to_string(amount)}}});
}

void ledger_token::increase_allowance(const remit::schema::address_t& owner,
                                      const remit::schema::address_t& spender,
                                      const remit::schema::amount_t& added) {
  auto current = allowance(owner, spender);
  if (added > std::numeric_limits<remit::schema::amount_t>::max() - current) {
    throw ledger::execution_reverted{"allowance overflow"};
  }
  approve(owner, spender, current + added);
}

void ledger_token::mint(const remit::schema::address_t& to,
                        const remit::schema::amount_t& amount) {
  if (remit::schema::is_zero(to)) {
    throw ledger::execution_reverted{"invalid receiver"};
  }
  auto& state = host_.state();
  auto supply = state.token_supply(self_);
  if (amount > std::numeric_limits<remit::schema::amount_t>::max() - supply) {
    throw ledger::execution_reverted{"supply overflow"};
  }
  state.set_token_supply(self_, supply + amount);
  state.set_token_balance(self_, to, state.token_balance(self_, to) + amount);
  emit_transfer(remit::schema::kZeroAddress, to, amount);
}

void ledger_token::burn(const remit::schema::address_t& from,
                        const remit::schema::amount_t& amount) {
  auto& state = host_.state();
  auto balance = state.token_balance(self_, from);
  if (balance < amount) {
    throw ledger::execution_reverted{"insufficient balance"};
  }
  state.set_token_balance(self_, from, balance - amount);
  state.set_token_supply(self_, state.token_supply(self_) - amount);
  emit_transfer(from, remit::schema::kZeroAddress, amount);
}

void ledger_token::move(const remit::schema::address_t& from,
                        const remit::schema::address_t& to,
                        const remit::schema::amount_t& amount) {
  if (remit::schema::is_zero(to)) {
    throw ledger::execution_reverted{"invalid receiver"};
  }
  auto& state = host_.state();
  auto from_balance = state.token_balance(self_, from);
  if (from_balance < amount) {
    throw ledger::execution_reverted{"insufficient balance"};
  }
  if (from != to) {
    state.set_token_balance(self_, from, from_balance - amount);
    state.set_token_balance(self_, to, state.token_balance(self_, to) + amount);
  }
  emit_transfer(from, to, amount);
}

void ledger_token::spend_allowance(const remit::schema::address_t& owner,
                                   const remit::schema::address_t& spender,
                                   const remit::schema::amount_t& amount) {
  auto current = allowance(owner, spender);
  if (current == std::numeric_limits<remit::schema::amount_t>::max()) {
    return;
  }
  if (current < amount) {
    throw ledger::execution_reverted{"insufficient allowance"};
  }
  host_.state().set_allowance(self_, owner, spender, current - amount);
}

void ledger_token::emit_transfer(const remit::schema::address_t& from,
                                 const remit::schema::address_t& to,
                                 const remit::schema::amount_t& amount) {
  host_.emit(remit::schema::transaction_event_t{
      .type = "Transfer",
      .attributes = {
          {.key = "token", .value = remit::schema::to_string(self_)},
          {.key = "from", .value = remit::schema::to_string(from), .index = true},
          {.key = "to", .value = remit::schema::to_string(to), .index = true},
          {.key = "value", .value = remit::schema::to_string(amount)}}});
}

}  // namespace remit::token
