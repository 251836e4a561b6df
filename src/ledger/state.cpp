#include <remit/ledger/state.hpp>

#include <iterator>

namespace remit::ledger {

template <typename Map>
remit::schema::amount_t state::read(const Map& map,
                                    const typename Map::key_type& key) {
  auto it = map.find(key);
  if (it == std::end(map)) {
    return {};
  }
  return it->second;
}

template <typename Map>
remit::schema::amount_t state::write(Map& map,
                                     const typename Map::key_type& key,
                                     const remit::schema::amount_t& amount) {
  auto previous = read(map, key);
  if (amount == 0) {
    map.erase(key);
  } else {
    map.insert_or_assign(key, amount);
  }
  return previous;
}

remit::schema::amount_t state::native_balance(
    const remit::schema::address_t& account) const {
  return read(native_balances_, account);
}

void state::set_native_balance(const remit::schema::address_t& account,
                               const remit::schema::amount_t& amount) {
  auto previous = write(native_balances_, account, amount);
  journal_.push_back(native_undo{{account, previous}});
}

remit::schema::amount_t state::token_balance(
    const remit::schema::address_t& token,
    const remit::schema::address_t& account) const {
  return read(token_balances_, token_key_t{token, account});
}

void state::set_token_balance(const remit::schema::address_t& token,
                              const remit::schema::address_t& account,
                              const remit::schema::amount_t& amount) {
  auto key = token_key_t{token, account};
  auto previous = write(token_balances_, key, amount);
  journal_.push_back(token_undo{{key, previous}});
}

remit::schema::amount_t state::token_supply(
    const remit::schema::address_t& token) const {
  return read(token_supplies_, token);
}

void state::set_token_supply(const remit::schema::address_t& token,
                             const remit::schema::amount_t& amount) {
  auto previous = write(token_supplies_, token, amount);
  journal_.push_back(supply_undo{{token, previous}});
}

remit::schema::amount_t state::allowance(
    const remit::schema::address_t& token,
    const remit::schema::address_t& owner,
    const remit::schema::address_t& spender) const {
  return read(allowances_, allowance_key_t{token, owner, spender});
}

void state::set_allowance(const remit::schema::address_t& token,
                          const remit::schema::address_t& owner,
                          const remit::schema::address_t& spender,
                          const remit::schema::amount_t& amount) {
  auto key = allowance_key_t{token, owner, spender};
  auto previous = write(allowances_, key, amount);
  journal_.push_back(allowance_undo{{key, previous}});
}

remit::schema::amount_t state::nonce_word(
    const remit::schema::address_t& owner,
    const remit::schema::amount_t& word_position) const {
  return read(nonce_words_, nonce_key_t{owner, word_position});
}

void state::set_nonce_word(const remit::schema::address_t& owner,
                           const remit::schema::amount_t& word_position,
                           const remit::schema::amount_t& word) {
  auto key = nonce_key_t{owner, word_position};
  auto previous = write(nonce_words_, key, word);
  journal_.push_back(nonce_undo{{key, previous}});
}

remit::schema::timestamp_seconds_t state::time() const {
  return time_;
}

void state::set_time(const remit::schema::timestamp_seconds_t time) {
  time_ = time;
}

void state::emit(remit::schema::transaction_event_t event) {
  events_.push_back(std::move(event));
}

const std::vector<remit::schema::transaction_event_t>& state::events() const {
  return events_;
}

std::vector<remit::schema::transaction_event_t> state::take_events() {
  auto taken = std::move(events_);
  events_.clear();
  return taken;
}

checkpoint_t state::checkpoint() const {
  return checkpoint_t{journal_.size(), events_.size()};
}

void state::revert_to(const checkpoint_t& checkpoint) {
  while (journal_.size() > checkpoint.journal) {
    std::visit(
        overloaded{
            [&](const native_undo& undo) {
              write(native_balances_, undo.entry.key, undo.entry.previous);
            },
            [&](const token_undo& undo) {
              write(token_balances_, undo.entry.key, undo.entry.previous);
            },
            [&](const supply_undo& undo) {
              write(token_supplies_, undo.entry.key, undo.entry.previous);
            },
            [&](const allowance_undo& undo) {
              write(allowances_, undo.entry.key, undo.entry.previous);
            },
            [&](const nonce_undo& undo) {
              write(nonce_words_, undo.entry.key, undo.entry.previous);
            }},
        journal_.back());
    journal_.pop_back();
  }
  if (events_.size() > checkpoint.events) {
    events_.resize(checkpoint.events);
  }
}

void state::discard_journal() {
  journal_.clear();
}

remit::schema::ledger_snapshot_t state::snapshot() const {
  auto out = remit::schema::ledger_snapshot_t{};
  out.time = time_;
  for (const auto& [account, amount] : native_balances_) {
    out.native_balances.emplace_back(account, amount);
  }
  for (const auto& [key, amount] : token_balances_) {
    out.token_balances.emplace_back(key.first, key.second, amount);
  }
  for (const auto& [token, amount] : token_supplies_) {
    out.token_supplies.emplace_back(token, amount);
  }
  for (const auto& [key, amount] : allowances_) {
    out.allowances.emplace_back(std::get<0>(key), std::get<1>(key),
                                std::get<2>(key), amount);
  }
  for (const auto& [key, word] : nonce_words_) {
    out.nonce_words.emplace_back(key.first, key.second, word);
  }
  return out;
}

void state::restore(const remit::schema::ledger_snapshot_t& snapshot) {
  native_balances_.clear();
  token_balances_.clear();
  token_supplies_.clear();
  allowances_.clear();
  nonce_words_.clear();
  journal_.clear();
  events_.clear();
  time_ = snapshot.time;
  for (const auto& [account, amount] : snapshot.native_balances) {
    write(native_balances_, account, amount);
  }
  for (const auto& [token, account, amount] : snapshot.token_balances) {
    write(token_balances_, token_key_t{token, account}, amount);
  }
  for (const auto& [token, amount] : snapshot.token_supplies) {
    write(token_supplies_, token, amount);
  }
  for (const auto& [token, owner, spender, amount] : snapshot.allowances) {
    write(allowances_, allowance_key_t{token, owner, spender}, amount);
  }
  for (const auto& [owner, position, word] : snapshot.nonce_words) {
    write(nonce_words_, nonce_key_t{owner, position}, word);
  }
}

}  // namespace remit::ledger
