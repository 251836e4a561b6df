#pragma once
#include <remit/schema/ledger_snapshot.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transaction_event.hpp>
#include <cstddef>
#include <map>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

namespace remit::ledger {

/// Position in the undo journal and event log returned by `checkpoint()`.
struct checkpoint_t final {
  std::size_t journal{};
  std::size_t events{};
};

/// Balances, allowances and signature-transfer nonce words of every account.
///
/// Each mutation records the previous value so that a failed call can be
/// rolled back with `revert_to`. Zero entries are erased so the flattened
/// snapshot (and therefore the state root) is canonical.
class state final {
 public:
  remit::schema::amount_t native_balance(
      const remit::schema::address_t& account) const;
  void set_native_balance(const remit::schema::address_t& account,
                          const remit::schema::amount_t& amount);

  remit::schema::amount_t token_balance(
      const remit::schema::address_t& token,
      const remit::schema::address_t& account) const;
  void set_token_balance(const remit::schema::address_t& token,
                         const remit::schema::address_t& account,
                         const remit::schema::amount_t& amount);

  remit::schema::amount_t token_supply(
      const remit::schema::address_t& token) const;
  void set_token_supply(const remit::schema::address_t& token,
                        const remit::schema::amount_t& amount);

  remit::schema::amount_t allowance(
      const remit::schema::address_t& token,
      const remit::schema::address_t& owner,
      const remit::schema::address_t& spender) const;
  void set_allowance(const remit::schema::address_t& token,
                     const remit::schema::address_t& owner,
                     const remit::schema::address_t& spender,
                     const remit::schema::amount_t& amount);

  remit::schema::amount_t nonce_word(
      const remit::schema::address_t& owner,
      const remit::schema::amount_t& word_position) const;
  void set_nonce_word(const remit::schema::address_t& owner,
                      const remit::schema::amount_t& word_position,
                      const remit::schema::amount_t& word);

  remit::schema::timestamp_seconds_t time() const;
  void set_time(remit::schema::timestamp_seconds_t time);

  void emit(remit::schema::transaction_event_t event);
  const std::vector<remit::schema::transaction_event_t>& events() const;
  std::vector<remit::schema::transaction_event_t> take_events();

  checkpoint_t checkpoint() const;
  void revert_to(const checkpoint_t& checkpoint);
  void discard_journal();

  remit::schema::ledger_snapshot_t snapshot() const;
  void restore(const remit::schema::ledger_snapshot_t& snapshot);

 private:
  using native_key_t = remit::schema::address_t;
  using token_key_t =
      std::pair<remit::schema::address_t, remit::schema::address_t>;
  using allowance_key_t = std::tuple<remit::schema::address_t,
                                     remit::schema::address_t,
                                     remit::schema::address_t>;
  using nonce_key_t =
      std::pair<remit::schema::address_t, remit::schema::amount_t>;

  template <typename Key>
  struct undo_entry final {
    Key key;
    remit::schema::amount_t previous;
  };

  struct native_undo final {
    undo_entry<native_key_t> entry;
  };
  struct token_undo final {
    undo_entry<token_key_t> entry;
  };
  struct supply_undo final {
    undo_entry<native_key_t> entry;
  };
  struct allowance_undo final {
    undo_entry<allowance_key_t> entry;
  };
  struct nonce_undo final {
    undo_entry<nonce_key_t> entry;
  };

  using journal_entry_t = std::
      variant<native_undo, token_undo, supply_undo, allowance_undo, nonce_undo>;

  template <typename Map>
  static remit::schema::amount_t read(const Map& map,
                                      const typename Map::key_type& key);
  template <typename Map>
  static remit::schema::amount_t write(Map& map,
                                       const typename Map::key_type& key,
                                       const remit::schema::amount_t& amount);

  std::map<native_key_t, remit::schema::amount_t> native_balances_;
  std::map<token_key_t, remit::schema::amount_t> token_balances_;
  std::map<native_key_t, remit::schema::amount_t> token_supplies_;
  std::map<allowance_key_t, remit::schema::amount_t> allowances_;
  std::map<nonce_key_t, remit::schema::amount_t> nonce_words_;
  remit::schema::timestamp_seconds_t time_{};
  std::vector<journal_entry_t> journal_;
  std::vector<remit::schema::transaction_event_t> events_;
};

}  // namespace remit::ledger
