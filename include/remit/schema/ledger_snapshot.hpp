#pragma once

#include <remit/schema/primitives.hpp>
#include <tuple>
#include <vector>

// Schema type: ledger snapshot.
// Host workflow: flattened world state (native balances, token balances,
// supplies, allowances, signature-transfer nonce words) persisted at commit.
namespace remit::schema {

template <uint16_t Version>
struct ledger_snapshot;

template <>
struct ledger_snapshot<1> final {
  uint16_t version{1};
  timestamp_seconds_t time{};
  std::vector<std::tuple<address_t, amount_t>> native_balances;
  std::vector<std::tuple<address_t, address_t, amount_t>> token_balances;
  std::vector<std::tuple<address_t, amount_t>> token_supplies;
  std::vector<std::tuple<address_t, address_t, address_t, amount_t>>
      allowances;
  std::vector<std::tuple<address_t, amount_t, amount_t>> nonce_words;
};

using ledger_snapshot_t = ledger_snapshot<1>;

}  // namespace remit::schema
