#pragma once

#include <remit/execution/signature_verifier.hpp>
#include <remit/ledger/host.hpp>
#include <remit/schema/app_info.hpp>
#include <remit/schema/block_result.hpp>
#include <remit/schema/commit_result.hpp>
#include <remit/schema/encoding/encoder.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/query_result.hpp>
#include <remit/schema/transaction.hpp>
#include <remit/schema/transaction_result.hpp>
#include <remit/settlement/payment_engine.hpp>
#include <remit/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace remit::execution {

inline constexpr auto kChainIdSeed = std::string_view{"remit-settlement-chain"};

/// Deterministic transaction processor in front of the settlement engine.
///
/// The engine validates signed envelopes, runs each payload against the
/// ledger host with all-or-nothing rollback, persists ledger and governance
/// state on commit, and serves read-only queries.
class engine final {
 public:
  /// Construct the engine over an already wired host and settlement engine.
  ///
  /// Persisted state (ledger, governance, nonces, committed height) replaces
  /// whatever genesis state the host carries. `require_strict_crypto`
  /// enables real signature verification; when false the installed verifier
  /// callback decides (accept-all by default).
  explicit engine(
      remit::schema::encoding::encoder<
          remit::schema::encoding::scale_encoder_tag>& encoder,
      remit::storage::storage<remit::storage::rocksdb_storage_tag>& storage,
      ledger::host& host,
      settlement::payment_engine& settlement,
      bool require_strict_crypto = true);

  /// Admit a transaction for inclusion (CheckTx semantics). Decodes and
  /// validates only; does not mutate state.
  remit::schema::transaction_result_t check_transaction(
      const remit::schema::bytes_view_t& raw_tx);

  /// Execute a block of transactions in order at `block_time` (seconds).
  ///
  /// Per-transaction results are returned even on failures; a failed
  /// transaction leaves no effect except its consumed nonce.
  remit::schema::block_result_t finalize_block(
      uint64_t height,
      remit::schema::timestamp_seconds_t block_time,
      const std::vector<remit::schema::bytes_t>& txs);

  /// Persist the finalized block: height, state root, ledger, governance
  /// configuration and signer nonces.
  remit::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state root).
  remit::schema::app_info_t info() const;

  /// Execute a read-path query by route.
  remit::schema::query_result_t query(std::string_view path,
                                      const remit::schema::bytes_view_t& data);

  /// Install runtime signature verifier callback.
  ///
  /// Ignored unless signature checking was disabled at construction.
  void set_signature_verifier(signature_verifier_t verifier);

  const remit::schema::hash32_t& chain_id() const;

  /// Next nonce `account` must use.
  uint64_t next_nonce(const remit::schema::address_t& account) const;

 private:
  /// Execute a validated payload on behalf of `sender`.
  remit::schema::transaction_result_t execute_operation(
      const remit::schema::transaction_t& tx,
      const remit::schema::address_t& sender);

  /// Validate envelope, chain id, nonce and signature.
  remit::schema::transaction_result_t validate_transaction(
      const remit::schema::transaction_t& tx,
      const remit::schema::address_t& sender,
      std::string_view codespace) const;

  /// Load committed state from storage at startup.
  void load_persisted_state();

  mutable std::mutex mutex_;
  remit::schema::encoding::encoder<remit::schema::encoding::scale_encoder_tag>&
      encoder_;
  remit::storage::storage<remit::storage::rocksdb_storage_tag>& storage_;
  ledger::host& host_;
  settlement::payment_engine& settlement_;
  int64_t last_committed_height_{};
  remit::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  remit::schema::hash32_t pending_state_root_{};
  remit::schema::hash32_t chain_id_{};
  std::map<remit::schema::address_t, uint64_t> nonces_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace remit::execution
