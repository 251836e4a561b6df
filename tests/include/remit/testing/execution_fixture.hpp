#pragma once

#include <gtest/gtest.h>

#include <remit/execution/engine.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/storage/rocksdb/storage.hpp>
#include <remit/testing/common.hpp>
#include <remit/testing/settlement_fixture.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace remit::testing {

using rocksdb_storage_t =
    remit::storage::storage<remit::storage::rocksdb_storage_tag>;

inline remit::schema::bytes_t encode_transaction(
    const remit::schema::transaction_t& tx) {
  return scale_encoder_t{}.encode(tx);
}

/// Execution engine over a settlement world and a scratch RocksDB
/// directory. `reopen()` rebuilds everything over the same directory, the
/// way a restarted node would.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false)
      : db_path_{make_db_path(db_prefix)}, strict_crypto_{strict_crypto} {
    open();
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;

  ~execution_fixture() {
    close();
    remove_path(db_path_);
  }

  void reopen() {
    close();
    open();
  }

  settlement_world& world() { return *world_; }
  remit::execution::engine& engine() { return *engine_; }
  scale_encoder_t& encoder() { return encoder_; }

  /// Owner of the settlement engine: the address of `owner_signer()`.
  static remit::schema::signer_id_t owner_signer() {
    return make_ed25519_signer(0x11);
  }

  static remit::schema::signer_id_t payer_signer() {
    return make_ed25519_signer(0x33);
  }

  remit::schema::transaction_t make_transaction(
      const remit::schema::signer_id_t& signer,
      const remit::schema::transaction_payload_t& payload,
      const remit::schema::amount_t& value = 0) {
    return remit::schema::transaction_t{
        .version = 1,
        .chain_id = engine_->chain_id(),
        .nonce = engine_->next_nonce(address_of(signer)),
        .signer = signer,
        .value = value,
        .payload = payload,
        .signature = remit::schema::ed25519_signature_t{}};
  }

  /// Finalize a single transaction in its own block and commit it.
  remit::schema::transaction_result_t execute(
      const remit::schema::transaction_t& tx) {
    ++height_;
    auto block = engine_->finalize_block(height_, kGenesisTime + height_,
                                         {encode_transaction(tx)});
    EXPECT_EQ(block.tx_results.size(), 1u);
    (void)engine_->commit();
    return block.tx_results.front();
  }

  template <typename T>
  T query(const std::string_view path, const remit::schema::bytes_t& key) {
    auto result =
        engine_->query(path, remit::schema::make_bytes_view(key));
    EXPECT_EQ(result.code, 0u) << result.log;
    return encoder_.decode<T>(remit::schema::make_bytes_view(result.value));
  }

  uint64_t height() const { return height_; }

 private:
  void open() {
    world_ = std::make_unique<settlement_world>(
        address_of(owner_signer()));
    world_->host().credit_native(address_of(payer_signer()), 100000);
    world_->host().state().discard_journal();
    storage_.emplace(
        remit::storage::make_storage<remit::storage::rocksdb_storage_tag>(
            db_path_));
    engine_ = std::make_unique<remit::execution::engine>(
        encoder_, *storage_, world_->host(), world_->engine(), strict_crypto_);
    height_ = static_cast<uint64_t>(engine_->info().last_block_height);
  }

  void close() {
    engine_.reset();
    storage_.reset();
    world_.reset();
  }

  std::string db_path_;
  bool strict_crypto_{};
  scale_encoder_t encoder_;
  std::unique_ptr<settlement_world> world_;
  std::optional<rocksdb_storage_t> storage_;
  std::unique_ptr<remit::execution::engine> engine_;
  uint64_t height_{};
};

}  // namespace remit::testing
