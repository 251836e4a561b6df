#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <remit/common/critical.hpp>
#include <remit/schema/encoding/scale/encoder.hpp>
#include <remit/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace remit::storage {

namespace detail {

using encoder_t =
    remit::schema::encoding::encoder<remit::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline remit::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const remit::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline remit::schema::bytes_t encode_committed_state(
    const committed_state& state) {
  auto encoder = encoder_t{};
  return encoder.encode(std::tuple{state.height, state.state_root});
}

/// Stage deletes for every key under `prefix` followed by puts for `entries`.
inline void stage_prefix_replacement(
    ROCKSDB_NAMESPACE::DB& database,
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const remit::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) {
  auto prefix_string = remit::schema::make_string(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      remit::common::critical("failed deleting key during prefix replacement");
    }
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    remit::common::critical("failed to scan prefix for replacement");
  }

  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(to_slice(remit::schema::make_bytes_view(key)),
                                to_slice(remit::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      remit::common::critical("failed writing key during prefix replacement");
    }
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const remit::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const remit::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const remit::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const remit::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
  void commit_batch(const write_set& writes) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const remit::schema::bytes_view_t& key) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    remit::common::critical("Failed to get value from RocksDB");
  }
  return {encoder.template decode<T>(remit::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const remit::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(remit::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    remit::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }
  auto committed_raw = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    remit::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, remit::schema::hash32_t>>(
          remit::schema::make_bytes_view(committed_raw));
  if (!decoded.has_value()) {
    remit::common::critical("failed to decode committed state");
  }
  auto state = committed_state{};
  state.height = std::get<0>(decoded.value());
  state.state_root = std::get<1>(decoded.value());
  return state;
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }
  auto encoded = detail::encode_committed_state(state);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{},
      std::string{detail::kCommittedStateKey},
      detail::to_slice(remit::schema::make_bytes_view(encoded)));
  if (!status.ok()) {
    remit::common::critical("failed to persist committed state");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const remit::schema::bytes_view_t& prefix) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = remit::schema::make_string(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    remit::common::critical("failed to list keys by prefix");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::replace_by_prefix(
    const remit::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::stage_prefix_replacement(*database, batch, prefix, entries);
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    remit::common::critical("failed to commit prefix replacement");
  }
}

inline void storage<rocksdb_storage_tag>::commit_batch(
    const write_set& writes) const {
  if (!database) {
    remit::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes.puts) {
    auto status =
        batch.Put(detail::to_slice(remit::schema::make_bytes_view(key)),
                  detail::to_slice(remit::schema::make_bytes_view(value)));
    if (!status.ok()) {
      remit::common::critical("failed staging key in commit batch");
    }
  }
  for (const auto& replacement : writes.replacements) {
    detail::stage_prefix_replacement(
        *database, batch, remit::schema::make_bytes_view(replacement.prefix),
        replacement.entries);
  }
  if (writes.committed) {
    auto encoded = detail::encode_committed_state(*writes.committed);
    auto status =
        batch.Put(std::string{detail::kCommittedStateKey},
                  detail::to_slice(remit::schema::make_bytes_view(encoded)));
    if (!status.ok()) {
      remit::common::critical("failed staging committed state");
    }
  }

  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  auto write_status = database->Write(options, &batch);
  if (!write_status.ok()) {
    spdlog::error("RocksDB batch write failed: {}", write_status.ToString());
    remit::common::critical("failed to write commit batch");
  }
  spdlog::debug("Wrote commit batch with {} entries", batch.Count());
}

}  // namespace remit::storage
