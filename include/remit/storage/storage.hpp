#pragma once
#include <remit/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace remit::storage {

using key_value_entry_t =
    std::pair<remit::schema::bytes_t, remit::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  remit::schema::hash32_t state_root;
};

/// Keyspace under `prefix` rewritten to exactly `entries`.
struct prefix_replacement final {
  remit::schema::bytes_t prefix;
  std::vector<key_value_entry_t> entries;
};

/// Writes that `commit_batch` applies as one unit.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<prefix_replacement> replacements;
  std::optional<committed_state> committed;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const remit::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const remit::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const remit::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const remit::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;

  /// Apply every write in `writes` atomically; a crash leaves either all of
  /// them or none.
  void commit_batch(const write_set& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace remit::storage
