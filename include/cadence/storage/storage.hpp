#pragma once
#include <cadence/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace cadence::storage {

using key_value_entry_t =
    std::pair<cadence::schema::bytes_t, cadence::schema::bytes_t>;

/// Last durable checkpoint: length of the event stream and the state root
/// folded over it.
struct committed_state final {
  uint64_t event_count{};
  cadence::schema::hash32_t state_root{};
};

/// Rows touched by one top-level vault invocation, written atomically.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<cadence::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cadence::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cadence::schema::bytes_view_t& key,
           const T& value) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const cadence::schema::bytes_view_t& prefix) const;

  /// Atomically apply a write set together with the new checkpoint.
  void commit(const write_set& writes, const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace cadence::storage
