#pragma once
#include <guardrail/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace guardrail::storage {

using key_value_entry_t =
    std::pair<guardrail::schema::bytes_t, guardrail::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const guardrail::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const guardrail::schema::bytes_view_t& key,
           const T& value) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const guardrail::schema::bytes_view_t& prefix) const;

  /// Return at most `limit` pairs under prefix, starting at `start` inclusive.
  std::vector<key_value_entry_t> list_range(
      const guardrail::schema::bytes_view_t& prefix,
      const guardrail::schema::bytes_view_t& start,
      std::size_t limit) const;

  /// Write all entries in one atomic batch.
  void commit(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace guardrail::storage
