#pragma once
#include <quorum/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace quorum::storage {

using key_value_entry_t =
    std::pair<quorum::schema::bytes_t, quorum::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quorum::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const quorum::schema::bytes_view_t& prefix) const;

  /// Atomically persist every entry; either all rows land or none do.
  void write_batch(const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace quorum::storage
