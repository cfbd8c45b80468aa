#pragma once
#include <quorum/schema/primitives.hpp>
#include <optional>
#include <span>

namespace quorum::schema::encoding {

// The codec is a build time setting selected by tag, the same way storage
// and value pool backends are. Persisted wallet rows, storage keys and the
// state root all depend on the chosen codec, so it is not hot swappable.
template <typename Library>
struct encoder {
  template <typename T>
  quorum::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, quorum::schema::bytes_t& out);

  template <typename T>
  T decode(const quorum::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const quorum::schema::bytes_view_t& bytes);
};

}  // namespace quorum::schema::encoding
