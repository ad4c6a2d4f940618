#pragma once
#include <quorum/schema/primitives.hpp>
#include <optional>
#include <span>

namespace quorum::schema::encoding {

// The wire codec is a build time choice selected by tag, the same way the
// storage backend is. Records, keys and signed transaction bytes all go
// through one encoder so that the byte layout stays deterministic.
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
