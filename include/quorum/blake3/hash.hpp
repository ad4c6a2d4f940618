#pragma once
#include <blake3.h>
#include <quorum/schema/primitives.hpp>
#include <string_view>

namespace quorum::blake3 {

/// Incremental BLAKE3 over a 32-byte output.
class hasher final {
 public:
  hasher();

  hasher& update(const quorum::schema::bytes_view_t& bytes);
  hasher& update(const std::string_view& str);

  quorum::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

quorum::schema::hash32_t hash(const std::string_view& str);
quorum::schema::hash32_t hash(const quorum::schema::bytes_view_t& bytes);

}  // namespace quorum::blake3
