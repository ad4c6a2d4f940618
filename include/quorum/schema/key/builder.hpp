#pragma once
#include <quorum/schema/primitives.hpp>
#include <concepts>
#include <cstdint>

namespace quorum::schema::key {

/// Byte accumulator for derivation material. Integers are written
/// little-endian at their full width.
struct builder final {
  quorum::schema::bytes_t data;

  builder& write(const quorum::schema::bytes_view_t& bytes);

  /// Write a u32 length prefix followed by the bytes.
  builder& write_sized(const quorum::schema::bytes_view_t& bytes);

  template <std::unsigned_integral T>
  builder& write(const T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFFu));
    }
    return *this;
  }
};

}  // namespace quorum::schema::key
