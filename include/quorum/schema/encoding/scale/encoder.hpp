#pragma once
#include <quorum/common/critical.hpp>
#include <quorum/schema/account_meta.hpp>
#include <quorum/schema/action_descriptor.hpp>
#include <quorum/schema/encoding/encoder.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/proposal_state.hpp>
#include <quorum/schema/record_state.hpp>
#include <quorum/schema/transaction.hpp>
#include <quorum/schema/wallet_state.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace quorum::schema::encoding {

struct scale_encoder_tag {};

// Schema records are aggregates; SCALE encodes them field by field in
// declaration order, so field order is part of the persisted layout.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  quorum::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, quorum::schema::bytes_t& out);

  template <typename T>
  T decode(const quorum::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const quorum::schema::bytes_view_t& bytes);
};

template <typename T>
quorum::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    quorum::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        quorum::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const quorum::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    quorum::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const quorum::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace quorum::schema::encoding
