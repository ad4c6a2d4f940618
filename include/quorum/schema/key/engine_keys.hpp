#pragma once

#include <array>
#include <quorum/schema/primitives.hpp>
#include <string_view>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for records and signer nonces.
namespace quorum::schema::key {

inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRecordKeyPrefix{"SYS|STATE|RECORD|"};

inline const std::array<std::string_view, 2> kEngineKeyspaces{
    kRecordKeyPrefix, kNonceKeyPrefix};

template <typename Encoder, typename T>
quorum::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // The prefix is written raw so that every key of a keyspace starts with
  // the same bytes.
  auto key = quorum::schema::make_bytes(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
quorum::schema::bytes_t make_record_key(
    Encoder& encoder,
    const quorum::schema::address_t& address) {
  return make_prefixed_key(encoder, kRecordKeyPrefix, address);
}

template <typename Encoder>
quorum::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const quorum::schema::identity_key_t& signer) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, signer);
}

}  // namespace quorum::schema::key
