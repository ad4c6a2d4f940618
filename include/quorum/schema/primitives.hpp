#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace quorum::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

/// Ed25519 public key; possession of the matching secret is proven by the
/// transaction signature.
using identity_key_t = std::array<uint8_t, 32>;
/// Location of a record in the record store.
using address_t = hash32_t;
/// Identifier of the engine deployment or of an instruction handler.
using program_id_t = hash32_t;

using ed25519_signature_t = std::array<uint8_t, 64>;
using signature_t = ed25519_signature_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

/// Parse 64 hex characters, optionally prefixed with 0x.
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

/// Lowercase, unprefixed.
std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// Standard alphabet with padding; whitespace is ignored when decoding.
std::string to_base64(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_base64(std::string_view encoded);
bytes_t from_base64(std::string_view encoded);

}  // namespace quorum::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
