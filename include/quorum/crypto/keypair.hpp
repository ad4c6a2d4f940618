#pragma once

#include <quorum/schema/primitives.hpp>

#include <array>
#include <optional>

namespace quorum::crypto {

using ed25519_seed_t = std::array<uint8_t, 32>;

struct ed25519_keypair_t final {
  ed25519_seed_t seed{};
  quorum::schema::identity_key_t public_key{};
};

std::optional<ed25519_keypair_t> generate_ed25519_keypair();

std::optional<ed25519_keypair_t> ed25519_keypair_from_seed(
    const ed25519_seed_t& seed);

std::optional<quorum::schema::signature_t> sign(
    const quorum::schema::bytes_view_t& message,
    const ed25519_keypair_t& keypair);

}  // namespace quorum::crypto
