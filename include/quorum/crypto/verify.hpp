#pragma once

#include <quorum/schema/primitives.hpp>

// Ed25519 over OpenSSL EVP.
namespace quorum::crypto {

/// False when the linked OpenSSL cannot build Ed25519 keys; engines that
/// require strict crypto refuse to start in that case.
bool available();

/// Verify `signature` by the Ed25519 public key `signer` over `message`.
/// Malformed keys and signatures verify as false.
bool verify_signature(const quorum::schema::bytes_view_t& message,
                      const quorum::schema::identity_key_t& signer,
                      const quorum::schema::signature_t& signature);

}  // namespace quorum::crypto
