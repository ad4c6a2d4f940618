#include <quorum/crypto/keypair.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <memory>

namespace quorum::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(const ed25519_seed_t& seed) {
  return evp_pkey_ptr{EVP_PKEY_new_raw_private_key(
                          EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()),
                      EVP_PKEY_free};
}

}  // namespace

std::optional<ed25519_keypair_t> generate_ed25519_keypair() {
  auto seed = ed25519_seed_t{};
  if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
    return std::nullopt;
  }
  return ed25519_keypair_from_seed(seed);
}

std::optional<ed25519_keypair_t> ed25519_keypair_from_seed(
    const ed25519_seed_t& seed) {
  auto pkey = make_private_key(seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto keypair = ed25519_keypair_t{.seed = seed};
  auto length = keypair.public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), keypair.public_key.data(),
                                  &length) != 1 ||
      length != keypair.public_key.size()) {
    return std::nullopt;
  }
  return keypair;
}

std::optional<quorum::schema::signature_t> sign(
    const quorum::schema::bytes_view_t& message,
    const ed25519_keypair_t& keypair) {
  auto pkey = make_private_key(keypair.seed);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = quorum::schema::signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace quorum::crypto
