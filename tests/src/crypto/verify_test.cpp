#include <quorum/crypto/keypair.hpp>
#include <quorum/crypto/verify.hpp>
#include <gtest/gtest.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <string_view>
#include <optional>
#include <vector>

namespace {

// RFC 8032 section 7.1, TEST 1.
constexpr auto kRfcSecret = std::string_view{
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"};
constexpr auto kRfcPublic = std::string_view{
    "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"};
constexpr auto kRfcSignature = std::string_view{
    "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155"
    "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"};

quorum::schema::signature_t make_signature(const std::string_view hex) {
  auto bytes = quorum::schema::from_hex(hex);
  auto signature = quorum::schema::signature_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
  return signature;
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!quorum::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto *keygen_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  ASSERT_NE(keygen_ctx, nullptr);
  ASSERT_EQ(EVP_PKEY_keygen_init(keygen_ctx), 1);
  auto *pkey = static_cast<EVP_PKEY *>(nullptr);
  ASSERT_EQ(EVP_PKEY_keygen(keygen_ctx, &pkey), 1);
  EVP_PKEY_CTX_free(keygen_ctx);

  auto public_key = quorum::schema::identity_key_t{};
  auto public_key_size = public_key.size();
  ASSERT_EQ(
      EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &public_key_size),
      1);
  ASSERT_EQ(public_key_size, public_key.size());

  auto message = std::vector<uint8_t>{'q', 'u', 'o', 'r', 'u', 'm'};
  auto signature = quorum::schema::signature_t{};
  auto signature_size = signature.size();
  auto *sign_ctx = EVP_MD_CTX_new();
  ASSERT_NE(sign_ctx, nullptr);
  ASSERT_EQ(EVP_DigestSignInit(sign_ctx, nullptr, nullptr, nullptr, pkey), 1);
  ASSERT_EQ(EVP_DigestSign(sign_ctx, signature.data(), &signature_size,
                           message.data(), message.size()),
            1);
  EVP_MD_CTX_free(sign_ctx);
  ASSERT_EQ(signature_size, signature.size());

  EXPECT_TRUE(quorum::crypto::verify_signature(
      quorum::schema::bytes_view_t{message.data(), message.size()}, public_key,
      signature));

  message[0] ^= 0x01;
  EXPECT_FALSE(quorum::crypto::verify_signature(
      quorum::schema::bytes_view_t{message.data(), message.size()}, public_key,
      signature));

  EVP_PKEY_free(pkey);
}

TEST(crypto_verify, keypair_from_seed_matches_rfc8032_vector) {
  if (!quorum::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto keypair = quorum::crypto::ed25519_keypair_from_seed(
      quorum::crypto::ed25519_seed_t{quorum::schema::make_hash32(kRfcSecret)});
  ASSERT_TRUE(keypair.has_value());
  EXPECT_EQ(keypair->public_key, quorum::schema::make_hash32(kRfcPublic));

  auto empty = quorum::schema::bytes_t{};
  auto signature = quorum::crypto::sign(
      quorum::schema::bytes_view_t{empty.data(), empty.size()}, *keypair);
  ASSERT_TRUE(signature.has_value());
  EXPECT_EQ(*signature, make_signature(kRfcSignature));
  EXPECT_TRUE(quorum::crypto::verify_signature(
      quorum::schema::bytes_view_t{empty.data(), empty.size()},
      keypair->public_key, *signature));
}

TEST(crypto_verify, generated_keypairs_sign_and_verify) {
  if (!quorum::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto first = quorum::crypto::generate_ed25519_keypair();
  auto second = quorum::crypto::generate_ed25519_keypair();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(first->public_key, second->public_key);

  auto message = quorum::schema::make_bytes(std::string_view{"approve"});
  auto view = quorum::schema::bytes_view_t{message.data(), message.size()};
  auto signature = quorum::crypto::sign(view, *first);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(
      quorum::crypto::verify_signature(view, first->public_key, *signature));
  EXPECT_FALSE(
      quorum::crypto::verify_signature(view, second->public_key, *signature));
}

TEST(crypto_verify, rejects_zero_signature) {
  auto message = quorum::schema::make_bytes(std::string_view{"quorum"});
  auto signer = quorum::schema::make_hash32(kRfcPublic);
  EXPECT_FALSE(quorum::crypto::verify_signature(
      quorum::schema::bytes_view_t{message.data(), message.size()}, signer,
      quorum::schema::signature_t{}));
}
