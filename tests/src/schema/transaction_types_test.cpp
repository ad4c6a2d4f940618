#include <gtest/gtest.h>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/proposal_status.hpp>
#include <quorum/schema/transaction.hpp>

namespace {

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(transaction_types, defaults_are_stable) {
  auto tx = quorum::schema::transaction_t{};
  EXPECT_EQ(tx.version, 1u);
  EXPECT_EQ(tx.nonce, 0u);
  EXPECT_TRUE(
      std::holds_alternative<quorum::schema::initialize_wallet_t>(tx.payload));

  auto wallet = quorum::schema::wallet_state_t{};
  EXPECT_EQ(wallet.proposal_count, 0u);
  EXPECT_TRUE(wallet.signers.empty());
}

TEST(transaction_types, payload_variant_holds_valid_type) {
  auto tx = quorum::schema::transaction_t{};
  tx.payload = quorum::schema::execute_proposal_t{};
  EXPECT_TRUE(
      std::holds_alternative<quorum::schema::execute_proposal_t>(tx.payload));
}

TEST(transaction_types, proposal_status_follows_executed_flag) {
  auto proposal = quorum::schema::proposal_state_t{};
  EXPECT_EQ(quorum::schema::status_of(proposal),
            quorum::schema::proposal_status_t::pending);
  proposal.executed = true;
  EXPECT_EQ(quorum::schema::status_of(proposal),
            quorum::schema::proposal_status_t::executed);
  EXPECT_EQ(quorum::schema::to_string(quorum::schema::proposal_status_t::executed),
            "executed");
  EXPECT_EQ(quorum::schema::try_from_string<quorum::schema::proposal_status_t>(
                "pending"),
            quorum::schema::proposal_status_t::pending);
  EXPECT_FALSE(quorum::schema::try_from_string<quorum::schema::proposal_status_t>(
                   "cancelled")
                   .has_value());
}

TEST(transaction_types, wallet_layout_uses_fixed_width_counters) {
  auto encoder = encoder_t{};
  auto wallet = quorum::schema::wallet_state_t{
      .signers = {quorum::schema::identity_key_t{}},
      .threshold = 1,
      .proposal_count = 7,
      .bump = 254};
  auto encoded = encoder.encode(wallet);
  // version(2) + compact length(1) + one key(32) + threshold(8) + count(8) +
  // bump(1)
  EXPECT_EQ(encoded.size(), 52u);
  EXPECT_EQ(encoded.back(), 254u);

  auto decoded = encoder.decode<quorum::schema::wallet_state_t>(
      quorum::schema::bytes_view_t{encoded.data(), encoded.size()});
  EXPECT_EQ(decoded.proposal_count, 7u);
  EXPECT_EQ(decoded.signers.size(), 1u);
}

TEST(transaction_types, try_decode_rejects_truncated_transaction) {
  auto encoder = encoder_t{};
  auto tx = quorum::schema::transaction_t{};
  tx.payload = quorum::schema::approve_proposal_t{};
  auto encoded = encoder.encode(tx);
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder.try_decode<quorum::schema::transaction_t>(
                       quorum::schema::bytes_view_t{encoded.data(),
                                                    encoded.size()})
                   .has_value());
}
