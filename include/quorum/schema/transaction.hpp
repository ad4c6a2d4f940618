#pragma once
#include <quorum/schema/approve_proposal.hpp>
#include <quorum/schema/create_proposal.hpp>
#include <quorum/schema/execute_proposal.hpp>
#include <quorum/schema/initialize_wallet.hpp>
#include <quorum/schema/primitives.hpp>
#include <variant>

namespace quorum::schema {

using transaction_payload_t = std::variant<initialize_wallet_t,
                                           create_proposal_t,
                                           approve_proposal_t,
                                           execute_proposal_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  identity_key_t signer{};
  transaction_payload_t payload{};
  signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace quorum::schema
