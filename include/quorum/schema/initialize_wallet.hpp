#pragma once

#include <quorum/schema/primitives.hpp>
#include <vector>

// Schema type: initialize wallet.
// Creates the deployment's wallet; the transaction signer pays for creation
// and need not be one of the signers.
namespace quorum::schema {

template <uint16_t Version>
struct initialize_wallet;

template <>
struct initialize_wallet<1> final {
  std::vector<identity_key_t> signers;
  uint64_t threshold{};
};

using initialize_wallet_t = initialize_wallet<1>;

}  // namespace quorum::schema
