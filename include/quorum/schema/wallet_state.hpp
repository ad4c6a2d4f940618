#pragma once

#include <quorum/schema/primitives.hpp>
#include <vector>

// Schema type: wallet state.
// Written once by initialize_wallet; proposal_count is the only field that
// changes afterwards.
namespace quorum::schema {

template <uint16_t Version>
struct wallet_state;

template <>
struct wallet_state<1> final {
  uint16_t version{1};
  std::vector<identity_key_t> signers;
  uint64_t threshold{};
  uint64_t proposal_count{};
  uint8_t bump{};
};

using wallet_state_t = wallet_state<1>;

}  // namespace quorum::schema
