#pragma once

#include <quorum/schema/action_descriptor.hpp>
#include <quorum/schema/primitives.hpp>
#include <vector>

// Schema type: proposal state.
// Immutable after creation except for approvals (append-only) and executed
// (false -> true once).
namespace quorum::schema {

template <uint16_t Version>
struct proposal_state;

template <>
struct proposal_state<1> final {
  uint16_t version{1};
  address_t wallet{};
  identity_key_t proposer{};
  uint64_t index{};
  action_descriptor_t action;
  std::vector<identity_key_t> approvals;
  bool executed{};
  uint8_t bump{};
};

using proposal_state_t = proposal_state<1>;

}  // namespace quorum::schema
