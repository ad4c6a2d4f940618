#pragma once

#include <quorum/schema/primitives.hpp>
#include <quorum/schema/transaction_event.hpp>
#include <cstdint>
#include <variant>
#include <vector>

// Schema type: engine event.
// State transitions reported to the event sink once a transaction commits.
namespace quorum::schema {

struct wallet_initialized_event final {
  address_t wallet{};
  std::vector<identity_key_t> signers;
  uint64_t threshold{};
};

struct proposal_created_event final {
  address_t proposal{};
  identity_key_t proposer{};
  uint64_t index{};
};

struct proposal_approved_event final {
  address_t proposal{};
  identity_key_t approver{};
  uint64_t approvals_needed{};
  uint64_t current_approvals{};
};

struct proposal_executed_event final {
  address_t proposal{};
  uint64_t index{};
  program_id_t instruction_program{};
};

using engine_event_t = std::variant<wallet_initialized_event,
                                    proposal_created_event,
                                    proposal_approved_event,
                                    proposal_executed_event>;

/// Flatten an engine event into type + hex/decimal attributes.
transaction_event_t to_transaction_event(const engine_event_t& event);

}  // namespace quorum::schema
