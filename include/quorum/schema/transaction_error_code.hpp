#pragma once

#include <quorum/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: transaction error code.
// Result codes for rejected transactions. Envelope failures occupy 1-9,
// record lookups 10-19 and multisig rule violations 20 and up.
namespace quorum::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  signature_verification_failed = 5,
  wallet_exists = 10,
  wallet_missing = 11,
  proposal_exists = 12,
  proposal_missing = 13,
  record_conflict = 14,
  delegate_invocation_failed = 15,
  threshold_invalid = 20,
  duplicate_signer = 21,
  invalid_signer = 22,
  already_executed = 23,
  already_approved = 24,
  not_enough_approvals = 25,
};

template <>
struct enum_strings<transaction_error_code> final {
  using entry = std::pair<std::string_view, transaction_error_code>;
  static constexpr auto values = std::array{
      entry{"invalid_transaction", transaction_error_code::invalid_transaction},
      entry{"unsupported_transaction_version",
            transaction_error_code::unsupported_transaction_version},
      entry{"invalid_chain_id", transaction_error_code::invalid_chain_id},
      entry{"invalid_nonce", transaction_error_code::invalid_nonce},
      entry{"signature_verification_failed",
            transaction_error_code::signature_verification_failed},
      entry{"wallet_exists", transaction_error_code::wallet_exists},
      entry{"wallet_missing", transaction_error_code::wallet_missing},
      entry{"proposal_exists", transaction_error_code::proposal_exists},
      entry{"proposal_missing", transaction_error_code::proposal_missing},
      entry{"record_conflict", transaction_error_code::record_conflict},
      entry{"delegate_invocation_failed",
            transaction_error_code::delegate_invocation_failed},
      entry{"threshold_invalid", transaction_error_code::threshold_invalid},
      entry{"duplicate_signer", transaction_error_code::duplicate_signer},
      entry{"invalid_signer", transaction_error_code::invalid_signer},
      entry{"already_executed", transaction_error_code::already_executed},
      entry{"already_approved", transaction_error_code::already_approved},
      entry{"not_enough_approvals",
            transaction_error_code::not_enough_approvals}};
};

}  // namespace quorum::schema
