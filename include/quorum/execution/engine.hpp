#pragma once

#include <quorum/address/derive.hpp>
#include <quorum/execution/delegate.hpp>
#include <quorum/execution/event_sink.hpp>
#include <quorum/execution/signature_verifier.hpp>
#include <quorum/schema/app_info.hpp>
#include <quorum/schema/encoding/encoder.hpp>
#include <quorum/schema/engine_event.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/proposal_state.hpp>
#include <quorum/schema/query_result.hpp>
#include <quorum/schema/transaction.hpp>
#include <quorum/schema/transaction_error_code.hpp>
#include <quorum/schema/transaction_result.hpp>
#include <quorum/schema/wallet_state.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quorum::execution {

struct engine_options final {
  quorum::schema::program_id_t program_id{};
  quorum::schema::hash32_t chain_id{};
  /// When false, signatures are not checked.
  bool require_strict_crypto{true};
};

/// Multisig authorization engine.
///
/// Validates signed transactions and runs the four wallet operations
/// (initialize, create, approve, execute) each inside one storage unit of
/// work. A failed operation leaves no trace in storage, including the
/// signer's nonce.
class engine final {
 public:
  explicit engine(
      quorum::schema::encoding::encoder<
          quorum::schema::encoding::scale_encoder_tag>& encoder,
      quorum::storage::storage<quorum::storage::rocksdb_storage_tag>& storage,
      engine_options options);

  /// Decode and run the stateless checks (version, chain id, signature).
  ///
  /// Does not read or mutate state.
  quorum::schema::transaction_result_t check_transaction(
      const quorum::schema::bytes_view_t& raw_tx);

  /// Decode, validate and execute a transaction.
  quorum::schema::transaction_result_t process_transaction(
      const quorum::schema::bytes_view_t& raw_tx);

  /// Validate and execute an already decoded transaction.
  quorum::schema::transaction_result_t process_transaction(
      const quorum::schema::transaction_t& tx);

  /// Execute a read-only query by route.
  quorum::schema::query_result_t query(std::string_view path,
                                       const quorum::schema::bytes_view_t& data);

  quorum::schema::app_info_t info() const;

  std::optional<quorum::schema::wallet_state_t> load_wallet() const;
  std::optional<quorum::schema::proposal_state_t> load_proposal(
      const quorum::schema::address_t& address) const;
  std::optional<uint64_t> load_nonce(
      const quorum::schema::identity_key_t& signer) const;

  const quorum::schema::address_t& wallet_address() const;
  quorum::schema::address_t proposal_address(uint64_t index) const;

  /// Install runtime signature verifier callback.
  ///
  /// Ignored when strict-crypto mode is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

  void set_event_sink(event_sink_t sink);

  /// Handler registry used by execute_proposal.
  delegate& execution_delegate();

 private:
  struct operation_result final {
    quorum::schema::transaction_result_t result;
    std::vector<quorum::schema::engine_event_t> events;
  };

  quorum::schema::transaction_result_t validate_transaction(
      const quorum::schema::transaction_t& tx,
      std::string_view codespace);

  operation_result execute_operation(unit_of_work_t& unit,
                                     const quorum::schema::transaction_t& tx);

  operation_result initialize_wallet(
      unit_of_work_t& unit,
      const quorum::schema::transaction_t& tx,
      const quorum::schema::initialize_wallet_t& payload);
  operation_result create_proposal(
      unit_of_work_t& unit,
      const quorum::schema::transaction_t& tx,
      const quorum::schema::create_proposal_t& payload);
  operation_result approve_proposal(
      unit_of_work_t& unit,
      const quorum::schema::transaction_t& tx,
      const quorum::schema::approve_proposal_t& payload);
  operation_result execute_proposal(
      unit_of_work_t& unit,
      const quorum::schema::transaction_t& tx,
      const quorum::schema::execute_proposal_t& payload);

  std::optional<quorum::schema::wallet_state_t> read_wallet(
      unit_of_work_t& unit);
  std::optional<quorum::schema::proposal_state_t> read_proposal(
      unit_of_work_t& unit,
      const quorum::schema::address_t& address);
  void write_record(unit_of_work_t& unit,
                    const quorum::schema::address_t& address,
                    const quorum::schema::bytes_t& data);

  quorum::schema::encoding::encoder<
      quorum::schema::encoding::scale_encoder_tag>& encoder_;
  quorum::storage::storage<quorum::storage::rocksdb_storage_tag>& storage_;
  engine_options options_;
  quorum::address::derived_address_t wallet_;
  signature_verifier_t signature_verifier_;
  event_sink_t event_sink_;
  delegate delegate_;
};

}  // namespace quorum::execution
