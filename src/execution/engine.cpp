#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <quorum/common/critical.hpp>
#include <quorum/crypto/verify.hpp>
#include <quorum/execution/engine.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/key/engine_keys.hpp>
#include <quorum/schema/query_error_code.hpp>
#include <quorum/schema/record_state.hpp>
#include <set>
#include <string>
#include <tuple>
#include <utility>

using namespace quorum::schema;

namespace {

constexpr auto kCheckCodespace = std::string_view{"quorum.check"};
constexpr auto kProcessCodespace = std::string_view{"quorum.process"};
constexpr auto kInitializeCodespace = std::string_view{"quorum.initialize"};
constexpr auto kCreateCodespace = std::string_view{"quorum.create"};
constexpr auto kApproveCodespace = std::string_view{"quorum.approve"};
constexpr auto kExecuteCodespace = std::string_view{"quorum.execute"};
constexpr auto kQueryCodespace = std::string_view{"quorum.query"};

std::string hex(const hash32_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

transaction_result_t make_error(const transaction_error_code code,
                                std::string log,
                                std::string info,
                                const std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

void make_query_error(query_result_t& result,
                      const query_error_code code,
                      std::string log,
                      std::string info = {}) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
}

std::optional<transaction_t> decode_transaction(
    quorum::execution::encoder_t& encoder,
    const bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction bytes are not a valid SCALE transaction";
  }
  return tx;
}

/// Decode record data as T when the record exists and belongs to owner.
template <typename T>
std::optional<T> decode_owned(quorum::execution::encoder_t& encoder,
                              const std::optional<record_state_t>& record,
                              const program_id_t& owner) {
  if (!record || record->owner != owner) {
    return std::nullopt;
  }
  return encoder.try_decode<T>(view(record->data));
}

/// A proposal is genuine when it belongs to the wallet and its stored index
/// and bump re-derive the address it was read from.
bool genuine_proposal(const program_id_t& program_id,
                      const address_t& wallet,
                      const address_t& address,
                      const proposal_state_t& proposal) {
  if (proposal.wallet != wallet) {
    return false;
  }
  auto seeds = quorum::address::proposal_seeds(wallet, proposal.index);
  return quorum::address::verify_derived_address(
      address, program_id, quorum::address::make_seed_views(seeds),
      proposal.bump);
}

}  // namespace

namespace quorum::execution {

engine::engine(encoding::encoder<encoding::scale_encoder_tag>& encoder,
               storage::storage<storage::rocksdb_storage_tag>& storage,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      options_{std::move(options)},
      wallet_{quorum::address::find_wallet_address(options_.program_id)} {
  if (options_.require_strict_crypto) {
    if (!quorum::crypto::available()) {
      quorum::common::critical(
          "strict crypto requested but OpenSSL has no ed25519 support");
    }
    signature_verifier_ = quorum::crypto::verify_signature;
  } else {
    spdlog::warn("Strict crypto disabled; transaction signatures are not "
                 "verified");
  }
  spdlog::info("Engine ready for program {} with wallet {} (bump {})",
               hex(options_.program_id), hex(wallet_.address), wallet_.bump);
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", decode_error, kCheckCodespace);
  }
  auto result = validate_transaction(*maybe_tx, kCheckCodespace);
  if (result.code == 0) {
    result.info = "transaction accepted";
  }
  return result;
}

transaction_result_t engine::process_transaction(const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error(transaction_error_code::invalid_transaction,
                      "invalid transaction", decode_error, kProcessCodespace);
  }
  return process_transaction(*maybe_tx);
}

transaction_result_t engine::process_transaction(const transaction_t& tx) {
  auto validation = validate_transaction(tx, kProcessCodespace);
  if (validation.code != 0) {
    return validation;
  }

  auto unit = storage_.begin();
  auto nonce_key = key::make_nonce_key(encoder_, tx.signer);
  auto stored_nonce =
      unit.get<uint64_t>(encoder_, view(nonce_key)).value_or(0);
  if (tx.nonce != stored_nonce + 1) {
    return make_error(transaction_error_code::invalid_nonce, "invalid nonce",
                      "expected nonce " + std::to_string(stored_nonce + 1),
                      kProcessCodespace);
  }
  unit.put(encoder_, view(nonce_key), tx.nonce);

  auto outcome = execute_operation(unit, tx);
  if (outcome.result.code != 0) {
    unit.rollback();
    spdlog::debug("Transaction from {} rejected: {} ({})", hex(tx.signer),
                  outcome.result.log, outcome.result.info);
    return outcome.result;
  }

  if (unit.commit() == storage::commit_status::conflict) {
    spdlog::warn("Transaction from {} lost a write conflict", hex(tx.signer));
    return make_error(transaction_error_code::record_conflict,
                      "record conflict",
                      "a concurrent transaction modified a record this one "
                      "read; resubmit",
                      kProcessCodespace);
  }

  for (const auto& event : outcome.events) {
    outcome.result.events.push_back(to_transaction_event(event));
    if (event_sink_) {
      event_sink_(event);
    }
  }
  return outcome.result;
}

transaction_result_t engine::validate_transaction(
    const transaction_t& tx,
    const std::string_view codespace) {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "unsupported transaction version", "expected version 1",
                      codespace);
  }
  if (tx.chain_id != options_.chain_id) {
    return make_error(transaction_error_code::invalid_chain_id,
                      "invalid chain id", "expected " + hex(options_.chain_id),
                      codespace);
  }
  if (options_.require_strict_crypto) {
    auto message = make_signing_message(encoder_, tx);
    if (!signature_verifier_ ||
        !signature_verifier_(view(message), tx.signer, tx.signature)) {
      return make_error(transaction_error_code::signature_verification_failed,
                        "signature verification failed",
                        "signature does not match signer " + hex(tx.signer),
                        codespace);
    }
  }
  return transaction_result_t{};
}

engine::operation_result engine::execute_operation(unit_of_work_t& unit,
                                                   const transaction_t& tx) {
  return std::visit(
      overloaded{[&](const initialize_wallet_t& payload) {
                   return initialize_wallet(unit, tx, payload);
                 },
                 [&](const create_proposal_t& payload) {
                   return create_proposal(unit, tx, payload);
                 },
                 [&](const approve_proposal_t& payload) {
                   return approve_proposal(unit, tx, payload);
                 },
                 [&](const execute_proposal_t& payload) {
                   return execute_proposal(unit, tx, payload);
                 }},
      tx.payload);
}

engine::operation_result engine::initialize_wallet(
    unit_of_work_t& unit,
    const transaction_t& tx,
    const initialize_wallet_t& payload) {
  auto outcome = operation_result{};
  auto wallet_key = key::make_record_key(encoder_, wallet_.address);
  if (unit.get<record_state_t>(encoder_, view(wallet_key))) {
    outcome.result =
        make_error(transaction_error_code::wallet_exists, "wallet exists",
                   "a record already exists at " + hex(wallet_.address),
                   kInitializeCodespace);
    return outcome;
  }
  if (payload.threshold == 0 || payload.threshold > payload.signers.size()) {
    outcome.result = make_error(
        transaction_error_code::threshold_invalid, "threshold invalid",
        "threshold " + std::to_string(payload.threshold) + " with " +
            std::to_string(payload.signers.size()) + " signer(s)",
        kInitializeCodespace);
    return outcome;
  }
  auto unique = std::set<identity_key_t>{std::begin(payload.signers),
                                         std::end(payload.signers)};
  if (unique.size() != payload.signers.size()) {
    outcome.result =
        make_error(transaction_error_code::duplicate_signer,
                   "duplicate signer", "signer list repeats an identity",
                   kInitializeCodespace);
    return outcome;
  }

  auto wallet = wallet_state_t{.signers = payload.signers,
                               .threshold = payload.threshold,
                               .proposal_count = 0,
                               .bump = wallet_.bump};
  write_record(unit, wallet_.address, encoder_.encode(wallet));

  spdlog::info("Wallet {} initialized by {} with {} signer(s), threshold {}",
               hex(wallet_.address), hex(tx.signer), wallet.signers.size(),
               wallet.threshold);
  outcome.result.info = "wallet initialized";
  outcome.result.data =
      bytes_t{std::begin(wallet_.address), std::end(wallet_.address)};
  outcome.events.push_back(
      wallet_initialized_event{.wallet = wallet_.address,
                               .signers = wallet.signers,
                               .threshold = wallet.threshold});
  return outcome;
}

engine::operation_result engine::create_proposal(
    unit_of_work_t& unit,
    const transaction_t& tx,
    const create_proposal_t& payload) {
  auto outcome = operation_result{};
  auto wallet = read_wallet(unit);
  if (!wallet) {
    outcome.result =
        make_error(transaction_error_code::wallet_missing, "wallet missing",
                   "wallet is not initialized", kCreateCodespace);
    return outcome;
  }
  if (std::ranges::find(wallet->signers, tx.signer) ==
      std::end(wallet->signers)) {
    outcome.result = make_error(transaction_error_code::invalid_signer,
                                "invalid signer",
                                hex(tx.signer) + " is not a wallet signer",
                                kCreateCodespace);
    return outcome;
  }

  auto index = wallet->proposal_count + 1;
  auto derived = quorum::address::find_proposal_address(
      options_.program_id, wallet_.address, index);
  auto proposal_key = key::make_record_key(encoder_, derived.address);
  if (unit.get<record_state_t>(encoder_, view(proposal_key))) {
    outcome.result =
        make_error(transaction_error_code::proposal_exists, "proposal exists",
                   "a record already exists at " + hex(derived.address),
                   kCreateCodespace);
    return outcome;
  }

  auto proposal = proposal_state_t{
      .wallet = wallet_.address,
      .proposer = tx.signer,
      .index = index,
      .action = action_descriptor_t{.program_id = payload.instruction_program,
                                    .accounts = payload.instruction_accounts,
                                    .data = payload.instruction_data},
      .approvals = {tx.signer},
      .executed = false,
      .bump = derived.bump};
  write_record(unit, derived.address, encoder_.encode(proposal));
  wallet->proposal_count = index;
  write_record(unit, wallet_.address, encoder_.encode(*wallet));

  spdlog::info("Proposal {} (index {}) created by {}", hex(derived.address),
               index, hex(tx.signer));
  outcome.result.info = "proposal created";
  outcome.result.data =
      bytes_t{std::begin(derived.address), std::end(derived.address)};
  outcome.events.push_back(proposal_created_event{
      .proposal = derived.address, .proposer = tx.signer, .index = index});
  return outcome;
}

engine::operation_result engine::approve_proposal(
    unit_of_work_t& unit,
    const transaction_t& tx,
    const approve_proposal_t& payload) {
  auto outcome = operation_result{};
  auto wallet = read_wallet(unit);
  if (!wallet) {
    outcome.result =
        make_error(transaction_error_code::wallet_missing, "wallet missing",
                   "wallet is not initialized", kApproveCodespace);
    return outcome;
  }
  auto proposal = read_proposal(unit, payload.proposal);
  if (!proposal) {
    outcome.result = make_error(
        transaction_error_code::proposal_missing, "proposal missing",
        "no proposal of this wallet at " + hex(payload.proposal),
        kApproveCodespace);
    return outcome;
  }
  if (std::ranges::find(wallet->signers, tx.signer) ==
      std::end(wallet->signers)) {
    outcome.result = make_error(transaction_error_code::invalid_signer,
                                "invalid signer",
                                hex(tx.signer) + " is not a wallet signer",
                                kApproveCodespace);
    return outcome;
  }
  if (proposal->executed) {
    outcome.result = make_error(transaction_error_code::already_executed,
                                "already executed",
                                "proposal has already been executed",
                                kApproveCodespace);
    return outcome;
  }
  if (std::ranges::find(proposal->approvals, tx.signer) !=
      std::end(proposal->approvals)) {
    outcome.result = make_error(transaction_error_code::already_approved,
                                "already approved",
                                hex(tx.signer) + " already approved",
                                kApproveCodespace);
    return outcome;
  }

  proposal->approvals.push_back(tx.signer);
  write_record(unit, payload.proposal, encoder_.encode(*proposal));

  spdlog::info("Proposal {} approved by {} ({}/{})", hex(payload.proposal),
               hex(tx.signer), proposal->approvals.size(), wallet->threshold);
  outcome.result.info = "proposal approved";
  outcome.events.push_back(proposal_approved_event{
      .proposal = payload.proposal,
      .approver = tx.signer,
      .approvals_needed = wallet->threshold,
      .current_approvals = proposal->approvals.size()});
  return outcome;
}

engine::operation_result engine::execute_proposal(
    unit_of_work_t& unit,
    const transaction_t& tx,
    const execute_proposal_t& payload) {
  auto outcome = operation_result{};
  auto wallet = read_wallet(unit);
  if (!wallet) {
    outcome.result =
        make_error(transaction_error_code::wallet_missing, "wallet missing",
                   "wallet is not initialized", kExecuteCodespace);
    return outcome;
  }
  auto proposal = read_proposal(unit, payload.proposal);
  if (!proposal) {
    outcome.result = make_error(
        transaction_error_code::proposal_missing, "proposal missing",
        "no proposal of this wallet at " + hex(payload.proposal),
        kExecuteCodespace);
    return outcome;
  }
  if (proposal->executed) {
    outcome.result = make_error(transaction_error_code::already_executed,
                                "already executed",
                                "proposal has already been executed",
                                kExecuteCodespace);
    return outcome;
  }
  if (proposal->approvals.size() < wallet->threshold) {
    outcome.result = make_error(
        transaction_error_code::not_enough_approvals, "not enough approvals",
        std::to_string(proposal->approvals.size()) + " of " +
            std::to_string(wallet->threshold) + " approvals",
        kExecuteCodespace);
    return outcome;
  }

  // Flip before the handler runs so a handler that reads the proposal back
  // sees it as executed.
  proposal->executed = true;
  write_record(unit, payload.proposal, encoder_.encode(*proposal));

  auto seeds = quorum::address::wallet_seeds();
  auto authority = quorum::address::derived_authority::mint(
      options_.program_id, quorum::address::make_seed_views(seeds),
      wallet->bump);
  auto delegate_error = std::string{};
  if (!delegate_.invoke(encoder_, unit, options_.program_id, proposal->action,
                        payload.remaining_accounts, tx.signer,
                        std::span<const quorum::address::derived_authority>{
                            &authority, 1},
                        delegate_error)) {
    spdlog::warn("Execution of proposal {} failed: {}", hex(payload.proposal),
                 delegate_error);
    outcome.result = make_error(
        transaction_error_code::delegate_invocation_failed,
        "delegate invocation failed", delegate_error, kExecuteCodespace);
    return outcome;
  }

  spdlog::info("Proposal {} (index {}) executed by {}", hex(payload.proposal),
               proposal->index, hex(tx.signer));
  outcome.result.info = "proposal executed";
  outcome.events.push_back(proposal_executed_event{
      .proposal = payload.proposal,
      .index = proposal->index,
      .instruction_program = proposal->action.program_id});
  return outcome;
}

std::optional<wallet_state_t> engine::read_wallet(unit_of_work_t& unit) {
  auto wallet_key = key::make_record_key(encoder_, wallet_.address);
  auto record = unit.get<record_state_t>(encoder_, view(wallet_key));
  if (!record || record->owner != options_.program_id) {
    return std::nullopt;
  }
  auto wallet = decode_owned<wallet_state_t>(encoder_, record,
                                             options_.program_id);
  if (!wallet) {
    quorum::common::critical("wallet record is not decodable");
  }
  return wallet;
}

std::optional<proposal_state_t> engine::read_proposal(
    unit_of_work_t& unit,
    const address_t& address) {
  auto proposal_key = key::make_record_key(encoder_, address);
  auto proposal = decode_owned<proposal_state_t>(
      encoder_, unit.get<record_state_t>(encoder_, view(proposal_key)),
      options_.program_id);
  if (!proposal || !genuine_proposal(options_.program_id, wallet_.address,
                                     address, *proposal)) {
    return std::nullopt;
  }
  return proposal;
}

void engine::write_record(unit_of_work_t& unit,
                          const address_t& address,
                          const bytes_t& data) {
  auto record_key = key::make_record_key(encoder_, address);
  unit.put(encoder_, view(record_key),
           record_state_t{.owner = options_.program_id, .data = data});
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto result = query_result_t{};
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.key = make_bytes(path);
    result.value =
        encoder_.encode(std::tuple{options_.program_id, options_.chain_id});
    return result;
  }

  if (path == "/engine/keyspaces") {
    auto keyspaces = std::vector<std::string>{};
    std::ranges::transform(
        key::kEngineKeyspaces, std::back_inserter(keyspaces),
        [](const std::string_view keyspace) { return std::string{keyspace}; });
    result.key = make_bytes(path);
    result.value = encoder_.encode(keyspaces);
    return result;
  }

  if (path == "/state/wallet") {
    result.key = key::make_record_key(encoder_, wallet_.address);
    auto wallet = load_wallet();
    if (!wallet) {
      make_query_error(result, query_error_code::not_found,
                       "wallet not initialized");
      return result;
    }
    result.value = encoder_.encode(*wallet);
    return result;
  }

  if (path == "/state/proposal") {
    auto index = encoder_.try_decode<uint64_t>(data);
    if (!index) {
      make_query_error(result, query_error_code::invalid_key,
                       "expected SCALE u64 proposal index");
      return result;
    }
    auto address = proposal_address(*index);
    result.key = key::make_record_key(encoder_, address);
    auto proposal = load_proposal(address);
    if (!proposal) {
      make_query_error(result, query_error_code::not_found,
                       "proposal not found", hex(address));
      return result;
    }
    result.value = encoder_.encode(*proposal);
    return result;
  }

  if (path == "/state/record" || path == "/state/nonce") {
    if (data.size() != std::tuple_size_v<hash32_t>) {
      make_query_error(result, query_error_code::invalid_key,
                       "expected 32-byte key");
      return result;
    }
    auto id = hash32_t{};
    std::ranges::copy(data, std::begin(id));

    if (path == "/state/record") {
      result.key = key::make_record_key(encoder_, id);
      auto record = storage_.get<record_state_t>(encoder_, view(result.key));
      if (!record) {
        make_query_error(result, query_error_code::not_found,
                         "record not found", hex(id));
        return result;
      }
      result.value = encoder_.encode(*record);
      return result;
    }

    result.key = key::make_nonce_key(encoder_, id);
    auto nonce = load_nonce(id);
    if (!nonce) {
      make_query_error(result, query_error_code::not_found,
                       "no transactions from signer", hex(id));
      return result;
    }
    result.value = encoder_.encode(*nonce);
    return result;
  }

  make_query_error(result, query_error_code::unsupported_path,
                   "unsupported query path", std::string{path});
  return result;
}

app_info_t engine::info() const {
  return app_info_t{.program_id = options_.program_id,
                    .chain_id = options_.chain_id};
}

std::optional<wallet_state_t> engine::load_wallet() const {
  auto wallet_key = key::make_record_key(encoder_, wallet_.address);
  return decode_owned<wallet_state_t>(
      encoder_, storage_.get<record_state_t>(encoder_, view(wallet_key)),
      options_.program_id);
}

std::optional<proposal_state_t> engine::load_proposal(
    const address_t& address) const {
  auto proposal_key = key::make_record_key(encoder_, address);
  auto proposal = decode_owned<proposal_state_t>(
      encoder_, storage_.get<record_state_t>(encoder_, view(proposal_key)),
      options_.program_id);
  if (!proposal || !genuine_proposal(options_.program_id, wallet_.address,
                                     address, *proposal)) {
    return std::nullopt;
  }
  return proposal;
}

std::optional<uint64_t> engine::load_nonce(const identity_key_t& signer) const {
  auto nonce_key = key::make_nonce_key(encoder_, signer);
  return storage_.get<uint64_t>(encoder_, view(nonce_key));
}

const address_t& engine::wallet_address() const {
  return wallet_.address;
}

address_t engine::proposal_address(const uint64_t index) const {
  return quorum::address::find_proposal_address(options_.program_id,
                                                wallet_.address, index)
      .address;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  if (!options_.require_strict_crypto) {
    spdlog::warn("Signature verifier installed while strict crypto is "
                 "disabled; it will not be used");
  }
  signature_verifier_ = std::move(verifier);
}

void engine::set_event_sink(event_sink_t sink) {
  event_sink_ = std::move(sink);
}

delegate& engine::execution_delegate() {
  return delegate_;
}

}  // namespace quorum::execution
