#pragma once

#include <quorum/address/derive.hpp>
#include <quorum/schema/account_meta.hpp>
#include <quorum/schema/action_descriptor.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/schema/record_state.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace quorum::execution {

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;
using unit_of_work_t =
    quorum::storage::unit_of_work<quorum::storage::rocksdb_storage_tag>;

/// View handed to an instruction handler for one invocation.
///
/// Reads and writes go through the caller's unit of work, so everything a
/// handler stores is discarded if the enclosing transaction fails.
class invoke_context final {
 public:
  invoke_context(encoder_t& encoder,
                 unit_of_work_t& unit,
                 const quorum::schema::action_descriptor_t& action,
                 std::span<const quorum::schema::address_t> referenced,
                 std::vector<quorum::schema::address_t> signers);

  const quorum::schema::program_id_t& program_id() const;
  const quorum::schema::bytes_t& data() const;
  const std::vector<quorum::schema::account_meta_t>& accounts() const;

  /// True when address signed the invocation, either as the transaction
  /// signer or through a derived authority.
  bool is_signer(const quorum::schema::address_t& address) const;

  /// Record at a referenced address, or std::nullopt when absent or not
  /// referenced by the invocation.
  std::optional<quorum::schema::record_state_t> load(
      const quorum::schema::address_t& address);

  /// Write data at a writable account of the action. An existing record must
  /// be owned by the invoked program; an absent one may only be created when
  /// its address signed the invocation. The record is stored with the
  /// invoked program as owner.
  bool store(const quorum::schema::address_t& address,
             quorum::schema::bytes_t data,
             std::string& error);

 private:
  bool referenced(const quorum::schema::address_t& address) const;
  const quorum::schema::account_meta_t* find_meta(
      const quorum::schema::address_t& address) const;

  encoder_t& encoder_;
  unit_of_work_t& unit_;
  const quorum::schema::action_descriptor_t& action_;
  std::span<const quorum::schema::address_t> referenced_;
  std::vector<quorum::schema::address_t> signers_;
};

using instruction_handler_t =
    std::function<bool(invoke_context& context, std::string& error)>;

/// Registry of instruction handlers keyed by program id.
class delegate final {
 public:
  /// Register handler for program_id, replacing any previous registration.
  void register_handler(const quorum::schema::program_id_t& program_id,
                        instruction_handler_t handler);

  /// Invoke the handler for action.program_id on behalf of invoker.
  ///
  /// Every account of the action must appear in `referenced`. Signer
  /// accounts must be the transaction signer or the address of an authority
  /// minted by invoker. Returns false and fills error on any failure.
  bool invoke(encoder_t& encoder,
              unit_of_work_t& unit,
              const quorum::schema::program_id_t& invoker,
              const quorum::schema::action_descriptor_t& action,
              std::span<const quorum::schema::address_t> referenced,
              const quorum::schema::identity_key_t& transaction_signer,
              std::span<const quorum::address::derived_authority> authorities,
              std::string& error) const;

 private:
  std::map<quorum::schema::program_id_t, instruction_handler_t> handlers_;
};

}  // namespace quorum::execution
