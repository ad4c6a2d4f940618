#include <spdlog/spdlog.h>
#include <algorithm>
#include <quorum/execution/delegate.hpp>
#include <quorum/schema/key/engine_keys.hpp>
#include <utility>

using namespace quorum::schema;

namespace quorum::execution {

invoke_context::invoke_context(encoder_t& encoder,
                               unit_of_work_t& unit,
                               const action_descriptor_t& action,
                               std::span<const address_t> referenced,
                               std::vector<address_t> signers)
    : encoder_{encoder},
      unit_{unit},
      action_{action},
      referenced_{referenced},
      signers_{std::move(signers)} {}

const program_id_t& invoke_context::program_id() const {
  return action_.program_id;
}

const bytes_t& invoke_context::data() const {
  return action_.data;
}

const std::vector<account_meta_t>& invoke_context::accounts() const {
  return action_.accounts;
}

bool invoke_context::is_signer(const address_t& address) const {
  return std::ranges::find(signers_, address) != std::end(signers_);
}

bool invoke_context::referenced(const address_t& address) const {
  return std::ranges::find(referenced_, address) != std::end(referenced_);
}

const account_meta_t* invoke_context::find_meta(
    const address_t& address) const {
  auto it = std::ranges::find_if(
      action_.accounts,
      [&](const account_meta_t& meta) { return meta.address == address; });
  if (it == std::end(action_.accounts)) {
    return nullptr;
  }
  return &*it;
}

std::optional<record_state_t> invoke_context::load(const address_t& address) {
  if (!referenced(address)) {
    return std::nullopt;
  }
  auto key = key::make_record_key(encoder_, address);
  return unit_.get<record_state_t>(encoder_, bytes_view_t{key.data(), key.size()});
}

bool invoke_context::store(const address_t& address,
                           bytes_t data,
                           std::string& error) {
  const auto* meta = find_meta(address);
  if (meta == nullptr || !meta->is_writable) {
    error = "record is not a writable account of the action";
    return false;
  }
  auto key = key::make_record_key(encoder_, address);
  auto key_view = bytes_view_t{key.data(), key.size()};
  auto existing = unit_.get<record_state_t>(encoder_, key_view);
  if (!existing && !is_signer(address)) {
    error = "creating a record requires the signature of its address";
    return false;
  }
  if (existing && existing->owner != action_.program_id) {
    error = "record is owned by another program";
    return false;
  }
  unit_.put(encoder_, key_view,
            record_state_t{.owner = action_.program_id, .data = std::move(data)});
  return true;
}

void delegate::register_handler(const program_id_t& program_id,
                                instruction_handler_t handler) {
  spdlog::debug("Registering instruction handler {}",
                to_hex(bytes_view_t{program_id.data(), program_id.size()}));
  handlers_.insert_or_assign(program_id, std::move(handler));
}

bool delegate::invoke(
    encoder_t& encoder,
    unit_of_work_t& unit,
    const program_id_t& invoker,
    const action_descriptor_t& action,
    std::span<const address_t> referenced,
    const identity_key_t& transaction_signer,
    std::span<const quorum::address::derived_authority> authorities,
    std::string& error) const {
  auto handler = handlers_.find(action.program_id);
  if (handler == std::end(handlers_)) {
    error = "no instruction handler registered for program " +
            to_hex(bytes_view_t{action.program_id.data(),
                                action.program_id.size()});
    return false;
  }

  auto signers = std::vector<address_t>{transaction_signer};
  for (const auto& authority : authorities) {
    if (authority.program_id() == invoker) {
      signers.push_back(authority.address());
    }
  }

  for (const auto& meta : action.accounts) {
    if (std::ranges::find(referenced, meta.address) == std::end(referenced)) {
      error = "account " +
              to_hex(bytes_view_t{meta.address.data(), meta.address.size()}) +
              " missing from referenced records";
      return false;
    }
    if (meta.is_signer &&
        std::ranges::find(signers, meta.address) == std::end(signers)) {
      error = "account " +
              to_hex(bytes_view_t{meta.address.data(), meta.address.size()}) +
              " requires a signature that was not provided";
      return false;
    }
  }

  auto context =
      invoke_context{encoder, unit, action, referenced, std::move(signers)};
  if (!handler->second(context, error)) {
    if (error.empty()) {
      error = "instruction handler failed";
    }
    return false;
  }
  return true;
}

}  // namespace quorum::execution
