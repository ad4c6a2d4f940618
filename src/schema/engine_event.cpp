#include <quorum/schema/engine_event.hpp>

#include <string>
#include <utility>

namespace quorum::schema {

namespace {

transaction_event_attribute_t attribute(std::string key,
                                        std::string value,
                                        const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

std::string hex(const hash32_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

}  // namespace

transaction_event_t to_transaction_event(const engine_event_t& event) {
  auto out = transaction_event_t{};
  std::visit(
      overloaded{
          [&](const wallet_initialized_event& value) {
            out.type = "wallet_initialized";
            out.attributes.push_back(attribute("wallet", hex(value.wallet), true));
            for (const auto& signer : value.signers) {
              out.attributes.push_back(attribute("signer", hex(signer)));
            }
            out.attributes.push_back(
                attribute("threshold", std::to_string(value.threshold)));
          },
          [&](const proposal_created_event& value) {
            out.type = "proposal_created";
            out.attributes.push_back(
                attribute("proposal", hex(value.proposal), true));
            out.attributes.push_back(
                attribute("proposer", hex(value.proposer), true));
            out.attributes.push_back(
                attribute("index", std::to_string(value.index)));
          },
          [&](const proposal_approved_event& value) {
            out.type = "proposal_approved";
            out.attributes.push_back(
                attribute("proposal", hex(value.proposal), true));
            out.attributes.push_back(
                attribute("approver", hex(value.approver), true));
            out.attributes.push_back(attribute(
                "approvals_needed", std::to_string(value.approvals_needed)));
            out.attributes.push_back(attribute(
                "current_approvals", std::to_string(value.current_approvals)));
          },
          [&](const proposal_executed_event& value) {
            out.type = "proposal_executed";
            out.attributes.push_back(
                attribute("proposal", hex(value.proposal), true));
            out.attributes.push_back(
                attribute("index", std::to_string(value.index)));
            out.attributes.push_back(attribute(
                "instruction_program", hex(value.instruction_program), true));
          }},
      event);
  return out;
}

}  // namespace quorum::schema
