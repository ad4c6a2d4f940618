#pragma once

#include <quorum/schema/primitives.hpp>
#include <vector>

// Schema type: execute proposal.
// remaining_accounts lists every record the target handler needs; the engine
// does not re-derive them.
namespace quorum::schema {

template <uint16_t Version>
struct execute_proposal;

template <>
struct execute_proposal<1> final {
  address_t proposal{};
  std::vector<address_t> remaining_accounts;
};

using execute_proposal_t = execute_proposal<1>;

}  // namespace quorum::schema
