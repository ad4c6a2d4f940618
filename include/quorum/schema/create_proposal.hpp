#pragma once

#include <quorum/schema/account_meta.hpp>
#include <quorum/schema/primitives.hpp>
#include <vector>

// Schema type: create proposal.
namespace quorum::schema {

template <uint16_t Version>
struct create_proposal;

template <>
struct create_proposal<1> final {
  bytes_t instruction_data;
  program_id_t instruction_program{};
  std::vector<account_meta_t> instruction_accounts;
};

using create_proposal_t = create_proposal<1>;

}  // namespace quorum::schema
