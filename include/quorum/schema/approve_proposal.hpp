#pragma once

#include <quorum/schema/primitives.hpp>

// Schema type: approve proposal.
namespace quorum::schema {

template <uint16_t Version>
struct approve_proposal;

template <>
struct approve_proposal<1> final {
  address_t proposal{};
};

using approve_proposal_t = approve_proposal<1>;

}  // namespace quorum::schema
