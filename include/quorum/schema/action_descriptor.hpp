#pragma once

#include <quorum/schema/account_meta.hpp>
#include <quorum/schema/primitives.hpp>
#include <vector>

// Schema type: action descriptor.
// Handler-agnostic instruction stored on a proposal: the target handler, the
// records it touches, and an opaque payload.
namespace quorum::schema {

template <uint16_t Version>
struct action_descriptor;

template <>
struct action_descriptor<1> final {
  program_id_t program_id{};
  std::vector<account_meta_t> accounts;
  bytes_t data;
};

using action_descriptor_t = action_descriptor<1>;

}  // namespace quorum::schema
