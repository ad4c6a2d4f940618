#pragma once

#include <quorum/schema/primitives.hpp>

// Schema type: account meta.
// One record referenced by an action, with the privileges the action expects
// for it.
namespace quorum::schema {

template <uint16_t Version>
struct account_meta;

template <>
struct account_meta<1> final {
  address_t address{};
  bool is_signer{};
  bool is_writable{};
};

using account_meta_t = account_meta<1>;

}  // namespace quorum::schema
