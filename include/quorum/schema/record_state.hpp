#pragma once

#include <quorum/schema/primitives.hpp>

// Schema type: record state.
// Envelope for everything stored at an address. Only the owning program may
// rewrite the data.
namespace quorum::schema {

template <uint16_t Version>
struct record_state;

template <>
struct record_state<1> final {
  uint16_t version{1};
  program_id_t owner{};
  bytes_t data;
};

using record_state_t = record_state<1>;

}  // namespace quorum::schema
