#pragma once

#include <quorum/schema/enum_string.hpp>
#include <quorum/schema/proposal_state.hpp>

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

// Schema type: proposal status.
// Proposal lifecycle: pending until a successful execute, then executed.
// There are no other states.
namespace quorum::schema {

enum class proposal_status_t : uint8_t { pending = 0, executed = 1 };

template <>
struct enum_strings<proposal_status_t> final {
  static constexpr auto values = std::array{
      std::pair<std::string_view, proposal_status_t>{
          "pending", proposal_status_t::pending},
      std::pair<std::string_view, proposal_status_t>{
          "executed", proposal_status_t::executed}};
};

inline proposal_status_t status_of(const proposal_state_t& proposal) {
  return proposal.executed ? proposal_status_t::executed
                           : proposal_status_t::pending;
}

}  // namespace quorum::schema
