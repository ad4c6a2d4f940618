#pragma once

#include <quorum/blake3/hash.hpp>
#include <quorum/schema/primitives.hpp>
#include <string_view>

// Identifiers used by the command-line tools when none are given.
namespace quorum::execution {

inline constexpr std::string_view kDefaultProgramSeed{"quorum-multisig-program"};
inline constexpr std::string_view kDefaultChainSeed{"quorum-local-chain"};

inline quorum::schema::program_id_t default_program_id() {
  return quorum::blake3::hash(kDefaultProgramSeed);
}

inline quorum::schema::hash32_t default_chain_id() {
  return quorum::blake3::hash(kDefaultChainSeed);
}

}  // namespace quorum::execution
