#pragma once

#include <quorum/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

// Derived authority addressing.
//
// A derived address is a BLAKE3 digest of (program id, seeds, bump). No secret
// key exists for it; the only way to act on its behalf is to reproduce the
// derivation, which mints a derived_authority scoped to the deriving program.
namespace quorum::address {

inline constexpr std::string_view kWalletDomain{"wallet"};
inline constexpr std::string_view kProposalDomain{"proposal"};
inline constexpr uint8_t kMaxBump{255};

using seed_view_t = quorum::schema::bytes_view_t;

struct derived_address_t final {
  quorum::schema::address_t address{};
  uint8_t bump{};
};

quorum::schema::address_t create_derived_address(
    const quorum::schema::program_id_t& program_id,
    std::span<const seed_view_t> seeds,
    uint8_t bump);

/// Search bumps from kMaxBump downward for the first usable address.
derived_address_t find_derived_address(
    const quorum::schema::program_id_t& program_id,
    std::span<const seed_view_t> seeds);

/// True when `address` is the derivation of (program_id, seeds, bump).
bool verify_derived_address(const quorum::schema::address_t& address,
                            const quorum::schema::program_id_t& program_id,
                            std::span<const seed_view_t> seeds,
                            uint8_t bump);

/// Seeds of the deployment's wallet: ["wallet"].
std::vector<quorum::schema::bytes_t> wallet_seeds();

/// Seeds of a proposal: ["proposal", wallet, index as u64 little-endian].
std::vector<quorum::schema::bytes_t> proposal_seeds(
    const quorum::schema::address_t& wallet,
    uint64_t index);

std::vector<seed_view_t> make_seed_views(
    const std::vector<quorum::schema::bytes_t>& seeds);

derived_address_t find_wallet_address(
    const quorum::schema::program_id_t& program_id);

derived_address_t find_proposal_address(
    const quorum::schema::program_id_t& program_id,
    const quorum::schema::address_t& wallet,
    uint64_t index);

/// Capability to sign for a derived address, valid only for calls made by
/// the program that minted it.
class derived_authority final {
 public:
  static derived_authority mint(const quorum::schema::program_id_t& program_id,
                                std::span<const seed_view_t> seeds,
                                uint8_t bump);

  const quorum::schema::address_t& address() const { return address_; }
  const quorum::schema::program_id_t& program_id() const {
    return program_id_;
  }

 private:
  derived_authority(const quorum::schema::address_t& address,
                    const quorum::schema::program_id_t& program_id)
      : address_{address}, program_id_{program_id} {}

  quorum::schema::address_t address_;
  quorum::schema::program_id_t program_id_;
};

}  // namespace quorum::address
