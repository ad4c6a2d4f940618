#include <quorum/address/derive.hpp>
#include <quorum/blake3/hash.hpp>
#include <quorum/common/critical.hpp>
#include <quorum/schema/key/builder.hpp>

#include <algorithm>
#include <iterator>

namespace quorum::address {

namespace {

constexpr auto kDerivationMarker = std::string_view{"quorum/derived-address"};

bool usable(const quorum::schema::address_t& candidate,
            const quorum::schema::program_id_t& program_id) {
  return candidate != quorum::schema::make_zero_hash() &&
         candidate != program_id;
}

}  // namespace

quorum::schema::address_t create_derived_address(
    const quorum::schema::program_id_t& program_id,
    std::span<const seed_view_t> seeds,
    const uint8_t bump) {
  auto lengths = quorum::schema::key::builder{};
  lengths.write(static_cast<uint32_t>(seeds.size()));
  auto hasher = quorum::blake3::hasher{};
  hasher.update(kDerivationMarker).update(program_id).update(lengths.data);
  for (const auto& seed : seeds) {
    auto framed = quorum::schema::key::builder{};
    framed.write_sized(seed);
    hasher.update(framed.data);
  }
  hasher.update(quorum::schema::bytes_view_t{&bump, 1});
  return hasher.finalize();
}

derived_address_t find_derived_address(
    const quorum::schema::program_id_t& program_id,
    std::span<const seed_view_t> seeds) {
  for (auto bump = static_cast<int>(kMaxBump); bump >= 0; --bump) {
    auto candidate =
        create_derived_address(program_id, seeds, static_cast<uint8_t>(bump));
    if (usable(candidate, program_id)) {
      return derived_address_t{.address = candidate,
                               .bump = static_cast<uint8_t>(bump)};
    }
  }
  // 256 consecutive BLAKE3 outputs equal to the zero hash or the program id
  // cannot happen.
  quorum::common::critical("unable to find a derived address");
}

bool verify_derived_address(const quorum::schema::address_t& address,
                            const quorum::schema::program_id_t& program_id,
                            std::span<const seed_view_t> seeds,
                            const uint8_t bump) {
  return create_derived_address(program_id, seeds, bump) == address;
}

std::vector<quorum::schema::bytes_t> wallet_seeds() {
  return {quorum::schema::make_bytes(kWalletDomain)};
}

std::vector<quorum::schema::bytes_t> proposal_seeds(
    const quorum::schema::address_t& wallet,
    const uint64_t index) {
  auto encoded_index = quorum::schema::key::builder{};
  encoded_index.write(index);
  return {quorum::schema::make_bytes(kProposalDomain),
          quorum::schema::bytes_t{std::begin(wallet), std::end(wallet)},
          std::move(encoded_index.data)};
}

std::vector<seed_view_t> make_seed_views(
    const std::vector<quorum::schema::bytes_t>& seeds) {
  auto views = std::vector<seed_view_t>{};
  views.reserve(seeds.size());
  std::ranges::transform(seeds, std::back_inserter(views),
                         [](const quorum::schema::bytes_t& seed) {
                           return seed_view_t{seed.data(), seed.size()};
                         });
  return views;
}

derived_address_t find_wallet_address(
    const quorum::schema::program_id_t& program_id) {
  auto seeds = wallet_seeds();
  return find_derived_address(program_id, make_seed_views(seeds));
}

derived_address_t find_proposal_address(
    const quorum::schema::program_id_t& program_id,
    const quorum::schema::address_t& wallet,
    const uint64_t index) {
  auto seeds = proposal_seeds(wallet, index);
  return find_derived_address(program_id, make_seed_views(seeds));
}

derived_authority derived_authority::mint(
    const quorum::schema::program_id_t& program_id,
    std::span<const seed_view_t> seeds,
    const uint8_t bump) {
  return derived_authority{create_derived_address(program_id, seeds, bump),
                           program_id};
}

}  // namespace quorum::address
