#include <quorum/blake3/hash.hpp>

#include <tuple>

namespace quorum::blake3 {

static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<quorum::schema::hash32_t>);

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const quorum::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

quorum::schema::hash32_t hasher::finalize() const {
  // Finalizing does not consume the state, so more input may follow.
  auto output = quorum::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

quorum::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

quorum::schema::hash32_t hash(const quorum::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace quorum::blake3
