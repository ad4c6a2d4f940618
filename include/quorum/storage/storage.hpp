#pragma once
#include <quorum/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace quorum::storage {

/// Outcome of committing a unit of work.
///
/// `conflict` means another writer committed a change to a key this unit had
/// read; nothing from the unit was applied.
enum class commit_status : uint8_t { committed = 0, conflict = 1 };

/// All-or-nothing batch of reads and writes.
///
/// Keys read through `get` are tracked; `commit` fails with
/// commit_status::conflict if any of them changed after it was read. A unit
/// that is destroyed without a successful commit is rolled back.
template <typename Library>
struct unit_of_work {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quorum::schema::bytes_view_t& key);

  /// Encode and stage value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const quorum::schema::bytes_view_t& key,
           const T& value);

  commit_status commit();
  void rollback();
};

template <typename Library>
struct storage {
  /// Decode and return committed value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quorum::schema::bytes_view_t& key) const;

  /// Open a new unit of work against the latest committed state.
  unit_of_work<Library> begin() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace quorum::storage
