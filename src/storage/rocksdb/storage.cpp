#include <quorum/common/critical.hpp>
#include <quorum/storage/rocksdb/storage.hpp>

namespace quorum::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  // Keep flushed memtables around so optimistic validation can still see
  // writes that raced a flush instead of failing with TryAgain.
  options.max_write_buffer_size_to_maintain =
      static_cast<int64_t>(options.write_buffer_size) * 4;

  ROCKSDB_NAMESPACE::OptimisticTransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::OptimisticTransactionDB::Open(
      options, std::string{path}, &database);
  if (!status.ok()) {
    quorum::common::critical("Failed to open RocksDB at {}: {}", path,
                             status.ToString());
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace quorum::storage
