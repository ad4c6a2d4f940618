#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/optimistic_transaction_db.h>
#include <rocksdb/utilities/transaction.h>
#include <spdlog/spdlog.h>
#include <quorum/common/critical.hpp>
#include <quorum/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace quorum::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const quorum::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline quorum::schema::bytes_view_t to_bytes_view(const std::string& value) {
  return quorum::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
class unit_of_work<rocksdb_storage_tag> final {
 public:
  explicit unit_of_work(std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle)
      : handle_{std::move(handle)} {}

  unit_of_work(const unit_of_work&) = delete;
  unit_of_work& operator=(const unit_of_work&) = delete;
  unit_of_work(unit_of_work&&) noexcept = default;
  unit_of_work& operator=(unit_of_work&&) noexcept = default;

  ~unit_of_work() {
    if (handle_ && !finished_) {
      rollback();
    }
  }

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quorum::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const quorum::schema::bytes_view_t& key,
           const T& value);

  commit_status commit();
  void rollback();

 private:
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle_;
  bool finished_{false};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::OptimisticTransactionDB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quorum::schema::bytes_view_t& key) const;

  unit_of_work<rocksdb_storage_tag> begin() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> unit_of_work<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const quorum::schema::bytes_view_t& key) {
  if (!handle_ || finished_) {
    quorum::common::critical("unit of work is not active");
  }
  auto value = std::string{};
  // GetForUpdate registers the key for conflict validation at commit.
  auto status = handle_->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                      detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    quorum::common::critical("Failed to read key in unit of work: {}",
                             status.ToString());
  }
  return {encoder.template decode<T>(detail::to_bytes_view(value))};
}

template <typename T, typename Encoder>
void unit_of_work<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const quorum::schema::bytes_view_t& key,
    const T& value) {
  if (!handle_ || finished_) {
    quorum::common::critical("unit of work is not active");
  }
  auto encoded_value = encoder.encode(value);
  auto status = handle_->Put(
      detail::to_slice(key),
      detail::to_slice(quorum::schema::bytes_view_t{encoded_value.data(),
                                                    encoded_value.size()}));
  if (!status.ok()) {
    quorum::common::critical("Failed to stage write in unit of work: {}",
                             status.ToString());
  }
}

inline commit_status unit_of_work<rocksdb_storage_tag>::commit() {
  if (!handle_ || finished_) {
    quorum::common::critical("unit of work is not active");
  }
  auto status = handle_->Commit();
  finished_ = true;
  if (status.ok()) {
    return commit_status::committed;
  }
  if (status.IsBusy() || status.IsTryAgain()) {
    spdlog::debug("Unit of work rejected by conflict check: {}",
                  status.ToString());
    return commit_status::conflict;
  }
  quorum::common::critical("Failed to commit unit of work: {}",
                           status.ToString());
}

inline void unit_of_work<rocksdb_storage_tag>::rollback() {
  if (!handle_ || finished_) {
    return;
  }
  finished_ = true;
  auto status = handle_->Rollback();
  if (!status.ok()) {
    quorum::common::critical("Failed to roll back unit of work: {}",
                             status.ToString());
  }
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const quorum::schema::bytes_view_t& key) const {
  if (!database) {
    quorum::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      quorum::common::critical("Failed to get value from RocksDB: {}",
                               status.ToString());
    }
  }
  return {encoder.template decode<T>(detail::to_bytes_view(value))};
}

inline unit_of_work<rocksdb_storage_tag> storage<rocksdb_storage_tag>::begin()
    const {
  if (!database) {
    quorum::common::critical("RocksDB database is not initialized");
  }
  auto handle =
      std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{database->BeginTransaction(
          ROCKSDB_NAMESPACE::WriteOptions{},
          ROCKSDB_NAMESPACE::OptimisticTransactionOptions{})};
  if (!handle) {
    quorum::common::critical("Failed to begin RocksDB transaction");
  }
  return unit_of_work<rocksdb_storage_tag>{std::move(handle)};
}

}  // namespace quorum::storage
