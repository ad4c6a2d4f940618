#pragma once

#include <quorum/execution/engine.hpp>
#include <quorum/execution/memo_handler.hpp>
#include <quorum/schema/engine_event.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <quorum/testing/common.hpp>
#include <quorum/testing/execution_harness.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace quorum::testing {

inline const quorum::schema::program_id_t kTestProgramId = make_hash(0xA0);
inline const quorum::schema::hash32_t kTestChainId = make_hash(0xC0);

/// Engine over a throwaway RocksDB directory, with the memo handler
/// registered and every delivered event recorded.
class execution_fixture final {
 public:
  explicit execution_fixture(const std::string_view db_prefix,
                             const bool strict_crypto = false)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{quorum::storage::make_storage<
            quorum::storage::rocksdb_storage_tag>(db_path_)},
        engine_{encoder_, storage_,
                quorum::execution::engine_options{
                    .program_id = kTestProgramId,
                    .chain_id = kTestChainId,
                    .require_strict_crypto = strict_crypto}} {
    quorum::execution::register_memo_handler(engine_.execution_delegate());
    engine_.set_event_sink([this](const quorum::schema::engine_event_t& event) {
      events_.push_back(event);
    });
  }

  execution_fixture(const execution_fixture&) = delete;
  execution_fixture& operator=(const execution_fixture&) = delete;
  execution_fixture(execution_fixture&&) = delete;
  execution_fixture& operator=(execution_fixture&&) = delete;

  ~execution_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  scale_encoder_t& encoder() { return encoder_; }

  quorum::storage::storage<quorum::storage::rocksdb_storage_tag>& storage() {
    return storage_;
  }

  quorum::execution::engine& engine() { return engine_; }

  const std::vector<quorum::schema::engine_event_t>& events() const {
    return events_;
  }

 private:
  std::string db_path_;
  scale_encoder_t encoder_;
  quorum::storage::storage<quorum::storage::rocksdb_storage_tag> storage_;
  quorum::execution::engine engine_;
  std::vector<quorum::schema::engine_event_t> events_;
};

}  // namespace quorum::testing
