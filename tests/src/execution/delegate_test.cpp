#include <quorum/address/derive.hpp>
#include <quorum/execution/delegate.hpp>
#include <quorum/execution/memo_handler.hpp>
#include <quorum/schema/key/engine_keys.hpp>
#include <quorum/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = quorum::execution::encoder_t;
using storage_t =
    quorum::storage::storage<quorum::storage::rocksdb_storage_tag>;

const auto kInvoker = quorum::testing::make_hash(0x70);
const auto kHandlerProgram = quorum::testing::make_hash(0x80);
const auto kExecutor = quorum::testing::make_hash(0x90);

class delegate_test : public ::testing::Test {
 protected:
  delegate_test()
      : db_{quorum::testing::make_db_path("quorum_delegate")},
        storage_{quorum::storage::make_storage<
            quorum::storage::rocksdb_storage_tag>(db_)} {
    delegate_.register_handler(
        kHandlerProgram,
        [this](quorum::execution::invoke_context& context, std::string&) {
          ++calls_;
          seen_data_ = context.data();
          return true;
        });
  }

  ~delegate_test() override {
    storage_.database.reset();
    quorum::testing::remove_path(db_);
  }

  bool invoke(const quorum::schema::action_descriptor_t& action,
              const std::vector<quorum::schema::address_t>& referenced,
              std::span<const quorum::address::derived_authority> authorities,
              std::string& error) {
    auto unit = storage_.begin();
    auto ok = delegate_.invoke(encoder_, unit, kInvoker, action, referenced,
                               kExecutor, authorities, error);
    if (ok) {
      EXPECT_EQ(unit.commit(), quorum::storage::commit_status::committed);
    }
    return ok;
  }

  std::optional<quorum::schema::record_state_t> record_at(
      const quorum::schema::address_t& address) {
    auto key = quorum::schema::key::make_record_key(encoder_, address);
    return storage_.get<quorum::schema::record_state_t>(
        encoder_, quorum::schema::bytes_view_t{key.data(), key.size()});
  }

  quorum::address::derived_authority wallet_authority(
      const quorum::schema::program_id_t& program) {
    auto seeds = quorum::address::wallet_seeds();
    auto derived = quorum::address::find_wallet_address(program);
    return quorum::address::derived_authority::mint(
        program, quorum::address::make_seed_views(seeds), derived.bump);
  }

  std::string db_;
  storage_t storage_;
  encoder_t encoder_;
  quorum::execution::delegate delegate_;
  int calls_{};
  quorum::schema::bytes_t seen_data_;
};

}  // namespace

TEST_F(delegate_test, invokes_registered_handler_with_action_data) {
  auto action = quorum::schema::action_descriptor_t{
      .program_id = kHandlerProgram,
      .accounts = {},
      .data = quorum::schema::bytes_t{0x01, 0x02}};
  auto error = std::string{};
  EXPECT_TRUE(invoke(action, {}, {}, error)) << error;
  EXPECT_EQ(calls_, 1);
  EXPECT_EQ(seen_data_, action.data);
}

TEST_F(delegate_test, unknown_program_fails) {
  auto action = quorum::schema::action_descriptor_t{
      .program_id = quorum::testing::make_hash(0x81)};
  auto error = std::string{};
  EXPECT_FALSE(invoke(action, {}, {}, error));
  EXPECT_NE(error.find("no instruction handler"), std::string::npos);
  EXPECT_EQ(calls_, 0);
}

TEST_F(delegate_test, accounts_must_be_referenced) {
  auto account = quorum::testing::make_hash(0x20);
  auto action = quorum::schema::action_descriptor_t{
      .program_id = kHandlerProgram,
      .accounts = {quorum::schema::account_meta_t{.address = account}}};
  auto error = std::string{};
  EXPECT_FALSE(invoke(action, {}, {}, error));
  EXPECT_NE(error.find("missing from referenced records"), std::string::npos);
  EXPECT_EQ(calls_, 0);

  error.clear();
  EXPECT_TRUE(invoke(action, {account}, {}, error)) << error;
  EXPECT_EQ(calls_, 1);
}

TEST_F(delegate_test, signer_accounts_accept_executor_and_invoker_authority) {
  auto authority = wallet_authority(kInvoker);
  auto action = quorum::schema::action_descriptor_t{
      .program_id = kHandlerProgram,
      .accounts = {quorum::schema::account_meta_t{.address = kExecutor,
                                                  .is_signer = true},
                   quorum::schema::account_meta_t{
                       .address = authority.address(), .is_signer = true}}};
  auto referenced =
      std::vector<quorum::schema::address_t>{kExecutor, authority.address()};

  auto error = std::string{};
  EXPECT_FALSE(invoke(action, referenced, {}, error));
  EXPECT_NE(error.find("requires a signature"), std::string::npos);

  error.clear();
  EXPECT_TRUE(invoke(action, referenced,
                     std::span<const quorum::address::derived_authority>{
                         &authority, 1},
                     error))
      << error;
}

TEST_F(delegate_test, authority_minted_by_another_program_is_not_a_signature) {
  auto foreign = wallet_authority(quorum::testing::make_hash(0x71));
  auto action = quorum::schema::action_descriptor_t{
      .program_id = kHandlerProgram,
      .accounts = {quorum::schema::account_meta_t{.address = foreign.address(),
                                                  .is_signer = true}}};
  auto error = std::string{};
  EXPECT_FALSE(invoke(action, {foreign.address()},
                      std::span<const quorum::address::derived_authority>{
                          &foreign, 1},
                      error));
  EXPECT_EQ(calls_, 0);
}

TEST_F(delegate_test, store_requires_writable_account_and_ownership) {
  auto unsigned_target = quorum::testing::make_hash(0x30);
  auto readonly = quorum::testing::make_hash(0x31);
  auto foreign = quorum::testing::make_hash(0x32);
  auto storer = quorum::testing::make_hash(0x82);

  {
    auto unit = storage_.begin();
    auto key = quorum::schema::key::make_record_key(encoder_, foreign);
    unit.put(encoder_, quorum::schema::bytes_view_t{key.data(), key.size()},
             quorum::schema::record_state_t{
                 .owner = quorum::testing::make_hash(0x99),
                 .data = quorum::schema::bytes_t{0xEE}});
    ASSERT_EQ(unit.commit(), quorum::storage::commit_status::committed);
  }

  auto results = std::vector<bool>{};
  auto errors = std::vector<std::string>{};
  delegate_.register_handler(
      storer, [&](quorum::execution::invoke_context& context, std::string&) {
        for (const auto& address :
             {kExecutor, unsigned_target, readonly, foreign}) {
          auto error = std::string{};
          results.push_back(context.store(
              address, quorum::schema::bytes_t{0x42}, error));
          errors.push_back(error);
        }
        EXPECT_FALSE(
            context.load(quorum::testing::make_hash(0x33)).has_value());
        EXPECT_TRUE(context.load(foreign).has_value());
        return true;
      });

  auto action = quorum::schema::action_descriptor_t{
      .program_id = storer,
      .accounts = {
          quorum::schema::account_meta_t{.address = kExecutor,
                                         .is_signer = true,
                                         .is_writable = true},
          quorum::schema::account_meta_t{.address = unsigned_target,
                                         .is_writable = true},
          quorum::schema::account_meta_t{.address = readonly},
          quorum::schema::account_meta_t{.address = foreign,
                                         .is_writable = true}}};
  auto error = std::string{};
  ASSERT_TRUE(invoke(action, {kExecutor, unsigned_target, readonly, foreign},
                     {}, error))
      << error;

  ASSERT_EQ(results.size(), 4u);
  EXPECT_TRUE(results[0]);
  EXPECT_FALSE(results[1]);
  EXPECT_NE(errors[1].find("requires the signature"), std::string::npos);
  EXPECT_FALSE(results[2]);
  EXPECT_NE(errors[2].find("not a writable account"), std::string::npos);
  EXPECT_FALSE(results[3]);
  EXPECT_NE(errors[3].find("owned by another program"), std::string::npos);

  auto stored = record_at(kExecutor);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->owner, storer);
  EXPECT_EQ(stored->data, (quorum::schema::bytes_t{0x42}));
  EXPECT_FALSE(record_at(unsigned_target).has_value());
  EXPECT_FALSE(record_at(readonly).has_value());
  EXPECT_EQ(record_at(foreign)->data, (quorum::schema::bytes_t{0xEE}));
}

TEST_F(delegate_test, owned_record_can_be_rewritten_without_signature) {
  auto target = quorum::testing::make_hash(0x34);
  auto writer = quorum::testing::make_hash(0x84);
  auto payload = quorum::schema::bytes_t{0x01};
  delegate_.register_handler(
      writer,
      [&](quorum::execution::invoke_context& context, std::string& error) {
        return context.store(target, payload, error);
      });
  auto action = quorum::schema::action_descriptor_t{
      .program_id = writer,
      .accounts = {quorum::schema::account_meta_t{.address = target,
                                                  .is_writable = true}}};

  auto error = std::string{};
  EXPECT_FALSE(invoke(action, {target}, {}, error));
  EXPECT_NE(error.find("requires the signature"), std::string::npos);
  EXPECT_FALSE(record_at(target).has_value());

  {
    auto unit = storage_.begin();
    auto key = quorum::schema::key::make_record_key(encoder_, target);
    unit.put(encoder_, quorum::schema::bytes_view_t{key.data(), key.size()},
             quorum::schema::record_state_t{.owner = writer});
    ASSERT_EQ(unit.commit(), quorum::storage::commit_status::committed);
  }
  error.clear();
  payload = quorum::schema::bytes_t{0x02};
  EXPECT_TRUE(invoke(action, {target}, {}, error)) << error;
  EXPECT_EQ(record_at(target)->data, payload);
}

TEST_F(delegate_test, handler_failure_reports_error) {
  auto failing = quorum::testing::make_hash(0x83);
  delegate_.register_handler(
      failing, [](quorum::execution::invoke_context&, std::string& error) {
        error = "refused";
        return false;
      });
  auto error = std::string{};
  EXPECT_FALSE(invoke(quorum::schema::action_descriptor_t{.program_id = failing},
                      {}, {}, error));
  EXPECT_EQ(error, "refused");
}

TEST_F(delegate_test, memo_requires_data_and_stores_into_writable_account) {
  quorum::execution::register_memo_handler(delegate_);
  auto target = kExecutor;

  auto error = std::string{};
  EXPECT_FALSE(invoke(quorum::schema::action_descriptor_t{
                          .program_id = quorum::execution::memo_program_id()},
                      {}, {}, error));
  EXPECT_EQ(error, "memo must not be empty");

  auto memo = quorum::schema::make_bytes(std::string_view{"pay rent"});
  auto action = quorum::schema::action_descriptor_t{
      .program_id = quorum::execution::memo_program_id(),
      .accounts = {quorum::schema::account_meta_t{.address = target,
                                                  .is_signer = true,
                                                  .is_writable = true}},
      .data = memo};
  error.clear();
  ASSERT_TRUE(invoke(action, {target}, {}, error)) << error;
  auto stored = record_at(target);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->data, memo);
  EXPECT_EQ(stored->owner, quorum::execution::memo_program_id());
}
