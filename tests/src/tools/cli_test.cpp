#include <gtest/gtest.h>
#include <quorum/address/derive.hpp>
#include <quorum/crypto/verify.hpp>
#include <quorum/execution/defaults.hpp>
#include <quorum/schema/primitives.hpp>
#include <quorum/testing/common.hpp>
#include <quorum/testing/process.hpp>

#include <filesystem>
#include <string>
#include <utility>

#ifndef QUORUM_CLI_PATH
#define QUORUM_CLI_PATH ""
#endif

namespace {

using quorum::testing::run_capture;
using quorum::testing::shell_quote;

class cli_test : public ::testing::Test {
 protected:
  cli_test()
      : db_{quorum::testing::make_db_path("quorum_cli_db")},
        log_{quorum::testing::make_db_path("quorum_cli") + ".log"} {}

  ~cli_test() override {
    quorum::testing::remove_path(db_);
    quorum::testing::remove_path(log_);
  }

  std::pair<int, std::string> run(const std::string& command) {
    return run_capture(shell_quote(QUORUM_CLI_PATH) + " " + command +
                       " --db-path " + shell_quote(db_) + " --log-file " +
                       shell_quote(log_) + " 2>/dev/null");
  }

  std::string db_;
  std::string log_;
};

bool cli_available() {
  auto cli = std::string{QUORUM_CLI_PATH};
  return !cli.empty() && std::filesystem::exists(cli);
}

}  // namespace

TEST_F(cli_test, unknown_command_touches_nothing) {
  if (!cli_available()) {
    GTEST_SKIP() << "quorum binary not available: " << QUORUM_CLI_PATH;
  }

  auto [exit_code, output] = run("transfer");
  EXPECT_EQ(exit_code, 2);
  EXPECT_TRUE(output.empty()) << output;
  EXPECT_FALSE(std::filesystem::exists(db_));
  EXPECT_FALSE(std::filesystem::exists(log_));
}

TEST_F(cli_test, info_opens_database_and_reports_wallet_address) {
  if (!cli_available()) {
    GTEST_SKIP() << "quorum binary not available: " << QUORUM_CLI_PATH;
  }
  if (!quorum::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }

  auto [exit_code, output] = run("info");
  EXPECT_EQ(exit_code, 0) << output;
  EXPECT_TRUE(std::filesystem::exists(db_));

  auto wallet = quorum::address::find_wallet_address(
      quorum::execution::default_program_id());
  auto expected =
      "wallet: " + quorum::schema::to_hex(quorum::schema::bytes_view_t{
                       wallet.address.data(), wallet.address.size()});
  EXPECT_NE(output.find(expected), std::string::npos) << output;

  auto [missing_code, missing] = run("wallet");
  EXPECT_EQ(missing_code, 1);
  EXPECT_NE(missing.find("wallet not initialized"), std::string::npos)
      << missing;
}
