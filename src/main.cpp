#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <quorum/execution/defaults.hpp>
#include <quorum/execution/engine.hpp>
#include <quorum/execution/memo_handler.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/proposal_status.hpp>
#include <quorum/schema/query_error_code.hpp>
#include <quorum/schema/transaction_error_code.hpp>
#include <quorum/storage/rocksdb/storage.hpp>
#include <algorithm>
#include <array>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

constexpr auto kCommands = std::array<std::string_view, 6>{
    "submit", "check", "query", "info", "wallet", "proposal"};

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;

std::string hex(const quorum::schema::hash32_t& value) {
  return quorum::schema::to_hex(
      quorum::schema::bytes_view_t{value.data(), value.size()});
}

quorum::schema::hash32_t hash32_option(const po::variables_map& vm,
                                       const std::string& name,
                                       const quorum::schema::hash32_t& fallback) {
  if (!vm.contains(name)) {
    return fallback;
  }
  auto value = quorum::schema::try_make_hash32(vm[name].as<std::string>());
  if (!value) {
    std::cerr << "--" << name << " must be 64 hex characters\n";
    std::exit(2);
  }
  return *value;
}

void print_result(const quorum::schema::transaction_result_t& result) {
  std::cout << "code: " << result.code;
  if (result.code != 0) {
    std::cout << " (" << quorum::schema::to_string(
                             static_cast<quorum::schema::transaction_error_code>(
                                 result.code))
              << ')';
  }
  std::cout << '\n';
  if (!result.log.empty()) {
    std::cout << "log: " << result.log << '\n';
  }
  if (!result.info.empty()) {
    std::cout << "info: " << result.info << '\n';
  }
  if (!result.codespace.empty()) {
    std::cout << "codespace: " << result.codespace << '\n';
  }
  if (!result.data.empty()) {
    std::cout << "data: " << quorum::schema::to_hex(result.data) << '\n';
  }
  for (const auto& event : result.events) {
    std::cout << "event: " << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
}

void print_proposal(const quorum::schema::address_t& address,
                    const quorum::schema::proposal_state_t& proposal) {
  std::cout << "proposal: " << hex(address) << '\n'
            << "index: " << proposal.index << '\n'
            << "proposer: " << hex(proposal.proposer) << '\n'
            << "status: "
            << quorum::schema::to_string(quorum::schema::status_of(proposal))
            << '\n'
            << "program: " << hex(proposal.action.program_id) << '\n'
            << "data: " << quorum::schema::to_hex(proposal.action.data) << '\n';
  for (const auto& account : proposal.action.accounts) {
    std::cout << "account: " << hex(account.address)
              << (account.is_signer ? " signer" : "")
              << (account.is_writable ? " writable" : "") << '\n';
  }
  for (const auto& approval : proposal.approvals) {
    std::cout << "approval: " << hex(approval) << '\n';
  }
}

std::string read_transaction(const po::variables_map& vm) {
  if (vm.contains("tx")) {
    return vm["tx"].as<std::string>();
  }
  auto line = std::string{};
  std::getline(std::cin, line);
  return line;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_path = std::string{};
  auto strict_crypto = true;

  auto vm = po::variables_map{};
  auto description = po::options_description{"Quorum"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "submit|check|query|info|wallet|proposal")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("quorum.db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>(&log_path)->default_value("quorum.log"),
      "Log file path")("program-id", po::value<std::string>(),
                       "32-byte program id hex")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "Verify ed25519 transaction signatures")(
      "tx", po::value<std::string>(),
      "Base64 transaction; read from stdin when absent")(
      "path", po::value<std::string>(), "Query route")(
      "data-hex", po::value<std::string>()->default_value(""),
      "Query data hex")("index", po::value<uint64_t>(), "Proposal index")(
      "proposal", po::value<std::string>(), "Proposal address hex")(
      "verbose,v", "Enable verbose output");
  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  po::store(po::command_line_parser(argc, argv)
                .options(description)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return 0;
  }
  if (std::ranges::find(kCommands, command) == std::end(kCommands)) {
    std::cerr << "unknown command '" << command << "'\n";
    return 2;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "quorum", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto options = quorum::execution::engine_options{
      .program_id = hash32_option(vm, "program-id",
                                  quorum::execution::default_program_id()),
      .chain_id =
          hash32_option(vm, "chain-id", quorum::execution::default_chain_id()),
      .require_strict_crypto = strict_crypto};

  auto encoder = encoder_t{};
  auto storage =
      quorum::storage::make_storage<quorum::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = quorum::execution::engine{encoder, storage, options};
  quorum::execution::register_memo_handler(engine.execution_delegate());
  engine.set_event_sink([](const quorum::schema::engine_event_t& event) {
    auto rendered = quorum::schema::to_transaction_event(event);
    spdlog::info("Event {} with {} attribute(s)", rendered.type,
                 rendered.attributes.size());
  });

  auto exit_code = 0;
  if (command == "submit" || command == "check") {
    auto raw = quorum::schema::try_from_base64(read_transaction(vm));
    if (!raw) {
      std::cerr << "transaction must be base64\n";
      exit_code = 2;
    } else {
      auto view = quorum::schema::bytes_view_t{raw->data(), raw->size()};
      auto result = command == "submit" ? engine.process_transaction(view)
                                        : engine.check_transaction(view);
      print_result(result);
      exit_code = result.code == 0 ? 0 : 1;
    }
  } else if (command == "query") {
    auto data = quorum::schema::try_from_hex(vm["data-hex"].as<std::string>());
    if (!vm.contains("path") || !data) {
      std::cerr << "query requires --path and hex --data-hex\n";
      exit_code = 2;
    } else {
      auto result = engine.query(
          vm["path"].as<std::string>(),
          quorum::schema::bytes_view_t{data->data(), data->size()});
      std::cout << "code: " << result.code << '\n';
      if (result.code != 0) {
        std::cout << "error: "
                  << quorum::schema::to_string(
                         static_cast<quorum::schema::query_error_code>(
                             result.code))
                  << '\n'
                  << "log: " << result.log << '\n';
        if (!result.info.empty()) {
          std::cout << "info: " << result.info << '\n';
        }
        exit_code = 1;
      } else {
        std::cout << "value: " << quorum::schema::to_hex(result.value) << '\n';
      }
    }
  } else if (command == "info") {
    auto info = engine.info();
    std::cout << info.data << ' ' << info.version << '\n'
              << "program: " << hex(info.program_id) << '\n'
              << "chain: " << hex(info.chain_id) << '\n'
              << "wallet: " << hex(engine.wallet_address()) << '\n';
  } else if (command == "wallet") {
    auto wallet = engine.load_wallet();
    if (!wallet) {
      std::cout << "wallet not initialized\n";
      exit_code = 1;
    } else {
      std::cout << "wallet: " << hex(engine.wallet_address()) << '\n'
                << "threshold: " << wallet->threshold << '\n'
                << "proposals: " << wallet->proposal_count << '\n';
      for (const auto& signer : wallet->signers) {
        std::cout << "signer: " << hex(signer) << '\n';
      }
    }
  } else if (command == "proposal") {
    auto address = vm.contains("proposal")
                       ? hash32_option(vm, "proposal", {})
                       : vm.contains("index")
                             ? engine.proposal_address(vm["index"].as<uint64_t>())
                             : quorum::schema::make_zero_hash();
    auto proposal = engine.load_proposal(address);
    if (!proposal) {
      std::cout << "proposal not found\n";
      exit_code = 1;
    } else {
      print_proposal(address, *proposal);
    }
  }

  spdlog::shutdown();
  return exit_code;
}
