#include <boost/program_options.hpp>
#include <quorum/address/derive.hpp>
#include <quorum/common/critical.hpp>
#include <quorum/crypto/keypair.hpp>
#include <quorum/execution/defaults.hpp>
#include <quorum/execution/memo_handler.hpp>
#include <quorum/execution/signature_verifier.hpp>
#include <quorum/schema/encoding/scale/encoder.hpp>
#include <quorum/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = quorum::schema::encoding::encoder<
    quorum::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string hex(const quorum::schema::hash32_t& value) {
  return quorum::schema::to_hex(
      quorum::schema::bytes_view_t{value.data(), value.size()});
}

quorum::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    quorum::common::critical("missing required --{}", name);
  }
  return quorum::schema::make_hash32(vm[name].as<std::string>());
}

quorum::schema::program_id_t get_program_id(const po::variables_map& vm) {
  if (!vm.contains("program-id")) {
    return quorum::execution::default_program_id();
  }
  return get_hash32(vm, "program-id");
}

quorum::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (!vm.contains("chain-id")) {
    return quorum::execution::default_chain_id();
  }
  return get_hash32(vm, "chain-id");
}

std::vector<quorum::schema::hash32_t> get_hash32_list(
    const po::variables_map& vm,
    const std::string& name) {
  auto out = std::vector<quorum::schema::hash32_t>{};
  if (!vm.contains(name)) {
    return out;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    out.push_back(quorum::schema::make_hash32(value));
  }
  return out;
}

std::optional<quorum::crypto::ed25519_keypair_t> get_keypair(
    const po::variables_map& vm) {
  if (!vm.contains("secret-key-hex")) {
    return std::nullopt;
  }
  auto seed = quorum::crypto::ed25519_seed_t{
      quorum::schema::make_hash32(vm["secret-key-hex"].as<std::string>())};
  auto keypair = quorum::crypto::ed25519_keypair_from_seed(seed);
  if (!keypair) {
    quorum::common::critical("failed to derive ed25519 keypair from seed");
  }
  return keypair;
}

/// Parse "<address hex>[:s][:w]" into an account meta.
quorum::schema::account_meta_t parse_account(const std::string& value) {
  auto text = std::string_view{value};
  auto separator = text.find(':');
  auto meta = quorum::schema::account_meta_t{};
  meta.address = quorum::schema::make_hash32(text.substr(0, separator));
  while (separator != std::string_view::npos) {
    text.remove_prefix(separator + 1);
    separator = text.find(':');
    auto flag = text.substr(0, separator);
    if (flag == "s") {
      meta.is_signer = true;
    } else if (flag == "w") {
      meta.is_writable = true;
    } else {
      quorum::common::critical("account flags must be 's' or 'w'");
    }
  }
  return meta;
}

quorum::schema::address_t get_proposal_address(const po::variables_map& vm) {
  if (vm.contains("proposal")) {
    return get_hash32(vm, "proposal");
  }
  if (!vm.contains("index")) {
    quorum::common::critical("proposal payloads require --proposal or --index");
  }
  auto program_id = get_program_id(vm);
  auto wallet = quorum::address::find_wallet_address(program_id);
  return quorum::address::find_proposal_address(
             program_id, wallet.address, vm["index"].as<uint64_t>())
      .address;
}

quorum::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "initialize_wallet") {
    return quorum::schema::initialize_wallet_t{
        .signers = get_hash32_list(vm, "member"),
        .threshold = vm["threshold"].as<uint64_t>()};
  }
  if (payload == "create_proposal") {
    auto proposal = quorum::schema::create_proposal_t{};
    if (vm.contains("memo")) {
      proposal.instruction_program = quorum::execution::memo_program_id();
      proposal.instruction_data =
          quorum::schema::make_bytes(vm["memo"].as<std::string>());
    } else {
      proposal.instruction_program = get_hash32(vm, "instruction-program");
      proposal.instruction_data = quorum::schema::from_hex(
          vm["instruction-data-hex"].as<std::string>());
    }
    if (vm.contains("account")) {
      for (const auto& value : vm["account"].as<std::vector<std::string>>()) {
        proposal.instruction_accounts.push_back(parse_account(value));
      }
    }
    return proposal;
  }
  if (payload == "approve_proposal") {
    return quorum::schema::approve_proposal_t{.proposal =
                                                  get_proposal_address(vm)};
  }
  if (payload == "execute_proposal") {
    return quorum::schema::execute_proposal_t{
        .proposal = get_proposal_address(vm),
        .remaining_accounts = get_hash32_list(vm, "remaining")};
  }
  quorum::common::critical(
      "--payload must be "
      "initialize_wallet|create_proposal|approve_proposal|execute_proposal");
}

quorum::schema::transaction_t build_transaction(const po::variables_map& vm) {
  auto keypair = get_keypair(vm);
  auto transaction = quorum::schema::transaction_t{
      .version = 1,
      .chain_id = get_chain_id(vm),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = keypair ? keypair->public_key : get_hash32(vm, "signer"),
      .payload = build_payload(vm),
      .signature = {}};

  if (keypair) {
    auto encoder = encoder_t{};
    auto message = quorum::execution::make_signing_message(encoder, transaction);
    auto signature = quorum::crypto::sign(
        quorum::schema::bytes_view_t{message.data(), message.size()},
        *keypair);
    if (!signature) {
      quorum::common::critical("failed to sign transaction");
    }
    transaction.signature = *signature;
  } else if (vm.contains("signature-hex")) {
    auto bytes =
        quorum::schema::from_hex(vm["signature-hex"].as<std::string>());
    if (bytes.size() != transaction.signature.size()) {
      quorum::common::critical("ed25519 signature must be 64 bytes");
    }
    std::ranges::copy(bytes, std::begin(transaction.signature));
  }
  return transaction;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction --payload <type> [options]\n"
            << "  transaction_builder address [--index N]\n"
            << "  transaction_builder keygen [--secret-key-hex HEX]\n"
            << "  transaction_builder chain-id\n"
            << "  transaction_builder program-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|address|keygen|chain-id|program-id")(
      "payload", po::value<std::string>(),
      "initialize_wallet|create_proposal|approve_proposal|execute_proposal")(
      "program-id", po::value<std::string>(), "32-byte program id hex")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "secret-key-hex", po::value<std::string>(),
      "32-byte ed25519 seed hex; sets signer and signs")(
      "signer", po::value<std::string>(),
      "signer public key hex when not signing")(
      "signature-hex", po::value<std::string>(),
      "precomputed 64-byte signature hex when not signing")(
      "member", po::value<std::vector<std::string>>()->multitoken(),
      "wallet signer public key hex values")(
      "threshold", po::value<uint64_t>()->default_value(1),
      "approval threshold")("memo", po::value<std::string>(),
                            "memo text; targets the built-in memo handler")(
      "instruction-program", po::value<std::string>(),
      "target handler program id hex")(
      "instruction-data-hex", po::value<std::string>()->default_value(""),
      "instruction payload hex")(
      "account", po::value<std::vector<std::string>>()->multitoken(),
      "instruction account as <address hex>[:s][:w]")(
      "proposal", po::value<std::string>(), "proposal address hex")(
      "index", po::value<uint64_t>(), "proposal index")(
      "remaining", po::value<std::vector<std::string>>()->multitoken(),
      "referenced record address hex values for execution");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      quorum::common::critical("transaction mode requires --payload");
    }
    auto encoded = encoder_t{}.encode(build_transaction(vm));
    std::cout << quorum::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "address") {
    auto program_id = get_program_id(vm);
    auto wallet = quorum::address::find_wallet_address(program_id);
    if (!vm.contains("index")) {
      std::cout << hex(wallet.address) << '\n';
      return 0;
    }
    auto proposal = quorum::address::find_proposal_address(
        program_id, wallet.address, vm["index"].as<uint64_t>());
    std::cout << hex(proposal.address) << '\n';
    return 0;
  }

  if (command == "keygen") {
    auto keypair = vm.contains("secret-key-hex")
                       ? get_keypair(vm)
                       : quorum::crypto::generate_ed25519_keypair();
    if (!keypair) {
      quorum::common::critical("failed to generate ed25519 keypair");
    }
    std::cout << hex(keypair->seed) << ' ' << hex(keypair->public_key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  if (command == "program-id") {
    std::cout << hex(get_program_id(vm)) << '\n';
    return 0;
  }

  quorum::common::critical(
      "command must be transaction|address|keygen|chain-id|program-id");
}
