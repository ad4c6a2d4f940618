#include <spdlog/spdlog.h>
#include <algorithm>
#include <quorum/blake3/hash.hpp>
#include <quorum/execution/memo_handler.hpp>

namespace quorum::execution {

quorum::schema::program_id_t memo_program_id() {
  return quorum::blake3::hash(std::string_view{"quorum.memo"});
}

bool memo_handler(invoke_context& context, std::string& error) {
  if (context.data().empty()) {
    error = "memo must not be empty";
    return false;
  }
  spdlog::info("Memo: {}", quorum::schema::make_string_view(context.data()));

  const auto& accounts = context.accounts();
  auto target = std::ranges::find_if(
      accounts, [](const quorum::schema::account_meta_t& meta) {
        return meta.is_writable;
      });
  if (target == std::end(accounts)) {
    return true;
  }
  return context.store(target->address, context.data(), error);
}

void register_memo_handler(delegate& target) {
  target.register_handler(memo_program_id(), memo_handler);
}

}  // namespace quorum::execution
