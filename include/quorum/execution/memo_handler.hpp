#pragma once

#include <quorum/execution/delegate.hpp>
#include <quorum/schema/primitives.hpp>

// Built-in memo instruction: logs the payload and, when the action names a
// writable account, stores the payload there.
namespace quorum::execution {

/// BLAKE3 of "quorum.memo".
quorum::schema::program_id_t memo_program_id();

bool memo_handler(invoke_context& context, std::string& error);

void register_memo_handler(delegate& target);

}  // namespace quorum::execution
