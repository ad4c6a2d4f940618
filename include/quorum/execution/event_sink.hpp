#pragma once

#include <quorum/schema/engine_event.hpp>
#include <functional>

namespace quorum::execution {

/// Receives engine events after the transaction that raised them commits.
/// Delivery is fire-and-forget; the sink cannot fail a transaction.
using event_sink_t = std::function<void(const quorum::schema::engine_event_t&)>;

}  // namespace quorum::execution
