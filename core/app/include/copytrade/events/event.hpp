#pragma once

#include "copytrade/domain/execution_result.hpp"
#include "copytrade/domain/trade_signal.hpp"

#include <string>
#include <variant>

namespace copytrade {

// -----------------------------------------------------------------------------
// SignalEvent
// -----------------------------------------------------------------------------
// A copy-trade signal accepted by SignalGateway or CopyTradeEngine::
// pushSignal(), waiting to be executed on the signal loop thread.
// -----------------------------------------------------------------------------
struct SignalEvent {
  domain::TradeSignal signal;
  std::string source;  // "gateway", "api", ...
};

// -----------------------------------------------------------------------------
// ExecutionOutcomeEvent
// -----------------------------------------------------------------------------
// Published on the same bus right after a SignalEvent has been executed, so
// observers (telemetry, tests) see every outcome in signal order.
// -----------------------------------------------------------------------------
struct ExecutionOutcomeEvent {
  std::string trade_id;
  domain::ExecutionResult result;
};

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Envelope carried by the signal loop's EventBus. A variant keeps the
// event set closed and value-typed: subscribers dispatch with std::get_if
// or the typed EventBus::subscribe<T>().
// -----------------------------------------------------------------------------
using Event = std::variant<SignalEvent, ExecutionOutcomeEvent>;

}  // namespace copytrade
