#pragma once

#include "copytrade/domain/decimal.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace copytrade {
namespace domain {

// -----------------------------------------------------------------------------
// CircuitBreakerState: immutable risk-status snapshot
// -----------------------------------------------------------------------------
//
// @brief  Everything the circuit breaker knows, as one value.
//
// @details
// CircuitBreaker never edits its live state field by field. Every operation
// copies the current value, computes the complete successor, and swaps it in
// under the breaker mutex. Readers receive copies via snapshot().
//
// Invariants:
//   - daily_loss >= 0 and consecutive_losses >= 0; both only grow within one
//     UTC day (they are zeroed by the daily rollover; a profit zeroes only
//     consecutive_losses).
//   - active implies reason and activated_at_ms are set.
//   - cooldown_until_ms = activated_at_ms + cooldown while active.
//
// last_reset_day is a UTC day number (days since 1970-01-01, see utcDay()).
// total_trades / failed_trades are telemetry counters fed by
// recordTradeResult(); they never activate the breaker.
// -----------------------------------------------------------------------------
struct CircuitBreakerState {
  bool active{false};
  std::optional<std::string> reason;
  std::optional<std::int64_t> activated_at_ms;
  std::optional<std::int64_t> cooldown_until_ms;
  Decimal daily_loss;
  Decimal max_daily_loss;
  int consecutive_losses{0};
  int consecutive_loss_threshold{5};
  std::int64_t last_reset_day{0};
  std::uint64_t total_trades{0};
  std::uint64_t failed_trades{0};
};

bool operator==(const CircuitBreakerState& a, const CircuitBreakerState& b);
bool operator!=(const CircuitBreakerState& a, const CircuitBreakerState& b);

// -----------------------------------------------------------------------------
// TradeGate: result of CircuitBreaker::checkTradeAllowed()
// -----------------------------------------------------------------------------
// Either the trade may proceed, or it is blocked with a reason and a
// human-readable recovery ETA ("45 minutes", "1h 15m").
// -----------------------------------------------------------------------------
struct TradeAllowed {};

struct TradeBlocked {
  std::string reason;
  std::string recovery_eta;
  std::int64_t remaining_ms{0};
};

using TradeGate = std::variant<TradeAllowed, TradeBlocked>;

inline bool isAllowed(const TradeGate& gate) {
  return std::holds_alternative<TradeAllowed>(gate);
}

}  // namespace domain
}  // namespace copytrade
