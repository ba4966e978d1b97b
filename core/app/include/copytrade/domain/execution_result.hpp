#pragma once

#include "copytrade/domain/decimal.hpp"

#include <string>
#include <variant>

namespace copytrade {
namespace domain {

// -----------------------------------------------------------------------------
// ExecutionResult: outcome of TradeExecutionCoordinator::executeCopyTrade()
// -----------------------------------------------------------------------------
//
//   Submitted  order placed, position opened.
//   Skipped    nothing was sent to the exchange: breaker blocked the trade,
//              the signal failed validation, or sizing was impossible.
//   Failed     the exchange (or an internal fault) rejected the attempt. No
//              position and no lock are left behind.
// -----------------------------------------------------------------------------
struct Submitted {
  std::string trade_id;
  std::string order_id;
  std::string position_id;
  Decimal size;
  Decimal entry_price;
};

enum class SkipKind {
  CircuitBreaker,
  ValidationError,
};

struct Skipped {
  std::string trade_id;
  SkipKind kind{SkipKind::ValidationError};
  std::string reason;
  std::string recovery_eta;  // set only for SkipKind::CircuitBreaker
};

struct Failed {
  std::string trade_id;
  std::string reason;
};

using ExecutionResult = std::variant<Submitted, Skipped, Failed>;

inline const char* toString(SkipKind kind) {
  return kind == SkipKind::CircuitBreaker ? "CircuitBreaker"
                                          : "ValidationError";
}

// -----------------------------------------------------------------------------
// CloseResult: outcome of closing one position
// -----------------------------------------------------------------------------
// AlreadyClosed is the idempotent no-op (position absent or not Open) and is
// a success. Failed leaves the position Open for the next supervision pass.
// -----------------------------------------------------------------------------
enum class CloseOutcome {
  Closed,
  AlreadyClosed,
  Failed,
};

struct CloseResult {
  CloseOutcome outcome{CloseOutcome::AlreadyClosed};
  std::string position_id;
  std::string reason;
  Decimal realized_pnl;
};

inline const char* toString(CloseOutcome outcome) {
  switch (outcome) {
    case CloseOutcome::Closed:        return "Closed";
    case CloseOutcome::AlreadyClosed: return "AlreadyClosed";
    case CloseOutcome::Failed:        return "Failed";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace copytrade
