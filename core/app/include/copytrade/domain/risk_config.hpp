#pragma once

#include "copytrade/domain/decimal.hpp"
#include "copytrade/errors/retry.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace copytrade {
namespace domain {

// -----------------------------------------------------------------------------
// RiskConfig: breaker thresholds, sizing bounds and supervision rules
// -----------------------------------------------------------------------------
//
// @brief  Plain collection of the parameters that govern the circuit breaker
//         and TradeExecutionCoordinator.
//
// @details
// Supplied by the hosting application (see loadEngineConfig() for the JSON
// form). Components copy it by value at construction time and never see a
// later change; restart the engine to apply new limits.
//
// The persisted breaker state also records max_daily_loss and the
// consecutive-loss threshold, but on startup the configured values win.
//
// Sizing (see PositionSizer):
//   risk_budget = balance * risk_budget_fraction
//   price_risk  = max(|entry - stop|, current_price * price_risk_epsilon)
//   size        = clamp(min(risk_budget / price_risk, copy_ratio * amount),
//                       min_position_size, max_position_size)
//
// Thread model:
//   Value type. No shared mutable state.
// -----------------------------------------------------------------------------
struct RiskConfig {
  // --- Circuit breaker -------------------------------------------------------
  Decimal max_daily_loss{Decimal::fromInt(100)};
  int consecutive_loss_threshold{5};
  std::chrono::seconds cooldown{3600};
  std::string state_file_path{"data/circuit_breaker_state.json"};

  // --- Position sizing -------------------------------------------------------
  Decimal min_position_size{Decimal::fromInt(1)};
  Decimal max_position_size{Decimal::fromInt(100)};
  Decimal risk_budget_fraction{Decimal::parse("0.01")};
  Decimal price_risk_epsilon{Decimal::parse("0.001")};
  Decimal copy_ratio{Decimal::parse("0.1")};

  // --- Exit rules ------------------------------------------------------------
  Decimal stop_loss_pct{Decimal::parse("0.1")};
  Decimal take_profit_pct{Decimal::parse("0.2")};
  std::chrono::seconds max_position_age{86400};

  // --- Signal validation -----------------------------------------------------
  Decimal min_price{Decimal::parse("0.01")};
  Decimal max_price{Decimal::parse("0.99")};
  Decimal min_confidence{Decimal::parse("0.5")};
  std::size_t max_concurrent_positions{10};
  std::chrono::seconds stale_signal_age{300};

  // --- External calls --------------------------------------------------------
  std::chrono::milliseconds price_timeout{2000};
  RetryPolicy io_retry{};
};

}  // namespace domain
}  // namespace copytrade
