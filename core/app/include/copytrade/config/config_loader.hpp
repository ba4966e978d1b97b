#pragma once

#include "copytrade/domain/risk_config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// EngineConfig: everything CopyTradeEngine needs to start
// -----------------------------------------------------------------------------
// An empty endpoint disables the corresponding socket (tests and embedded
// use drive the engine through pushSignal() / executeCommand() instead).
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::RiskConfig risk{};
  std::string signal_endpoint{"tcp://127.0.0.1:5555"};
  std::string control_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string control_pub_endpoint{"tcp://127.0.0.1:5557"};
  std::chrono::milliseconds supervision_interval{5000};
  bool paper_trading{true};
  Decimal paper_balance{Decimal::fromInt(1000)};
};

// -----------------------------------------------------------------------------
// loadEngineConfig(path) / parseEngineConfig(json)
// -----------------------------------------------------------------------------
//
// @brief  Builds an EngineConfig from a JSON document. Every key is
//         optional; absent keys keep the EngineConfig defaults.
//
// @details
// Layout:
//   {
//     "risk": {
//       "max_daily_loss": "100",            // decimal string or number
//       "consecutive_loss_threshold": 5,
//       "cooldown_seconds": 3600,
//       "state_file_path": "data/circuit_breaker_state.json",
//       "min_position_size": "1", "max_position_size": "100",
//       "risk_budget_fraction": "0.01", "price_risk_epsilon": "0.001",
//       "copy_ratio": "0.1",
//       "stop_loss_pct": "0.1", "take_profit_pct": "0.2",
//       "max_position_age_seconds": 86400,
//       "min_price": "0.01", "max_price": "0.99", "min_confidence": "0.5",
//       "max_concurrent_positions": 10,
//       "stale_signal_age_seconds": 300,
//       "price_timeout_ms": 2000,
//       "retry": { "max_attempts": 3, "initial_delay_ms": 50,
//                  "multiplier": 2.0, "max_delay_ms": 1000 }
//     },
//     "signal_endpoint": "tcp://127.0.0.1:5555",
//     "control_cmd_endpoint": "tcp://127.0.0.1:5556",
//     "control_pub_endpoint": "tcp://127.0.0.1:5557",
//     "supervision_interval_ms": 5000,
//     "paper_trading": true,
//     "paper_balance": "1000"
//   }
//
// @throws ConfigError for unreadable files, malformed JSON, wrong types and
//         values that violate the consistency rules in validateRiskConfig().
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path);
EngineConfig parseEngineConfig(const nlohmann::json& j);

// @throws ConfigError naming the first violated rule.
void validateRiskConfig(const domain::RiskConfig& risk);

}  // namespace copytrade
