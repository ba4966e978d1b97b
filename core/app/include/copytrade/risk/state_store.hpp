#pragma once

#include "copytrade/domain/circuit_breaker_state.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// StateStore: file persistence for CircuitBreakerState
// -----------------------------------------------------------------------------
//
// @brief  Loads and atomically saves the breaker state as a single JSON
//         object so an active breaker survives a restart.
//
// @details
// File format (one object):
//   {
//     "active": true,
//     "reason": "Daily loss limit reached (110 / 100)",     // or null
//     "activated_at": "2026-10-19T12:00:00.000Z",           // or null
//     "cooldown_until": "2026-10-19T13:00:00.000Z",         // or null
//     "daily_loss": "110",                                   // decimal string
//     "max_daily_loss": "100",                               // decimal string
//     "consecutive_losses": 2,
//     "consecutive_loss_threshold": 5,
//     "last_reset_date": "2026-10-19",
//     "total_trades": 14,
//     "failed_trades": 1
//   }
// consecutive_loss_threshold, total_trades and failed_trades are optional on
// read (older files); every other key is required.
//
// Atomic write:
//   save() serializes to "<path>.tmp" in the same directory, flushes and
//   closes it, then renames it over <path>. A crash mid-write leaves either
//   the old file or the new one, never a truncated mix.
//
// Thread model:
//   Not internally synchronized. CircuitBreaker is the single writer and
//   calls save() while holding its own mutex.
// -----------------------------------------------------------------------------
class StateStore {
 public:
  explicit StateStore(std::string path);

  // -------------------------------------------------------------------------
  // load(defaults)
  // -------------------------------------------------------------------------
  // @brief  Reads the state file.
  //
  // @return The persisted state, or `defaults` when the file does not exist
  //         or cannot be parsed. Corruption is logged as ERROR and never
  //         thrown.
  // -------------------------------------------------------------------------
  domain::CircuitBreakerState load(
      const domain::CircuitBreakerState& defaults) const;

  // -------------------------------------------------------------------------
  // save(state)
  // -------------------------------------------------------------------------
  // @brief  Writes the state atomically (temp file + rename).
  //
  // @throws StateWriteError if the temp file cannot be written or renamed.
  //         The previous file, if any, is left untouched in that case.
  // -------------------------------------------------------------------------
  void save(const domain::CircuitBreakerState& state) const;

  const std::string& path() const { return path_; }

  static nlohmann::json toJson(const domain::CircuitBreakerState& state);

  // @throws StateCorruptionError on missing keys, wrong types, malformed
  //         decimals/timestamps, or values violating the state invariants.
  static domain::CircuitBreakerState fromJson(const nlohmann::json& j);

 private:
  std::string path_;
};

}  // namespace copytrade
