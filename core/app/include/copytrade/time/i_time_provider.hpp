#pragma once

#include "copytrade/time/time_utils.hpp"

#include <cstdint>

namespace copytrade {

// -----------------------------------------------------------------------------
// ITimeProvider: the one source of "now" for the risk core
// -----------------------------------------------------------------------------
//
// @brief  Components that apply time rules (breaker cooldown, UTC-midnight
//         loss reset, recovery ETA, position time exit, stale-signal check)
//         take a `const ITimeProvider&` instead of reading system_clock.
//
// @details
//   - LiveTimeProvider       → system_clock, used by the engine binary.
//   - SimulationTimeProvider → set by hand; tests cross a one-hour cooldown
//                              with a single advance().
//
// Time is int64 milliseconds since the Unix epoch. The persisted breaker
// state stores ISO-8601 text and compares instants; an integer epoch keeps
// that arithmetic exact.
//
// Implementations must allow concurrent now_ms() calls. The provider is
// borrowed and must outlive every component holding it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;

  // Whole UTC days since 1970-01-01 at now_ms(); the daily-loss key.
  std::int64_t utc_day() const { return utcDay(now_ms()); }
};

}  // namespace copytrade
