#pragma once

#include "copytrade/time/i_time_provider.hpp"

namespace copytrade {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall clock for the running engine
// -----------------------------------------------------------------------------
// system_clock rather than steady_clock: cooldown_until and activated_at are
// persisted as absolute UTC instants and must still mean the same thing after
// a restart, and the daily reset follows the calendar.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace copytrade
