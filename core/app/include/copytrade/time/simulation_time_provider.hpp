#pragma once

#include "copytrade/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// SimulationTimeProvider: a clock the caller moves by hand
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider for tests and paper replays. Cooldowns, midnight
//         rollovers and position ages are crossed with one advance() call
//         instead of a sleep.
//
// @details
// The value is a std::atomic<int64_t> because the signal loop, the
// supervisor and the test thread read it concurrently while the test thread
// moves it.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : now_ms_(start_ms) {}

  // Starts at an ISO-8601 UTC instant ("2026-10-19T12:00:00Z").
  // Throws std::invalid_argument when the text does not parse.
  static SimulationTimeProvider at(const std::string& iso8601);

  std::int64_t now_ms() const override { return now_ms_.load(); }

  // Absolute jump; may move backwards (used to test clock skew).
  void set_now(std::int64_t epoch_ms) { now_ms_.store(epoch_ms); }

  void advance(std::chrono::milliseconds delta) {
    now_ms_.fetch_add(delta.count());
  }

 private:
  std::atomic<std::int64_t> now_ms_;
};

}  // namespace copytrade
