#pragma once

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

namespace copytrade {

// -----------------------------------------------------------------------------
// RetryPolicy: bounded exponential backoff for read-side I/O
// -----------------------------------------------------------------------------
//
// @brief  Attempt count and delay schedule used by retryWithBackoff().
//
// @details
// Delay before attempt n (n >= 2) is
//   min(initial_delay * multiplier^(n-2), max_delay).
// Only reads and persistence use this. Order placement is never retried.
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  std::chrono::milliseconds initial_delay{50};
  double multiplier{2.0};
  std::chrono::milliseconds max_delay{1000};
};

// -----------------------------------------------------------------------------
// retryWithBackoff<Retryable>(policy, what, fn)
// -----------------------------------------------------------------------------
// @brief  Calls fn() until it returns, retrying only on exceptions of type
//         Retryable (or derived), up to policy.max_attempts in total.
//
// @param  policy  Attempt count and delay schedule.
// @param  what    Short label for log lines (e.g. "price fetch").
// @param  fn      Nullary callable. Its return value is forwarded.
//
// @details
// Any exception that is not a Retryable propagates immediately. After the
// last attempt the final Retryable is rethrown to the caller, which decides
// how to degrade. Sleeps on the calling thread between attempts.
// -----------------------------------------------------------------------------
template <typename Retryable, typename Fn>
auto retryWithBackoff(const RetryPolicy& policy, const char* what, Fn&& fn)
    -> decltype(fn()) {
  const int attempts = std::max(1, policy.max_attempts);
  auto delay = policy.initial_delay;

  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const Retryable& e) {
      if (attempt >= attempts) {
        throw;
      }
      std::cerr << "[Retry] WARNING: " << what << " attempt " << attempt << "/"
                << attempts << " failed: " << e.what() << ". Retrying in "
                << delay.count() << " ms\n";
    }

    if (delay.count() > 0) {
      std::this_thread::sleep_for(delay);
    }
    auto next = std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(delay.count() *
                                                    policy.multiplier));
    delay = std::min(next, policy.max_delay);
  }
}

}  // namespace copytrade
