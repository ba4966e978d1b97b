#include "copytrade/domain/circuit_breaker_state.hpp"

namespace copytrade {
namespace domain {

bool operator==(const CircuitBreakerState& a, const CircuitBreakerState& b) {
  return a.active == b.active && a.reason == b.reason &&
         a.activated_at_ms == b.activated_at_ms &&
         a.cooldown_until_ms == b.cooldown_until_ms &&
         a.daily_loss == b.daily_loss && a.max_daily_loss == b.max_daily_loss &&
         a.consecutive_losses == b.consecutive_losses &&
         a.consecutive_loss_threshold == b.consecutive_loss_threshold &&
         a.last_reset_day == b.last_reset_day &&
         a.total_trades == b.total_trades &&
         a.failed_trades == b.failed_trades;
}

bool operator!=(const CircuitBreakerState& a, const CircuitBreakerState& b) {
  return !(a == b);
}

}  // namespace domain
}  // namespace copytrade
