#include "copytrade/risk/circuit_breaker.hpp"
#include "copytrade/errors/errors.hpp"
#include "copytrade/errors/retry.hpp"
#include "copytrade/time/time_utils.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace copytrade {

// -----------------------------------------------------------------------------
// Constructor: load, override limits from config, catch up on missed time
// -----------------------------------------------------------------------------
CircuitBreaker::CircuitBreaker(const domain::RiskConfig& config,
                               StateStore store, const ITimeProvider& clock,
                               INotificationSink* sink)
    : config_(config), store_(std::move(store)), clock_(clock), sink_(sink) {
  domain::CircuitBreakerState defaults;
  defaults.max_daily_loss = config_.max_daily_loss;
  defaults.consecutive_loss_threshold = config_.consecutive_loss_threshold;
  defaults.last_reset_day = clock_.utc_day();

  domain::CircuitBreakerState loaded = store_.load(defaults);
  loaded.max_daily_loss = config_.max_daily_loss;
  loaded.consecutive_loss_threshold = config_.consecutive_loss_threshold;

  const std::int64_t now = clock_.now_ms();
  std::optional<NotificationEvent> note;
  {
    std::lock_guard lock(mutex_);
    state_ = loaded;
    const auto before = state_;
    commitLocked(applyScheduledTransitions(state_, now));
    note = noteTransitionLocked(before, state_, now);

    if (state_.active) {
      std::cerr << "[CircuitBreaker] WARNING: restored ACTIVE breaker ("
                << state_.reason.value_or("unknown reason")
                << "). Recovery in "
                << formatRecoveryEta(remainingMsLocked(now)) << "\n";
    } else {
      std::cout << "[CircuitBreaker] Ready. daily_loss=" << state_.daily_loss
                << "/" << state_.max_daily_loss
                << " consecutive_losses=" << state_.consecutive_losses << "/"
                << state_.consecutive_loss_threshold << "\n";
    }
  }
  if (note) {
    notifySafely(sink_, *note);
  }
}

// -----------------------------------------------------------------------------
// checkTradeAllowed
// -----------------------------------------------------------------------------
domain::TradeGate CircuitBreaker::checkTradeAllowed(
    const std::string& trade_id) {
  std::optional<NotificationEvent> note;
  domain::TradeGate gate = domain::TradeAllowed{};

  try {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    const auto before = state_;
    commitLocked(applyScheduledTransitions(state_, now));
    note = noteTransitionLocked(before, state_, now);

    if (state_.active) {
      const std::int64_t remaining = remainingMsLocked(now);
      const std::string reason =
          state_.reason.value_or("Circuit breaker active");
      gate = domain::TradeBlocked{reason, formatRecoveryEta(remaining),
                                  remaining};
      std::cerr << "[CircuitBreaker] WARNING: trade " << trade_id
                << " blocked: " << reason << " (recovery in "
                << formatRecoveryEta(remaining) << ")\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[CircuitBreaker] ERROR: gate check for trade " << trade_id
              << " failed (" << e.what() << "). Allowing trade.\n";
    gate = domain::TradeAllowed{};
  }

  if (note) {
    notifySafely(sink_, *note);
  }
  return gate;
}

// -----------------------------------------------------------------------------
// recordLoss / recordProfit / recordTradeResult
// -----------------------------------------------------------------------------
void CircuitBreaker::recordLoss(Decimal amount) {
  std::optional<NotificationEvent> note;
  try {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    const auto before = state_;

    auto next = applyScheduledTransitions(state_, now);
    next.daily_loss += amount.abs();
    next.consecutive_losses += 1;
    if (!next.active) {
      if (auto reason = activationReason(next)) {
        next = activated(next, *reason, now);
      }
    }

    commitLocked(next);
    note = noteTransitionLocked(before, state_, now);

    std::cout << "[CircuitBreaker] Loss recorded: " << amount.abs()
              << " daily_loss=" << state_.daily_loss << "/"
              << state_.max_daily_loss
              << " consecutive_losses=" << state_.consecutive_losses << "\n";
  } catch (const std::exception& e) {
    // State is only committed once fully computed, so it is unchanged here.
    std::cerr << "[CircuitBreaker] ERROR: could not record loss of " << amount
              << " (" << e.what() << "). State unchanged.\n";
  }
  if (note) {
    notifySafely(sink_, *note);
  }
}

void CircuitBreaker::recordProfit(Decimal amount) {
  std::optional<NotificationEvent> note;
  try {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    const auto before = state_;

    auto next = applyScheduledTransitions(state_, now);
    next.consecutive_losses = 0;

    commitLocked(next);
    note = noteTransitionLocked(before, state_, now);
    std::cout << "[CircuitBreaker] Profit recorded: " << amount
              << ". Losing streak reset.\n";
  } catch (const std::exception& e) {
    std::cerr << "[CircuitBreaker] ERROR: could not record profit of "
              << amount << " (" << e.what() << "). State unchanged.\n";
  }
  if (note) {
    notifySafely(sink_, *note);
  }
}

void CircuitBreaker::recordTradeResult(bool success,
                                       const std::string& trade_id) {
  std::lock_guard lock(mutex_);
  auto next = state_;
  next.total_trades += 1;
  if (!success) {
    next.failed_trades += 1;
    std::cerr << "[CircuitBreaker] WARNING: trade " << trade_id
              << " failed (" << next.failed_trades << "/" << next.total_trades
              << " trades failed)\n";
  }
  commitLocked(next);
}

// -----------------------------------------------------------------------------
// activate / reset / periodicCheck
// -----------------------------------------------------------------------------
void CircuitBreaker::activate(const std::string& reason) {
  std::optional<NotificationEvent> note;
  {
    std::lock_guard lock(mutex_);
    if (state_.active) {
      return;
    }
    const std::int64_t now = clock_.now_ms();
    const auto before = state_;
    commitLocked(activated(state_, reason, now));
    note = noteTransitionLocked(before, state_, now);
  }
  if (note) {
    notifySafely(sink_, *note);
  }
}

void CircuitBreaker::reset() {
  std::optional<NotificationEvent> note;
  {
    std::lock_guard lock(mutex_);
    if (!state_.active) {
      std::cout << "[CircuitBreaker] Reset requested but breaker is not active\n";
      return;
    }
    const std::int64_t now = clock_.now_ms();
    const auto before = state_;
    commitLocked(cleared(state_));
    note = noteTransitionLocked(before, state_, now);
  }
  if (note) {
    notifySafely(sink_, *note);
  }
}

void CircuitBreaker::periodicCheck() {
  std::optional<NotificationEvent> note;
  {
    std::lock_guard lock(mutex_);
    const std::int64_t now = clock_.now_ms();
    const auto before = state_;
    if (commitLocked(applyScheduledTransitions(state_, now)) &&
        before.last_reset_day != state_.last_reset_day) {
      std::cout << "[CircuitBreaker] Daily counters reset for "
                << formatUtcDate(state_.last_reset_day) << "\n";
    }
    note = noteTransitionLocked(before, state_, now);
  }
  if (note) {
    notifySafely(sink_, *note);
  }
}

// -----------------------------------------------------------------------------
// Read accessors
// -----------------------------------------------------------------------------
domain::CircuitBreakerState CircuitBreaker::snapshot() const {
  std::lock_guard lock(mutex_);
  return state_;
}

bool CircuitBreaker::isActive() const {
  std::lock_guard lock(mutex_);
  return state_.active;
}

Decimal CircuitBreaker::dailyLoss() const {
  std::lock_guard lock(mutex_);
  return state_.daily_loss;
}

int CircuitBreaker::consecutiveLosses() const {
  std::lock_guard lock(mutex_);
  return state_.consecutive_losses;
}

std::string CircuitBreaker::recoveryEta() const {
  std::lock_guard lock(mutex_);
  return formatRecoveryEta(remainingMsLocked(clock_.now_ms()));
}

std::int64_t CircuitBreaker::remainingCooldownMs() const {
  std::lock_guard lock(mutex_);
  return remainingMsLocked(clock_.now_ms());
}

std::uint64_t CircuitBreaker::activationCount() const {
  std::lock_guard lock(mutex_);
  return activation_count_;
}

// -----------------------------------------------------------------------------
// Successor computation
// -----------------------------------------------------------------------------
domain::CircuitBreakerState CircuitBreaker::applyScheduledTransitions(
    const domain::CircuitBreakerState& current, std::int64_t now_ms) const {
  domain::CircuitBreakerState next = current;

  const std::int64_t today = utcDay(now_ms);
  if (next.last_reset_day != today) {
    next.daily_loss = Decimal{};
    next.consecutive_losses = 0;
    next.last_reset_day = today;
  }

  if (next.active && !next.cooldown_until_ms && next.activated_at_ms) {
    next.cooldown_until_ms =
        *next.activated_at_ms +
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.cooldown)
            .count();
  }
  if (next.active && next.cooldown_until_ms &&
      now_ms >= *next.cooldown_until_ms) {
    next = cleared(next);
  }
  return next;
}

domain::CircuitBreakerState CircuitBreaker::activated(
    const domain::CircuitBreakerState& current, const std::string& reason,
    std::int64_t now_ms) const {
  domain::CircuitBreakerState next = current;
  next.active = true;
  next.reason = reason;
  next.activated_at_ms = now_ms;
  next.cooldown_until_ms =
      now_ms +
      std::chrono::duration_cast<std::chrono::milliseconds>(config_.cooldown)
          .count();
  return next;
}

domain::CircuitBreakerState CircuitBreaker::cleared(
    const domain::CircuitBreakerState& current) {
  domain::CircuitBreakerState next = current;
  next.active = false;
  next.reason.reset();
  next.activated_at_ms.reset();
  next.cooldown_until_ms.reset();
  return next;
}

// Daily loss is checked first; it wins when both conditions hold.
std::optional<std::string> CircuitBreaker::activationReason(
    const domain::CircuitBreakerState& state) const {
  if (state.daily_loss >= state.max_daily_loss) {
    return "Daily loss limit reached (" + state.daily_loss.toString() + " / " +
           state.max_daily_loss.toString() + ")";
  }
  if (state.consecutive_losses >= state.consecutive_loss_threshold) {
    return std::to_string(state.consecutive_losses) +
           " consecutive losses detected";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Commit and persistence (mutex_ held)
// -----------------------------------------------------------------------------
bool CircuitBreaker::commitLocked(const domain::CircuitBreakerState& next) {
  if (next == state_) {
    return false;
  }
  state_ = next;
  persistLocked();
  return true;
}

void CircuitBreaker::persistLocked() {
  try {
    retryWithBackoff<StateWriteError>(config_.io_retry, "breaker state save",
                                      [this] { store_.save(state_); });
  } catch (const StateWriteError& e) {
    std::cerr << "[CircuitBreaker] ERROR: could not persist state to "
              << store_.path() << ": " << e.what()
              << ". Continuing with in-memory state.\n";
  }
}

std::optional<NotificationEvent> CircuitBreaker::noteTransitionLocked(
    const domain::CircuitBreakerState& before,
    const domain::CircuitBreakerState& after, std::int64_t now_ms) {
  // A cooldown that expires and re-trips within one mutation stays active
  // throughout but carries a new activation time.
  if (after.active &&
      (!before.active || before.activated_at_ms != after.activated_at_ms)) {
    ++activation_count_;
    const std::string eta = formatRecoveryEta(remainingMsLocked(now_ms));
    std::cerr << "[CircuitBreaker] CRITICAL: ACTIVATED: " << *after.reason
              << ". ALL TRADING HALTED. Recovery in " << eta << "\n";
    return NotificationEvent{NotificationType::BreakerActivated, *after.reason,
                             "Circuit breaker activated: " + *after.reason +
                                 ". Trading halted, recovery in " + eta,
                             now_ms};
  }
  if (before.active && !after.active) {
    std::cout << "[CircuitBreaker] Reset. Trading resumed.\n";
    return NotificationEvent{NotificationType::BreakerReset,
                             before.reason.value_or(""),
                             "Circuit breaker reset. Trading resumed.", now_ms};
  }
  return std::nullopt;
}

std::int64_t CircuitBreaker::remainingMsLocked(std::int64_t now_ms) const {
  if (!state_.active || !state_.cooldown_until_ms) {
    return 0;
  }
  const std::int64_t remaining = *state_.cooldown_until_ms - now_ms;
  return remaining > 0 ? remaining : 0;
}

}  // namespace copytrade
