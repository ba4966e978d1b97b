#pragma once

#include "copytrade/domain/circuit_breaker_state.hpp"
#include "copytrade/domain/decimal.hpp"
#include "copytrade/domain/risk_config.hpp"
#include "copytrade/notify/i_notification_sink.hpp"
#include "copytrade/risk/state_store.hpp"
#include "copytrade/time/i_time_provider.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// CircuitBreaker: persisted loss-driven trading halt
// -----------------------------------------------------------------------------
//
// @brief  Decides whether copy trades may currently execute, accumulates
//         realized losses, and halts trading when losses become excessive.
//
// @details
// State machine (cyclical, no terminal state):
//
//   Inactive ──(daily_loss >= max_daily_loss
//               or consecutive_losses >= threshold
//               or activate())──────────────────────► Active
//   Active   ──(now >= cooldown_until, observed by
//               periodicCheck() / checkTradeAllowed()
//               or reset())─────────────────────────► Inactive
//
// Daily rollover:
//   When the UTC date differs from last_reset_date, daily_loss and
//   consecutive_losses are zeroed and last_reset_date moves to today. The
//   rollover does NOT clear an active breaker; only the cooldown or a manual
//   reset() does.
//
// Atomicity:
//   One std::mutex guards the single owned CircuitBreakerState. Each
//   operation copies the state, computes the complete successor without
//   touching the live value, swaps it in, then persists it via StateStore
//   while still holding the mutex. Concurrent callers therefore observe
//   either the old or the new state, never a mix, and persisted files appear
//   in mutation order. Notifications are sent after the mutex is released.
//
// Failure policy:
//   No public method throws. A fault inside checkTradeAllowed() fails OPEN
//   (the trade is allowed) and is logged as ERROR. A failed persist is
//   retried with RiskConfig::io_retry, then logged; the in-memory state
//   stays authoritative.
//
// Ownership:
//   Owned by CopyTradeEngine (or a test) and passed by reference to
//   TradeExecutionCoordinator. The time provider and notification sink are
//   borrowed and must outlive the breaker.
// -----------------------------------------------------------------------------
class CircuitBreaker {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Loads the persisted state (or defaults) and applies any
  //         rollover / cooldown expiry that happened while the process was
  //         down.
  //
  // @param  config  Thresholds and cooldown. Configured max_daily_loss and
  //                 consecutive_loss_threshold override the persisted ones.
  // @param  store   Persistence for the state file.
  // @param  clock   Time source for cooldowns and UTC dates.
  // @param  sink    Optional notification sink (may be nullptr).
  // -------------------------------------------------------------------------
  CircuitBreaker(const domain::RiskConfig& config, StateStore store,
                 const ITimeProvider& clock, INotificationSink* sink = nullptr);

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;
  CircuitBreaker(CircuitBreaker&&) = delete;
  CircuitBreaker& operator=(CircuitBreaker&&) = delete;

  // -------------------------------------------------------------------------
  // checkTradeAllowed(trade_id)
  // -------------------------------------------------------------------------
  // @brief  Gate consulted before every copy trade.
  //
  // @return TradeAllowed, or TradeBlocked with the activation reason and a
  //         recovery ETA derived from cooldown_until - now.
  //
  // @details
  // Applies the UTC-midnight rollover and the cooldown expiry first, so an
  // expired breaker lets the trade through even if periodicCheck() has not
  // run yet. Fails open on internal error.
  // -------------------------------------------------------------------------
  domain::TradeGate checkTradeAllowed(const std::string& trade_id);

  // -------------------------------------------------------------------------
  // recordLoss(amount)
  // -------------------------------------------------------------------------
  // @brief  Adds |amount| to daily_loss and extends the losing streak.
  //
  // @details
  // Activates the breaker when daily_loss >= max_daily_loss (checked first)
  // or consecutive_losses >= threshold. Already active: counters still
  // grow, but no second activation and no second notification. A loss that
  // lands after the cooldown has expired but before any other call noticed
  // it counts as a fresh activation. Never throws; an amount that would
  // overflow daily_loss is logged and dropped.
  // -------------------------------------------------------------------------
  void recordLoss(Decimal amount);

  // Zeroes the losing streak. daily_loss is loss-only and stays unchanged.
  void recordProfit(Decimal amount);

  // Telemetry only: bumps total_trades (and failed_trades when !success).
  // Never activates the breaker.
  void recordTradeResult(bool success, const std::string& trade_id);

  // Manual halt. No-op while already active.
  void activate(const std::string& reason);

  // -------------------------------------------------------------------------
  // reset()
  // -------------------------------------------------------------------------
  // @brief  Manual recovery: clears active, reason, activated_at and
  //         cooldown_until.
  //
  // @details
  // daily_loss, consecutive_losses and last_reset_date are preserved: a
  // manual reset is not a daily reset.
  // -------------------------------------------------------------------------
  void reset();

  // -------------------------------------------------------------------------
  // periodicCheck()
  // -------------------------------------------------------------------------
  // @brief  Timer hook: UTC-midnight rollover, then cooldown expiry.
  //
  // @details
  // Persists only when the state actually changed.
  // -------------------------------------------------------------------------
  void periodicCheck();

  // --- Read accessors (copies, safe from any thread) -----------------------
  domain::CircuitBreakerState snapshot() const;
  bool isActive() const;
  Decimal dailyLoss() const;
  int consecutiveLosses() const;
  std::string recoveryEta() const;
  std::int64_t remainingCooldownMs() const;

  // Number of activations since construction, re-trips after an expired
  // cooldown included.
  std::uint64_t activationCount() const;

 private:
  // Pure helpers: compute successors, never touch state_.
  domain::CircuitBreakerState applyScheduledTransitions(
      const domain::CircuitBreakerState& current, std::int64_t now_ms) const;
  domain::CircuitBreakerState activated(
      const domain::CircuitBreakerState& current, const std::string& reason,
      std::int64_t now_ms) const;
  static domain::CircuitBreakerState cleared(
      const domain::CircuitBreakerState& current);
  std::optional<std::string> activationReason(
      const domain::CircuitBreakerState& state) const;

  // Swap in `next` and persist if it differs from state_. Caller holds
  // mutex_. Returns true when the state changed.
  bool commitLocked(const domain::CircuitBreakerState& next);
  void persistLocked();

  // Bookkeeping shared by every mutation that may activate or clear.
  std::optional<NotificationEvent> noteTransitionLocked(
      const domain::CircuitBreakerState& before,
      const domain::CircuitBreakerState& after, std::int64_t now_ms);

  std::int64_t remainingMsLocked(std::int64_t now_ms) const;

  const domain::RiskConfig config_;
  StateStore store_;
  const ITimeProvider& clock_;
  INotificationSink* sink_;

  mutable std::mutex mutex_;
  domain::CircuitBreakerState state_;
  std::uint64_t activation_count_{0};
};

}  // namespace copytrade
