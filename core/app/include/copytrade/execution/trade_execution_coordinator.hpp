#pragma once

#include "copytrade/domain/execution_result.hpp"
#include "copytrade/domain/position.hpp"
#include "copytrade/domain/risk_config.hpp"
#include "copytrade/domain/trade_signal.hpp"
#include "copytrade/execution/i_order_execution_client.hpp"
#include "copytrade/execution/position_sizer.hpp"
#include "copytrade/execution/position_table.hpp"
#include "copytrade/notify/i_notification_sink.hpp"
#include "copytrade/risk/circuit_breaker.hpp"
#include "copytrade/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace copytrade {

// Counters from one managePositions() pass.
struct SupervisionReport {
  std::size_t scanned{0};
  std::size_t closed{0};
  std::size_t failed{0};
  std::size_t timed_out{0};
  std::size_t unavailable{0};
};

// -----------------------------------------------------------------------------
// HealthReport / PerformanceMetrics
// -----------------------------------------------------------------------------
// healthCheck() is unhealthy only when the exchange balance cannot be read.
// An active breaker or an overfull position table adds a warning but the
// executor itself still works.
// -----------------------------------------------------------------------------
struct HealthReport {
  bool healthy{false};
  std::optional<Decimal> balance;
  bool breaker_active{false};
  std::string recovery_eta;
  std::size_t open_positions{0};
  Decimal daily_loss;
  std::vector<std::string> warnings;
};

struct PerformanceMetrics {
  std::uint64_t total_trades{0};
  std::uint64_t successful_trades{0};
  std::uint64_t failed_trades{0};
  Decimal success_rate;  // successful / total; 0 before the first trade
  Decimal daily_loss;
  Decimal realized_pnl;  // sum over positions closed since start
  std::uint64_t closed_positions{0};
  std::size_t open_positions{0};
  bool breaker_active{false};
  std::optional<std::int64_t> last_trade_ms;  // last open or close
  std::int64_t uptime_ms{0};
};

// Close reasons used by supervision.
inline constexpr const char* kStopLossReason = "STOP_LOSS";
inline constexpr const char* kTakeProfitReason = "TAKE_PROFIT";
inline constexpr const char* kTimeExitReason = "TIME_EXIT";

// -----------------------------------------------------------------------------
// TradeExecutionCoordinator: signal → gate → size → order → position
// -----------------------------------------------------------------------------
//
// @brief  Executes copy trades behind the circuit breaker and supervises the
//         resulting positions until they are closed.
//
// @details
// executeCopyTrade(signal):
//   1. CircuitBreaker::checkTradeAllowed(); blocked → Skipped{CircuitBreaker}.
//   2. Validate the signal once (amount, price range, confidence, side,
//      known market, position limits); invalid → Skipped{ValidationError}.
//   3. Read the current price and the balance (retried with backoff; both
//      degrade gracefully) and size the position via PositionSizer.
//   4. Take the per-position lock, re-check the duplicate and capacity
//      rules, place the order (never retried). Success inserts a Pending
//      position and promotes it to Open; failure leaves neither a position
//      nor a lock entry behind.
//
// managePositions():
//   For each Open position: fetch the price with a timeout (a timed-out or
//   unavailable price leaves the position untouched), test stop-loss,
//   take-profit and maximum age, and close via the same path as
//   closePosition().
//
// Closing (shared by supervision and the manual CLOSE command):
//   Under the per-position lock: re-check the position is still Open (and,
//   for supervision, that it is the position the trigger was computed for
//   and the exit condition still holds),
//   Open → Closing, place the opposite order, compute realized P&L, report
//   it to the breaker (recordLoss / recordProfit), then mark Closed and
//   remove the position with its lock in one step. A failed close order
//   reverts Closing → Open. Closing an absent position is AlreadyClosed.
//
// Lock order:
//   per-position lock → CircuitBreaker mutex. The breaker never calls back
//   into the coordinator, so the order cannot invert.
//
// Failure policy:
//   No public method throws; every failure is a Skipped / Failed result or a
//   counter in the SupervisionReport.
//
// Thread model:
//   All public methods are safe to call concurrently (signal loop,
//   supervision thread, control thread).
//
// Ownership:
//   Borrows the breaker, client, clock and sink; all must outlive it.
// -----------------------------------------------------------------------------
class TradeExecutionCoordinator {
 public:
  TradeExecutionCoordinator(const domain::RiskConfig& config,
                            CircuitBreaker& breaker,
                            IOrderExecutionClient& client,
                            const ITimeProvider& clock,
                            INotificationSink* sink = nullptr);

  TradeExecutionCoordinator(const TradeExecutionCoordinator&) = delete;
  TradeExecutionCoordinator& operator=(const TradeExecutionCoordinator&) =
      delete;

  domain::ExecutionResult executeCopyTrade(const domain::TradeSignal& signal);

  SupervisionReport managePositions();

  // Idempotent. Fetches the exit price itself.
  domain::CloseResult closePosition(const std::string& position_id,
                                    const std::string& reason);

  // Reads the balance (retried) and inspects breaker and position table.
  // Never throws.
  HealthReport healthCheck();

  PerformanceMetrics performanceMetrics() const;

  std::vector<domain::Position> openPositions() const;
  std::optional<domain::Position> findPosition(
      const std::string& position_id) const;
  std::size_t positionLockCount() const;

 private:
  // @throws ValidationError with a readable reason.
  void validate(const domain::TradeSignal& signal) const;

  // Price read with retry on PriceUnavailableError. PriceTimeoutError is
  // not retried. Either error propagates.
  Decimal fetchPrice(const std::string& market_id);
  std::optional<Decimal> fetchBalance();

  std::optional<std::string> exitReason(const domain::Position& position,
                                        Decimal price,
                                        std::int64_t now_ms) const;

  domain::ExecutionResult placeUnderLock(const domain::TradeSignal& signal,
                                         const std::string& position_id,
                                         Decimal size);

  void recordActivity(std::optional<Decimal> realized_pnl);

  // Shared close path. exit_price is fetched under the lock when absent.
  // `trigger` is the snapshot supervision evaluated; when given, the close
  // proceeds only if the locked position is the same one and its exit
  // condition still holds at exit_price (required with a trigger).
  domain::CloseResult closeWithPrice(const std::string& position_id,
                                     const std::string& reason,
                                     std::optional<Decimal> exit_price,
                                     const domain::Position* trigger);

  const domain::RiskConfig config_;
  CircuitBreaker& breaker_;
  IOrderExecutionClient& client_;
  const ITimeProvider& clock_;
  INotificationSink* sink_;
  PositionSizer sizer_;
  PositionTable positions_;

  // Leaf lock: taken after a position lock, never before one.
  mutable std::mutex metrics_mutex_;
  const std::int64_t started_at_ms_;
  Decimal realized_pnl_;
  std::uint64_t closed_positions_{0};
  std::optional<std::int64_t> last_trade_ms_;
};

}  // namespace copytrade
