#include "copytrade/execution/trade_execution_coordinator.hpp"
#include "copytrade/errors/errors.hpp"
#include "copytrade/errors/retry.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace copytrade {

namespace {

std::int64_t toMillis(std::chrono::seconds s) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(s).count();
}

}  // namespace

TradeExecutionCoordinator::TradeExecutionCoordinator(
    const domain::RiskConfig& config, CircuitBreaker& breaker,
    IOrderExecutionClient& client, const ITimeProvider& clock,
    INotificationSink* sink)
    : config_(config),
      breaker_(breaker),
      client_(client),
      clock_(clock),
      sink_(sink),
      sizer_(config),
      started_at_ms_(clock.now_ms()) {}

// -----------------------------------------------------------------------------
// executeCopyTrade
// -----------------------------------------------------------------------------
domain::ExecutionResult TradeExecutionCoordinator::executeCopyTrade(
    const domain::TradeSignal& signal) {
  try {
    // --- 1. Breaker gate ------------------------------------------------------
    auto gate = breaker_.checkTradeAllowed(signal.trade_id);
    if (const auto* blocked = std::get_if<domain::TradeBlocked>(&gate)) {
      return domain::Skipped{signal.trade_id, domain::SkipKind::CircuitBreaker,
                             blocked->reason, blocked->recovery_eta};
    }

    // --- 2. Validation --------------------------------------------------------
    validate(signal);

    // --- 3. Sizing ------------------------------------------------------------
    const Decimal entry = signal.price;
    const Decimal stop =
        domain::stopLossPrice(signal.side, entry, config_.stop_loss_pct);

    Decimal current = entry;
    try {
      current = fetchPrice(signal.market_id);
    } catch (const TransientIOError& e) {
      std::cerr << "[Coordinator] WARNING: " << e.what()
                << ". Sizing trade " << signal.trade_id
                << " against the signal price.\n";
    }

    const Decimal size =
        sizer_.size(entry, stop, current, signal.amount, fetchBalance());

    // --- 4. Lock, place, record ----------------------------------------------
    const std::string position_id =
        domain::makePositionId(signal.market_id, signal.side);
    auto result = placeUnderLock(signal, position_id, size);

    if (const auto* ok = std::get_if<domain::Submitted>(&result)) {
      notifySafely(sink_, NotificationEvent{
                              NotificationType::TradeSubmitted, ok->trade_id,
                              "Opened " + ok->position_id + " size " +
                                  ok->size.toString() + " @ " +
                                  ok->entry_price.toString(),
                              clock_.now_ms()});
    } else if (const auto* failed = std::get_if<domain::Failed>(&result)) {
      notifySafely(sink_, NotificationEvent{NotificationType::TradeFailed,
                                            failed->trade_id, failed->reason,
                                            clock_.now_ms()});
    }
    return result;
  } catch (const ValidationError& e) {
    std::cerr << "[Coordinator] WARNING: skipping trade " << signal.trade_id
              << ": " << e.what() << "\n";
    return domain::Skipped{signal.trade_id, domain::SkipKind::ValidationError,
                           e.what(), ""};
  } catch (const std::exception& e) {
    std::cerr << "[Coordinator] ERROR: trade " << signal.trade_id
              << " failed unexpectedly: " << e.what() << "\n";
    return domain::Failed{signal.trade_id,
                          std::string("internal error: ") + e.what()};
  }
}

domain::ExecutionResult TradeExecutionCoordinator::placeUnderLock(
    const domain::TradeSignal& signal, const std::string& position_id,
    Decimal size) {
  PositionLock held = positions_.acquire(position_id);

  if (positions_.contains(position_id)) {
    throw ValidationError("position " + position_id + " is already open");
  }
  if (positions_.size() >= config_.max_concurrent_positions) {
    positions_.eraseLockIfNoPosition(position_id);
    throw ValidationError("maximum concurrent positions (" +
                          std::to_string(config_.max_concurrent_positions) +
                          ") reached");
  }

  domain::OrderResult order;
  try {
    order = client_.placeOrder(signal.market_id, signal.side, size,
                               signal.price);
    if (order.status == domain::OrderStatus::Rejected) {
      throw OrderError("order " + order.order_id + " rejected");
    }
  } catch (const std::exception& e) {
    positions_.eraseLockIfNoPosition(position_id);
    breaker_.recordTradeResult(false, signal.trade_id);
    std::cerr << "[Coordinator] ERROR: order for trade " << signal.trade_id
              << " failed: " << e.what() << "\n";
    return domain::Failed{signal.trade_id, e.what()};
  }

  domain::Position position;
  position.id = position_id;
  position.market_id = signal.market_id;
  position.trade_id = signal.trade_id;
  position.side = signal.side;
  position.size = size;
  position.entry_price =
      order.filled_price.isPositive() ? order.filled_price : signal.price;
  position.stop_loss_price = domain::stopLossPrice(
      signal.side, position.entry_price, config_.stop_loss_pct);
  position.take_profit_price = domain::takeProfitPrice(
      signal.side, position.entry_price, config_.take_profit_pct);
  position.order_id = order.order_id;
  position.opened_at_ms = clock_.now_ms();
  position.status = domain::PositionStatus::Pending;

  positions_.insert(position);
  positions_.updateStatus(position_id, domain::PositionStatus::Open);
  breaker_.recordTradeResult(true, signal.trade_id);
  recordActivity(std::nullopt);

  std::cout << "[Coordinator] Opened " << position_id << " size " << size
            << " @ " << position.entry_price << " (SL "
            << position.stop_loss_price << ", TP "
            << position.take_profit_price << ") order " << order.order_id
            << "\n";

  return domain::Submitted{signal.trade_id, order.order_id, position_id, size,
                           position.entry_price};
}

// -----------------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------------
void TradeExecutionCoordinator::validate(
    const domain::TradeSignal& signal) const {
  if (signal.trade_id.empty()) {
    throw ValidationError("trade_id is empty");
  }
  if (signal.market_id.empty()) {
    throw ValidationError("market_id is empty");
  }
  if (!signal.amount.isPositive()) {
    throw ValidationError("amount must be positive, got " +
                          signal.amount.toString());
  }
  if (!signal.price.isPositive()) {
    throw ValidationError("price must be positive, got " +
                          signal.price.toString());
  }
  if (signal.price < config_.min_price || signal.price > config_.max_price) {
    throw ValidationError("price " + signal.price.toString() +
                          " outside [" + config_.min_price.toString() + ", " +
                          config_.max_price.toString() + "]");
  }
  if (signal.confidence.isNegative() ||
      signal.confidence > Decimal::fromInt(1)) {
    throw ValidationError("confidence " + signal.confidence.toString() +
                          " outside [0, 1]");
  }
  if (signal.confidence < config_.min_confidence) {
    throw ValidationError("confidence " + signal.confidence.toString() +
                          " below minimum " +
                          config_.min_confidence.toString());
  }
  if (!client_.isKnownMarket(signal.market_id)) {
    throw ValidationError("unknown market " + signal.market_id);
  }

  if (signal.timestamp_ms > 0) {
    const std::int64_t age = clock_.now_ms() - signal.timestamp_ms;
    if (age > toMillis(config_.stale_signal_age)) {
      std::cerr << "[Coordinator] WARNING: signal " << signal.trade_id
                << " is " << age / 1000 << " s old\n";
    }
  }
}

// -----------------------------------------------------------------------------
// Reads with bounded retry
// -----------------------------------------------------------------------------
Decimal TradeExecutionCoordinator::fetchPrice(const std::string& market_id) {
  return retryWithBackoff<PriceUnavailableError>(
      config_.io_retry, "price fetch", [&] {
        return client_.getCurrentPrice(market_id, config_.price_timeout);
      });
}

std::optional<Decimal> TradeExecutionCoordinator::fetchBalance() {
  try {
    return retryWithBackoff<BalanceUnavailableError>(
        config_.io_retry, "balance fetch", [&] { return client_.getBalance(); });
  } catch (const BalanceUnavailableError& e) {
    std::cerr << "[Coordinator] WARNING: " << e.what()
              << ". Using proportional sizing.\n";
    return std::nullopt;
  }
}

// -----------------------------------------------------------------------------
// Supervision
// -----------------------------------------------------------------------------
std::optional<std::string> TradeExecutionCoordinator::exitReason(
    const domain::Position& position, Decimal price,
    std::int64_t now_ms) const {
  const bool is_buy = position.side == domain::Side::Buy;
  if (is_buy ? price <= position.stop_loss_price
             : price >= position.stop_loss_price) {
    return std::string(kStopLossReason);
  }
  if (is_buy ? price >= position.take_profit_price
             : price <= position.take_profit_price) {
    return std::string(kTakeProfitReason);
  }
  if (now_ms - position.opened_at_ms >= toMillis(config_.max_position_age)) {
    return std::string(kTimeExitReason);
  }
  return std::nullopt;
}

SupervisionReport TradeExecutionCoordinator::managePositions() {
  SupervisionReport report;

  for (const auto& position : positions_.snapshot()) {
    if (position.status != domain::PositionStatus::Open) {
      continue;
    }
    ++report.scanned;

    try {
      Decimal price;
      try {
        price = fetchPrice(position.market_id);
      } catch (const PriceTimeoutError& e) {
        ++report.timed_out;
        std::cerr << "[Coordinator] WARNING: " << e.what() << ". "
                  << position.id << " stays open.\n";
        continue;
      } catch (const TransientIOError& e) {
        ++report.unavailable;
        std::cerr << "[Coordinator] WARNING: " << e.what() << ". "
                  << position.id << " stays open.\n";
        continue;
      }

      auto reason = exitReason(position, price, clock_.now_ms());
      if (!reason) {
        continue;
      }

      auto result = closeWithPrice(position.id, *reason, price, &position);
      if (result.outcome == domain::CloseOutcome::Closed) {
        ++report.closed;
      } else if (result.outcome == domain::CloseOutcome::Failed) {
        ++report.failed;
      }
    } catch (const std::exception& e) {
      ++report.failed;
      std::cerr << "[Coordinator] ERROR: supervising " << position.id
                << " failed: " << e.what() << "\n";
    }
  }
  return report;
}

// -----------------------------------------------------------------------------
// Closing
// -----------------------------------------------------------------------------
domain::CloseResult TradeExecutionCoordinator::closePosition(
    const std::string& position_id, const std::string& reason) {
  try {
    return closeWithPrice(position_id, reason, std::nullopt, nullptr);
  } catch (const std::exception& e) {
    std::cerr << "[Coordinator] ERROR: closing " << position_id
              << " failed: " << e.what() << "\n";
    return domain::CloseResult{domain::CloseOutcome::Failed, position_id,
                               e.what(), Decimal{}};
  }
}

domain::CloseResult TradeExecutionCoordinator::closeWithPrice(
    const std::string& position_id, const std::string& reason,
    std::optional<Decimal> exit_price, const domain::Position* trigger) {
  domain::CloseResult result;
  result.position_id = position_id;
  result.reason = reason;

  {
    PositionLock held = positions_.acquire(position_id);

    auto current = positions_.find(position_id);
    if (!current || current->status != domain::PositionStatus::Open) {
      positions_.eraseLockIfNoPosition(position_id);
      result.outcome = domain::CloseOutcome::AlreadyClosed;
      return result;
    }
    const domain::Position position = *current;

    // A supervision trigger was evaluated before the lock was taken. The
    // position it saw may have been closed and the id reused since, or the
    // condition may no longer hold.
    if (trigger != nullptr &&
        (position.order_id != trigger->order_id ||
         position.opened_at_ms != trigger->opened_at_ms ||
         !exitReason(position, *exit_price, clock_.now_ms()))) {
      std::cout << "[Coordinator] " << position_id << ": stale " << reason
                << " trigger dropped\n";
      result.outcome = domain::CloseOutcome::AlreadyClosed;
      return result;
    }

    if (!exit_price) {
      try {
        exit_price = fetchPrice(position.market_id);
      } catch (const TransientIOError& e) {
        result.outcome = domain::CloseOutcome::Failed;
        result.reason = e.what();
        std::cerr << "[Coordinator] WARNING: cannot close " << position_id
                  << ": " << e.what() << "\n";
        return result;
      }
    }

    positions_.updateStatus(position_id, domain::PositionStatus::Closing);

    domain::OrderResult order;
    try {
      order = client_.placeOrder(position.market_id,
                                 domain::opposite(position.side),
                                 position.size, *exit_price);
      if (order.status == domain::OrderStatus::Rejected) {
        throw OrderError("close order " + order.order_id + " rejected");
      }
    } catch (const std::exception& e) {
      positions_.updateStatus(position_id, domain::PositionStatus::Open);
      result.outcome = domain::CloseOutcome::Failed;
      result.reason = e.what();
      std::cerr << "[Coordinator] ERROR: close order for " << position_id
                << " failed: " << e.what() << ". Position stays open.\n";
      return result;
    }

    const Decimal fill =
        order.filled_price.isPositive() ? order.filled_price : *exit_price;
    const Decimal pnl = domain::realizedPnl(position, fill);

    if (pnl.isNegative()) {
      breaker_.recordLoss(pnl);
    } else {
      breaker_.recordProfit(pnl);
    }
    positions_.closeAndRemove(position_id);
    recordActivity(pnl);

    result.outcome = domain::CloseOutcome::Closed;
    result.realized_pnl = pnl;
    std::cout << "[Coordinator] Closed " << position_id << " (" << reason
              << ") @ " << fill << " pnl " << pnl << "\n";
  }

  notifySafely(sink_, NotificationEvent{
                          NotificationType::PositionClosed, position_id,
                          reason + ": realized pnl " +
                              result.realized_pnl.toString(),
                          clock_.now_ms()});
  return result;
}

void TradeExecutionCoordinator::recordActivity(
    std::optional<Decimal> realized_pnl) {
  std::lock_guard lock(metrics_mutex_);
  last_trade_ms_ = clock_.now_ms();
  if (realized_pnl) {
    realized_pnl_ += *realized_pnl;
    ++closed_positions_;
  }
}

// -----------------------------------------------------------------------------
// Health and metrics
// -----------------------------------------------------------------------------
HealthReport TradeExecutionCoordinator::healthCheck() {
  HealthReport report;
  try {
    const auto breaker = breaker_.snapshot();
    report.breaker_active = breaker.active;
    report.daily_loss = breaker.daily_loss;
    report.open_positions = positions_.size();

    try {
      report.balance = retryWithBackoff<BalanceUnavailableError>(
          config_.io_retry, "balance fetch",
          [&] { return client_.getBalance(); });
    } catch (const BalanceUnavailableError& e) {
      report.warnings.push_back(std::string("balance unavailable: ") +
                                e.what());
    }

    if (report.breaker_active) {
      report.recovery_eta = breaker_.recoveryEta();
      report.warnings.push_back("circuit breaker active, recovery in " +
                                report.recovery_eta);
    }
    // More than 1.5x the configured maximum.
    if (report.open_positions * 2 > config_.max_concurrent_positions * 3) {
      report.warnings.push_back("too many open positions (" +
                                std::to_string(report.open_positions) + ")");
    }
    report.healthy = report.balance.has_value();
  } catch (const std::exception& e) {
    report.healthy = false;
    report.warnings.push_back(std::string("health check failed: ") +
                              e.what());
  }

  if (report.healthy) {
    std::cout << "[Coordinator] Health check passed. balance="
              << *report.balance << " positions=" << report.open_positions
              << " daily_loss=" << report.daily_loss << "\n";
  } else {
    std::cerr << "[Coordinator] ERROR: health check failed\n";
  }
  for (const auto& warning : report.warnings) {
    std::cerr << "[Coordinator] WARNING: health: " << warning << "\n";
  }
  return report;
}

PerformanceMetrics TradeExecutionCoordinator::performanceMetrics() const {
  PerformanceMetrics m;
  const auto breaker = breaker_.snapshot();
  m.total_trades = breaker.total_trades;
  m.failed_trades = breaker.failed_trades;
  m.successful_trades = breaker.total_trades - breaker.failed_trades;
  if (m.total_trades > 0) {
    m.success_rate =
        Decimal::fromInt(static_cast<std::int64_t>(m.successful_trades)) /
        Decimal::fromInt(static_cast<std::int64_t>(m.total_trades));
  }
  m.daily_loss = breaker.daily_loss;
  m.breaker_active = breaker.active;
  m.open_positions = positions_.size();

  std::lock_guard lock(metrics_mutex_);
  m.realized_pnl = realized_pnl_;
  m.closed_positions = closed_positions_;
  m.last_trade_ms = last_trade_ms_;
  m.uptime_ms = clock_.now_ms() - started_at_ms_;
  return m;
}

// -----------------------------------------------------------------------------
// Read accessors
// -----------------------------------------------------------------------------
std::vector<domain::Position> TradeExecutionCoordinator::openPositions() const {
  return positions_.snapshot();
}

std::optional<domain::Position> TradeExecutionCoordinator::findPosition(
    const std::string& position_id) const {
  return positions_.find(position_id);
}

std::size_t TradeExecutionCoordinator::positionLockCount() const {
  return positions_.lockCount();
}

}  // namespace copytrade
