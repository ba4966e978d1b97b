// =============================================================================
// trade_execution_coordinator_test.cpp
// =============================================================================
// Unit tests for copytrade::TradeExecutionCoordinator against the mock
// exchange client and a real CircuitBreaker.
//
// Validates:
//   - executeCopyTrade(): gate, validation, sizing, placement, failure cleanup
//   - managePositions(): stop-loss, take-profit and time exits feeding the
//     breaker; timeouts and missing quotes leave positions untouched
//   - managePositions(): a trigger seen before the position was closed and
//     its id reused does not close the new position
//   - closePosition(): idempotent, and a failed close order keeps the
//     position open
//   - healthCheck() / performanceMetrics()
//   - Concurrency: two closers issue one close order; concurrent signals for
//     one market open one position
//
// Defaults used below: price 0.5, amount 100, balance 1000 → size 10,
// stop-loss 0.45, take-profit 0.6.
// =============================================================================

#include "copytrade/execution/mock_order_execution_client.hpp"
#include "copytrade/execution/trade_execution_coordinator.hpp"
#include "copytrade/risk/circuit_breaker.hpp"
#include "copytrade/risk/state_store.hpp"
#include "copytrade/time/simulation_time_provider.hpp"
#include "copytrade/time/time_utils.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace copytrade;
using copytrade::test_support::dec;
using copytrade::test_support::fastRiskConfig;
using copytrade::test_support::kNoonMs;
using copytrade::test_support::makeSignal;
using copytrade::test_support::RecordingSink;
using copytrade::test_support::ScratchDir;

// Forwards to the mock exchange and runs a one-shot callback inside the next
// quote request, so a test can interleave work with a supervision pass.
class InterleavingClient : public IOrderExecutionClient {
 public:
  explicit InterleavingClient(MockOrderExecutionClient& inner)
      : inner_(inner) {}

  void runDuringNextQuote(std::function<void()> hook) {
    hook_ = std::move(hook);
  }

  domain::OrderResult placeOrder(const std::string& market_id,
                                 domain::Side side, Decimal size,
                                 Decimal price) override {
    return inner_.placeOrder(market_id, side, size, price);
  }
  Decimal getCurrentPrice(const std::string& market_id,
                          std::chrono::milliseconds timeout) override {
    const Decimal price = inner_.getCurrentPrice(market_id, timeout);
    if (hook_) {
      auto hook = std::move(hook_);
      hook_ = nullptr;
      hook();
    }
    return price;
  }
  Decimal getBalance() override { return inner_.getBalance(); }
  bool isKnownMarket(const std::string& market_id) const override {
    return inner_.isKnownMarket(market_id);
  }

 private:
  MockOrderExecutionClient& inner_;
  std::function<void()> hook_;
};

class TradeExecutionCoordinatorTest : public ::testing::Test {
 protected:
  TradeExecutionCoordinatorTest()
      : clock(kNoonMs),
        config(fastRiskConfig(dir.file("breaker.json"))),
        client(clock) {}

  void SetUp() override {
    client.setPrice("m1", dec("0.5"));
    client.setPrice("m2", dec("0.5"));
    client.setBalance(dec("1000"));
    build();
  }

  // (Re)creates the breaker and coordinator from the current config.
  void build() {
    coordinator.reset();
    breaker.reset();
    breaker = std::make_unique<CircuitBreaker>(
        config, StateStore(config.state_file_path), clock, &sink);
    coordinator = std::make_unique<TradeExecutionCoordinator>(
        config, *breaker, client, clock, &sink);
  }

  domain::Submitted openM1(domain::Side side = domain::Side::Buy) {
    auto result = coordinator->executeCopyTrade(makeSignal("open", "m1", side));
    EXPECT_TRUE(std::holds_alternative<domain::Submitted>(result));
    return std::get<domain::Submitted>(result);
  }

  ScratchDir dir;
  SimulationTimeProvider clock;
  domain::RiskConfig config;
  MockOrderExecutionClient client;
  RecordingSink sink;
  std::unique_ptr<CircuitBreaker> breaker;
  std::unique_ptr<TradeExecutionCoordinator> coordinator;
};

// =============================================================================
// executeCopyTrade
// =============================================================================

TEST_F(TradeExecutionCoordinatorTest, SubmitsAndOpensPosition) {
  auto result = coordinator->executeCopyTrade(makeSignal("t-1", "m1"));

  ASSERT_TRUE(std::holds_alternative<domain::Submitted>(result));
  const auto& ok = std::get<domain::Submitted>(result);
  EXPECT_EQ(ok.trade_id, "t-1");
  EXPECT_EQ(ok.position_id, "m1_BUY");
  EXPECT_EQ(ok.size, dec("10"));
  EXPECT_EQ(ok.entry_price, dec("0.5"));
  EXPECT_FALSE(ok.order_id.empty());

  auto position = coordinator->findPosition("m1_BUY");
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->status, domain::PositionStatus::Open);
  EXPECT_EQ(position->stop_loss_price, dec("0.45"));
  EXPECT_EQ(position->take_profit_price, dec("0.6"));
  EXPECT_EQ(position->order_id, ok.order_id);
  EXPECT_EQ(position->opened_at_ms, kNoonMs);

  const auto orders = client.placedOrders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].side, domain::Side::Buy);
  EXPECT_EQ(orders[0].size, dec("10"));
  EXPECT_EQ(orders[0].price, dec("0.5"));

  EXPECT_EQ(breaker->snapshot().total_trades, 1u);
  EXPECT_EQ(sink.count(NotificationType::TradeSubmitted), 1u);
}

// -----------------------------------------------------------------------------
// 1. An active breaker skips the trade with its reason and ETA. Nothing is
//    sent to the exchange and no position or lock appears.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, SkipsWhileBreakerActive) {
  breaker->activate("test");

  auto result = coordinator->executeCopyTrade(makeSignal("t-1", "m1"));

  ASSERT_TRUE(std::holds_alternative<domain::Skipped>(result));
  const auto& skipped = std::get<domain::Skipped>(result);
  EXPECT_EQ(skipped.kind, domain::SkipKind::CircuitBreaker);
  EXPECT_EQ(skipped.reason, "test");
  EXPECT_EQ(skipped.recovery_eta, "1h 0m");
  EXPECT_EQ(client.placedOrderCount(), 0u);
  EXPECT_TRUE(coordinator->openPositions().empty());
  EXPECT_EQ(coordinator->positionLockCount(), 0u);
}

TEST_F(TradeExecutionCoordinatorTest, InvalidSignalsAreSkipped) {
  std::vector<domain::TradeSignal> bad;

  auto s = makeSignal("t-amount", "m1");
  s.amount = dec("0");
  bad.push_back(s);

  s = makeSignal("t-price", "m1");
  s.price = dec("0");
  bad.push_back(s);

  s = makeSignal("t-band", "m1");
  s.price = dec("1.5");
  bad.push_back(s);

  s = makeSignal("t-confidence", "m1");
  s.confidence = dec("0.2");
  bad.push_back(s);

  s = makeSignal("t-market", "unknown");
  bad.push_back(s);

  s = makeSignal("", "m1");
  bad.push_back(s);

  for (const auto& signal : bad) {
    auto result = coordinator->executeCopyTrade(signal);
    ASSERT_TRUE(std::holds_alternative<domain::Skipped>(result))
        << signal.trade_id;
    EXPECT_EQ(std::get<domain::Skipped>(result).kind,
              domain::SkipKind::ValidationError)
        << signal.trade_id;
    EXPECT_FALSE(std::get<domain::Skipped>(result).reason.empty());
  }

  EXPECT_EQ(client.placedOrderCount(), 0u);
  EXPECT_EQ(coordinator->positionLockCount(), 0u);
  EXPECT_EQ(client.priceRequestCount("unknown"), 0);
}

// A stale signal is logged but still executed.
TEST_F(TradeExecutionCoordinatorTest, StaleSignalStillExecutes) {
  auto signal = makeSignal("t-old", "m1");
  signal.timestamp_ms = kNoonMs - kMillisPerHour;

  auto result = coordinator->executeCopyTrade(signal);
  EXPECT_TRUE(std::holds_alternative<domain::Submitted>(result));
}

// -----------------------------------------------------------------------------
// 2. A rejected order leaves no position and no lock entry behind, and is
//    counted as a failed trade.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, FailedOrderLeavesNoPartialState) {
  client.failNextOrders(1);

  auto result = coordinator->executeCopyTrade(makeSignal("t-1", "m1"));

  ASSERT_TRUE(std::holds_alternative<domain::Failed>(result));
  EXPECT_EQ(std::get<domain::Failed>(result).trade_id, "t-1");
  EXPECT_TRUE(coordinator->openPositions().empty());
  EXPECT_EQ(coordinator->positionLockCount(), 0u);
  EXPECT_EQ(breaker->snapshot().failed_trades, 1u);
  EXPECT_FALSE(breaker->isActive());
  EXPECT_EQ(sink.count(NotificationType::TradeFailed), 1u);

  // Placement is not retried; the next signal goes through normally.
  EXPECT_EQ(client.placedOrderCount(), 0u);
  auto retry = coordinator->executeCopyTrade(makeSignal("t-2", "m1"));
  EXPECT_TRUE(std::holds_alternative<domain::Submitted>(retry));
}

TEST_F(TradeExecutionCoordinatorTest, DuplicatePositionIsSkipped) {
  openM1();

  auto again = coordinator->executeCopyTrade(makeSignal("t-2", "m1"));
  ASSERT_TRUE(std::holds_alternative<domain::Skipped>(again));
  EXPECT_EQ(std::get<domain::Skipped>(again).kind,
            domain::SkipKind::ValidationError);

  // The opposite direction is a different position.
  auto sell = coordinator->executeCopyTrade(
      makeSignal("t-3", "m1", domain::Side::Sell));
  EXPECT_TRUE(std::holds_alternative<domain::Submitted>(sell));
  EXPECT_EQ(client.placedOrderCount(), 2u);
  EXPECT_EQ(coordinator->openPositions().size(), 2u);
}

TEST_F(TradeExecutionCoordinatorTest, ConcurrentPositionLimit) {
  config.max_concurrent_positions = 1;
  build();
  openM1();

  auto result = coordinator->executeCopyTrade(makeSignal("t-2", "m2"));
  ASSERT_TRUE(std::holds_alternative<domain::Skipped>(result));
  EXPECT_EQ(coordinator->openPositions().size(), 1u);
  EXPECT_EQ(coordinator->positionLockCount(), 1u);
}

// -----------------------------------------------------------------------------
// 3. Sizing degrades: no balance → proportional sizing, no quote → the
//    signal price stands in for the current price.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, BalanceUnavailableUsesProportionalSize) {
  client.setBalance(dec("100"));
  auto with_balance = coordinator->executeCopyTrade(
      makeSignal("t-1", "m1", domain::Side::Buy, "0.5", "2000"));
  ASSERT_TRUE(std::holds_alternative<domain::Submitted>(with_balance));
  EXPECT_EQ(std::get<domain::Submitted>(with_balance).size, dec("20"));

  client.setBalanceUnavailable(true);
  auto without = coordinator->executeCopyTrade(
      makeSignal("t-2", "m2", domain::Side::Buy, "0.5", "2000"));
  ASSERT_TRUE(std::holds_alternative<domain::Submitted>(without));
  EXPECT_EQ(std::get<domain::Submitted>(without).size, dec("100"));
}

TEST_F(TradeExecutionCoordinatorTest, MissingQuoteFallsBackToSignalPrice) {
  client.setPriceUnavailable("m1", 100);

  auto result = coordinator->executeCopyTrade(makeSignal("t-1", "m1"));

  ASSERT_TRUE(std::holds_alternative<domain::Submitted>(result));
  EXPECT_EQ(std::get<domain::Submitted>(result).size, dec("10"));
  EXPECT_EQ(client.priceRequestCount("m1"), config.io_retry.max_attempts);
}

// -----------------------------------------------------------------------------
// 4. Concurrent signals for the same market open exactly one position.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, ConcurrentSignalsOpenOnePosition) {
  constexpr int kThreads = 6;
  client.setPlaceOrderDelay(std::chrono::milliseconds(20));

  std::atomic<int> submitted{0};
  std::atomic<int> skipped{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      auto r = coordinator->executeCopyTrade(
          makeSignal("t-" + std::to_string(i), "m1"));
      if (std::holds_alternative<domain::Submitted>(r)) {
        ++submitted;
      } else if (std::holds_alternative<domain::Skipped>(r)) {
        ++skipped;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(submitted.load(), 1);
  EXPECT_EQ(skipped.load(), kThreads - 1);
  EXPECT_EQ(client.placedOrderCount(), 1u);
  EXPECT_EQ(coordinator->openPositions().size(), 1u);
}

// =============================================================================
// managePositions
// =============================================================================

// -----------------------------------------------------------------------------
// 5. Stop-loss: the close order is the opposite side, the loss reaches the
//    breaker, and the position leaves the table together with its lock.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, StopLossClosesAndRecordsLoss) {
  openM1();
  client.setPrice("m1", dec("0.44"));

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.scanned, 1u);
  EXPECT_EQ(report.closed, 1u);
  EXPECT_EQ(report.failed, 0u);
  EXPECT_FALSE(coordinator->findPosition("m1_BUY").has_value());
  EXPECT_EQ(coordinator->positionLockCount(), 0u);

  const auto orders = client.placedOrders();
  ASSERT_EQ(orders.size(), 2u);
  EXPECT_EQ(orders[1].side, domain::Side::Sell);
  EXPECT_EQ(orders[1].size, dec("10"));
  EXPECT_EQ(orders[1].price, dec("0.44"));

  EXPECT_EQ(breaker->dailyLoss(), dec("0.6"));
  EXPECT_EQ(breaker->consecutiveLosses(), 1);
  EXPECT_EQ(sink.count(NotificationType::PositionClosed), 1u);
}

TEST_F(TradeExecutionCoordinatorTest, SellStopLossClosesWithBuy) {
  openM1(domain::Side::Sell);
  client.setPrice("m1", dec("0.56"));

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.closed, 1u);
  EXPECT_EQ(client.placedOrders().back().side, domain::Side::Buy);
  EXPECT_EQ(breaker->dailyLoss(), dec("0.6"));
}

TEST_F(TradeExecutionCoordinatorTest, TakeProfitRecordsProfit) {
  breaker->recordLoss(dec("1"));
  openM1();
  client.setPrice("m1", dec("0.65"));

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.closed, 1u);
  EXPECT_EQ(breaker->consecutiveLosses(), 0);
  EXPECT_EQ(breaker->dailyLoss(), dec("1"));
}

TEST_F(TradeExecutionCoordinatorTest, PositionInsideBandStaysOpen) {
  openM1();
  client.setPrice("m1", dec("0.52"));

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.scanned, 1u);
  EXPECT_EQ(report.closed, 0u);
  EXPECT_TRUE(coordinator->findPosition("m1_BUY").has_value());
  EXPECT_EQ(client.placedOrderCount(), 1u);
}

TEST_F(TradeExecutionCoordinatorTest, MaxAgeTriggersTimeExit) {
  openM1();
  clock.advance(config.max_position_age);

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.closed, 1u);
  EXPECT_FALSE(coordinator->findPosition("m1_BUY").has_value());
  EXPECT_EQ(breaker->consecutiveLosses(), 0);
  const auto events = sink.events();
  ASSERT_FALSE(events.empty());
  EXPECT_EQ(events.back().type, NotificationType::PositionClosed);
  EXPECT_NE(events.back().message.find(kTimeExitReason), std::string::npos);
}

// -----------------------------------------------------------------------------
// 6. A timed-out price leaves the position Open and untouched; the fetch is
//    not retried inside the pass.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, PriceTimeoutLeavesPositionOpen) {
  openM1();
  const int requests_before = client.priceRequestCount("m1");
  client.setPriceTimeout("m1", true);

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.timed_out, 1u);
  EXPECT_EQ(report.closed, 0u);
  EXPECT_EQ(client.priceRequestCount("m1"), requests_before + 1);
  auto position = coordinator->findPosition("m1_BUY");
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->status, domain::PositionStatus::Open);
  EXPECT_EQ(client.placedOrderCount(), 1u);

  // Next pass, quote is back and below the stop.
  client.setPriceTimeout("m1", false);
  client.setPrice("m1", dec("0.4"));
  EXPECT_EQ(coordinator->managePositions().closed, 1u);
}

TEST_F(TradeExecutionCoordinatorTest, TransientQuoteGapIsRetried) {
  openM1();
  client.setPrice("m1", dec("0.44"));
  client.setPriceUnavailable("m1", config.io_retry.max_attempts - 1);

  EXPECT_EQ(coordinator->managePositions().closed, 1u);
}

TEST_F(TradeExecutionCoordinatorTest, PersistentQuoteGapIsReported) {
  openM1();
  client.setPriceUnavailable("m1", 100);

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.unavailable, 1u);
  EXPECT_TRUE(coordinator->findPosition("m1_BUY").has_value());
}

// -----------------------------------------------------------------------------
// 7. A failed close order reverts Closing → Open and reports nothing to the
//    breaker; the next pass retries the close.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, FailedCloseOrderKeepsPositionOpen) {
  openM1();
  client.setPrice("m1", dec("0.44"));
  client.failNextOrders(1);

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.failed, 1u);
  auto position = coordinator->findPosition("m1_BUY");
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->status, domain::PositionStatus::Open);
  EXPECT_TRUE(breaker->dailyLoss().isZero());

  EXPECT_EQ(coordinator->managePositions().closed, 1u);
  EXPECT_EQ(breaker->dailyLoss(), dec("0.6"));
}

// -----------------------------------------------------------------------------
// 8. Losses from closes trip the breaker, which then gates new signals.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, CloseLossesActivateBreaker) {
  config.max_daily_loss = dec("0.5");
  build();
  openM1();
  client.setPrice("m1", dec("0.44"));

  coordinator->managePositions();

  EXPECT_TRUE(breaker->isActive());
  auto result = coordinator->executeCopyTrade(makeSignal("t-next", "m2"));
  ASSERT_TRUE(std::holds_alternative<domain::Skipped>(result));
  EXPECT_EQ(std::get<domain::Skipped>(result).kind,
            domain::SkipKind::CircuitBreaker);
}

// =============================================================================
// closePosition
// =============================================================================

TEST_F(TradeExecutionCoordinatorTest, ManualCloseIsIdempotent) {
  openM1();
  client.setPrice("m1", dec("0.55"));

  auto first = coordinator->closePosition("m1_BUY", "MANUAL");
  EXPECT_EQ(first.outcome, domain::CloseOutcome::Closed);
  EXPECT_EQ(first.realized_pnl, dec("0.5"));

  auto second = coordinator->closePosition("m1_BUY", "MANUAL");
  EXPECT_EQ(second.outcome, domain::CloseOutcome::AlreadyClosed);

  auto unknown = coordinator->closePosition("nope_BUY", "MANUAL");
  EXPECT_EQ(unknown.outcome, domain::CloseOutcome::AlreadyClosed);

  EXPECT_EQ(client.placedOrderCount(), 2u);
  EXPECT_EQ(coordinator->positionLockCount(), 0u);
}

TEST_F(TradeExecutionCoordinatorTest, ManualCloseWithoutQuoteFails) {
  openM1();
  client.setPriceTimeout("m1", true);

  auto result = coordinator->closePosition("m1_BUY", "MANUAL");

  EXPECT_EQ(result.outcome, domain::CloseOutcome::Failed);
  auto position = coordinator->findPosition("m1_BUY");
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->status, domain::PositionStatus::Open);
}

// -----------------------------------------------------------------------------
// 9. Two concurrent closers of one position: one close order, one Closed,
//    one AlreadyClosed, and a single loss reported.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, ConcurrentClosesIssueOneOrder) {
  openM1();
  client.setPrice("m1", dec("0.44"));
  client.setPlaceOrderDelay(std::chrono::milliseconds(50));

  domain::CloseResult a;
  domain::CloseResult b;
  std::thread first([&] { a = coordinator->closePosition("m1_BUY", "A"); });
  std::thread second([&] { b = coordinator->closePosition("m1_BUY", "B"); });
  first.join();
  second.join();

  const int closed = (a.outcome == domain::CloseOutcome::Closed) +
                     (b.outcome == domain::CloseOutcome::Closed);
  const int already = (a.outcome == domain::CloseOutcome::AlreadyClosed) +
                      (b.outcome == domain::CloseOutcome::AlreadyClosed);
  EXPECT_EQ(closed, 1);
  EXPECT_EQ(already, 1);
  EXPECT_EQ(client.placedOrderCount(), 2u);
  EXPECT_EQ(breaker->consecutiveLosses(), 1);
  EXPECT_EQ(breaker->dailyLoss(), dec("0.6"));
  EXPECT_EQ(coordinator->positionLockCount(), 0u);
}

// Supervision racing a manual close still closes once.
TEST_F(TradeExecutionCoordinatorTest, SupervisionRacingManualClose) {
  openM1();
  client.setPrice("m1", dec("0.44"));
  client.setPlaceOrderDelay(std::chrono::milliseconds(30));

  SupervisionReport report;
  domain::CloseResult manual;
  std::thread supervisor([&] { report = coordinator->managePositions(); });
  std::thread operator_thread(
      [&] { manual = coordinator->closePosition("m1_BUY", "MANUAL"); });
  supervisor.join();
  operator_thread.join();

  EXPECT_EQ(client.placedOrderCount(), 2u);
  EXPECT_EQ(breaker->consecutiveLosses(), 1);
  EXPECT_FALSE(coordinator->findPosition("m1_BUY").has_value());
}

// -----------------------------------------------------------------------------
// 10. Supervision quotes m1_BUY below its stop. Before it takes the position
//     lock, an operator closes the position and a new signal reopens m1_BUY
//     at the current price. The stale stop-loss must not close the new
//     position.
// -----------------------------------------------------------------------------
TEST_F(TradeExecutionCoordinatorTest, StaleTriggerSparesReopenedPosition) {
  InterleavingClient interleaving(client);
  coordinator.reset();
  coordinator = std::make_unique<TradeExecutionCoordinator>(
      config, *breaker, interleaving, clock, &sink);

  openM1();
  const auto original = coordinator->findPosition("m1_BUY");
  ASSERT_TRUE(original.has_value());
  client.setPrice("m1", dec("0.44"));

  interleaving.runDuringNextQuote([&] {
    EXPECT_EQ(coordinator->closePosition("m1_BUY", "MANUAL").outcome,
              domain::CloseOutcome::Closed);
    auto reopened = coordinator->executeCopyTrade(
        makeSignal("reopen", "m1", domain::Side::Buy, "0.44"));
    EXPECT_TRUE(std::holds_alternative<domain::Submitted>(reopened));
  });

  auto report = coordinator->managePositions();

  EXPECT_EQ(report.closed, 0u);
  EXPECT_EQ(report.failed, 0u);
  auto position = coordinator->findPosition("m1_BUY");
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->status, domain::PositionStatus::Open);
  EXPECT_EQ(position->entry_price, dec("0.44"));
  EXPECT_NE(position->order_id, original->order_id);
  // Open, manual close, reopen. No supervision close order.
  EXPECT_EQ(client.placedOrderCount(), 3u);
  EXPECT_EQ(breaker->consecutiveLosses(), 1);
}

// =============================================================================
// healthCheck / performanceMetrics
// =============================================================================

TEST_F(TradeExecutionCoordinatorTest, HealthyWhenBalanceReadable) {
  openM1();

  auto health = coordinator->healthCheck();

  EXPECT_TRUE(health.healthy);
  ASSERT_TRUE(health.balance.has_value());
  EXPECT_EQ(*health.balance, client.getBalance());
  EXPECT_FALSE(health.breaker_active);
  EXPECT_EQ(health.open_positions, 1u);
  EXPECT_TRUE(health.warnings.empty());
}

TEST_F(TradeExecutionCoordinatorTest, UnreadableBalanceIsUnhealthy) {
  client.setBalanceUnavailable(true);

  auto health = coordinator->healthCheck();

  EXPECT_FALSE(health.healthy);
  EXPECT_FALSE(health.balance.has_value());
  EXPECT_FALSE(health.warnings.empty());
}

// An active breaker is reported as a warning; the executor is still healthy.
TEST_F(TradeExecutionCoordinatorTest, ActiveBreakerIsAWarning) {
  breaker->activate("operator halt");

  auto health = coordinator->healthCheck();

  EXPECT_TRUE(health.healthy);
  EXPECT_TRUE(health.breaker_active);
  EXPECT_FALSE(health.recovery_eta.empty());
  ASSERT_EQ(health.warnings.size(), 1u);
}

TEST_F(TradeExecutionCoordinatorTest, MetricsTrackTradesAndRealizedPnl) {
  auto before = coordinator->performanceMetrics();
  EXPECT_EQ(before.total_trades, 0u);
  EXPECT_TRUE(before.success_rate.isZero());
  EXPECT_FALSE(before.last_trade_ms.has_value());

  openM1();
  client.failNextOrders(1);
  coordinator->executeCopyTrade(makeSignal("t-2", "m2"));
  clock.advance(std::chrono::minutes(5));
  client.setPrice("m1", dec("0.55"));
  ASSERT_EQ(coordinator->closePosition("m1_BUY", "MANUAL").outcome,
            domain::CloseOutcome::Closed);

  auto m = coordinator->performanceMetrics();
  EXPECT_EQ(m.total_trades, 2u);
  EXPECT_EQ(m.successful_trades, 1u);
  EXPECT_EQ(m.failed_trades, 1u);
  EXPECT_EQ(m.success_rate, dec("0.5"));
  EXPECT_EQ(m.closed_positions, 1u);
  EXPECT_EQ(m.realized_pnl, dec("0.5"));
  EXPECT_EQ(m.open_positions, 0u);
  ASSERT_TRUE(m.last_trade_ms.has_value());
  EXPECT_EQ(*m.last_trade_ms, clock.now_ms());
  EXPECT_EQ(m.uptime_ms, 5 * 60 * 1000);
}
