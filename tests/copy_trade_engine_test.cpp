// =============================================================================
// copy_trade_engine_test.cpp
// =============================================================================
// Integration tests for copytrade::CopyTradeEngine without sockets: signals
// go in through pushSignal(), operator commands through executeCommand().
//
// Validates:
//   - PING / STATUS / HEALTH / METRICS / HALT / RESET / CLOSE and unknown
//     commands
//   - Signals flow through the signal loop and produce ExecutionOutcomeEvents
//   - HALT blocks new signals until RESET
//   - superviseOnce() closes positions and feeds the breaker
//   - Breaker state survives an engine restart
// =============================================================================

#include "copytrade/engine/copy_trade_engine.hpp"
#include "copytrade/execution/mock_order_execution_client.hpp"
#include "copytrade/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>

using namespace copytrade;
using copytrade::test_support::dec;
using copytrade::test_support::fastRiskConfig;
using copytrade::test_support::kNoonMs;
using copytrade::test_support::makeSignal;
using copytrade::test_support::ScratchDir;

class CopyTradeEngineTest : public ::testing::Test {
 protected:
  CopyTradeEngineTest() : clock(kNoonMs), client(clock) {
    config.risk = fastRiskConfig(dir.file("breaker.json"));
    config.signal_endpoint.clear();
    config.control_cmd_endpoint.clear();
    config.control_pub_endpoint.clear();
    config.supervision_interval = std::chrono::hours(1);

    client.setPrice("m1", dec("0.5"));
    client.setBalance(dec("1000"));
    engine = std::make_unique<CopyTradeEngine>(config, client, clock);
  }

  nlohmann::json command(const std::string& cmd) {
    return nlohmann::json::parse(engine->executeCommand(cmd));
  }

  // Pushes one signal through the running signal loop and waits for its
  // outcome.
  domain::ExecutionResult executeThroughLoop(const domain::TradeSignal& signal) {
    auto outcome = std::make_shared<std::promise<domain::ExecutionResult>>();
    const std::string trade_id = signal.trade_id;
    const auto id = engine->signalEventBus().subscribe<ExecutionOutcomeEvent>(
        [outcome, trade_id](const ExecutionOutcomeEvent& e) {
          if (e.trade_id == trade_id) {
            outcome->set_value(e.result);
          }
        });
    auto future = outcome->get_future();
    engine->pushSignal(signal);
    const auto status = future.wait_for(std::chrono::seconds(2));
    engine->signalEventBus().unsubscribe(id);
    if (status != std::future_status::ready) {
      ADD_FAILURE() << "no outcome for " << trade_id;
      return domain::Failed{trade_id, "timed out"};
    }
    return future.get();
  }

  ScratchDir dir;
  SimulationTimeProvider clock;
  MockOrderExecutionClient client;
  EngineConfig config;
  std::unique_ptr<CopyTradeEngine> engine;
};

TEST_F(CopyTradeEngineTest, PingAndUnknownCommands) {
  auto ping = command("PING");
  EXPECT_EQ(ping.at("status"), "ok");
  EXPECT_EQ(ping.at("response"), "PONG");

  auto unknown = command("LAUNCH rockets");
  EXPECT_EQ(unknown.at("status"), "error");
  EXPECT_EQ(unknown.at("response"), "Unknown command: LAUNCH rockets");
}

TEST_F(CopyTradeEngineTest, StatusReportsBreakerAndPositions) {
  auto opened = engine->coordinator().executeCopyTrade(makeSignal("t-1", "m1"));
  ASSERT_TRUE(std::holds_alternative<domain::Submitted>(opened));

  auto status = command("STATUS");
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_EQ(status.at("running"), false);
  EXPECT_EQ(status.at("breaker").at("active"), false);
  EXPECT_EQ(status.at("breaker").at("max_daily_loss"), "100");
  EXPECT_TRUE(status.at("breaker").contains("recovery_eta"));
  ASSERT_EQ(status.at("positions").size(), 1u);
  EXPECT_EQ(status.at("positions")[0].at("id"), "m1_BUY");
  EXPECT_EQ(status.at("positions")[0].at("size"), "10");
  EXPECT_EQ(status.at("positions")[0].at("stop_loss_price"), "0.45");
  EXPECT_EQ(status.at("pending_signals"), 0);
}

// -----------------------------------------------------------------------------
// 1. HALT activates the breaker with the operator's reason; RESET clears it.
// -----------------------------------------------------------------------------
TEST_F(CopyTradeEngineTest, HaltAndReset) {
  auto halt = command("HALT exchange maintenance");
  EXPECT_EQ(halt.at("status"), "ok");
  EXPECT_EQ(halt.at("response"), "Trading halted");
  EXPECT_EQ(halt.at("recovery_eta"), "1h 0m");
  EXPECT_TRUE(engine->circuitBreaker().isActive());
  EXPECT_EQ(engine->circuitBreaker().snapshot().reason,
            std::optional<std::string>("exchange maintenance"));

  auto reset = command("RESET");
  EXPECT_EQ(reset.at("response"), "Circuit breaker reset");
  EXPECT_FALSE(engine->circuitBreaker().isActive());

  auto again = command("RESET");
  EXPECT_EQ(again.at("response"), "Circuit breaker was not active");
}

TEST_F(CopyTradeEngineTest, CloseCommand) {
  engine->coordinator().executeCopyTrade(makeSignal("t-1", "m1"));
  client.setPrice("m1", dec("0.55"));

  auto closed = command("CLOSE m1_BUY");
  EXPECT_EQ(closed.at("status"), "ok");
  EXPECT_EQ(closed.at("response"), "Closed");
  EXPECT_EQ(closed.at("position_id"), "m1_BUY");
  EXPECT_EQ(closed.at("realized_pnl"), "0.5");

  auto repeat = command("CLOSE m1_BUY");
  EXPECT_EQ(repeat.at("status"), "ok");
  EXPECT_EQ(repeat.at("response"), "AlreadyClosed");

  auto missing = command("CLOSE");
  EXPECT_EQ(missing.at("status"), "error");
}

TEST_F(CopyTradeEngineTest, HealthCommand) {
  auto healthy = command("HEALTH");
  EXPECT_EQ(healthy.at("status"), "ok");
  EXPECT_TRUE(healthy.at("healthy").get<bool>());
  EXPECT_EQ(healthy.at("balance"), "1000");
  EXPECT_FALSE(healthy.at("breaker_active").get<bool>());
  EXPECT_TRUE(healthy.at("warnings").empty());

  command("HALT maintenance");
  auto halted = command("HEALTH");
  EXPECT_TRUE(halted.at("healthy").get<bool>());
  EXPECT_TRUE(halted.at("breaker_active").get<bool>());
  EXPECT_EQ(halted.at("warnings").size(), 1u);

  client.setBalanceUnavailable(true);
  auto broken = command("HEALTH");
  EXPECT_EQ(broken.at("status"), "error");
  EXPECT_FALSE(broken.at("healthy").get<bool>());
  EXPECT_TRUE(broken.at("balance").is_null());
}

TEST_F(CopyTradeEngineTest, MetricsCommand) {
  auto empty = command("METRICS");
  EXPECT_EQ(empty.at("status"), "ok");
  EXPECT_EQ(empty.at("total_trades"), 0);
  EXPECT_TRUE(empty.at("last_trade").is_null());

  engine->coordinator().executeCopyTrade(makeSignal("t-1", "m1"));
  clock.advance(std::chrono::seconds(90));
  client.setPrice("m1", dec("0.55"));
  command("CLOSE m1_BUY");

  auto m = command("METRICS");
  EXPECT_EQ(m.at("total_trades"), 1);
  EXPECT_EQ(m.at("successful_trades"), 1);
  EXPECT_EQ(m.at("failed_trades"), 0);
  EXPECT_EQ(m.at("success_rate"), "1");
  EXPECT_EQ(m.at("closed_positions"), 1);
  EXPECT_EQ(m.at("open_positions"), 0);
  EXPECT_EQ(m.at("realized_pnl"), "0.5");
  EXPECT_EQ(m.at("last_trade"), "2026-10-19T12:01:30.000Z");
  EXPECT_EQ(m.at("uptime_seconds"), 90);
}

// -----------------------------------------------------------------------------
// 2. Signals pushed into the running engine are executed on the signal loop
//    and their outcome is published on the same bus.
// -----------------------------------------------------------------------------
TEST_F(CopyTradeEngineTest, SignalLoopExecutesPushedSignals) {
  engine->start();
  EXPECT_TRUE(engine->running());

  auto result = executeThroughLoop(makeSignal("t-1", "m1"));
  ASSERT_TRUE(std::holds_alternative<domain::Submitted>(result));
  EXPECT_EQ(std::get<domain::Submitted>(result).position_id, "m1_BUY");
  EXPECT_EQ(client.placedOrderCount(), 1u);

  engine->stop();
  EXPECT_FALSE(engine->running());
}

// -----------------------------------------------------------------------------
// 3. While halted, signals are skipped with the breaker as the reason.
// Why: HALT is the operator's emergency stop; it must hold for signals that
//      were already on their way.
// -----------------------------------------------------------------------------
TEST_F(CopyTradeEngineTest, HaltedEngineSkipsSignals) {
  engine->start();
  command("HALT");

  auto blocked = executeThroughLoop(makeSignal("t-1", "m1"));
  ASSERT_TRUE(std::holds_alternative<domain::Skipped>(blocked));
  EXPECT_EQ(std::get<domain::Skipped>(blocked).kind,
            domain::SkipKind::CircuitBreaker);
  EXPECT_EQ(client.placedOrderCount(), 0u);

  command("RESET");
  auto allowed = executeThroughLoop(makeSignal("t-2", "m1"));
  EXPECT_TRUE(std::holds_alternative<domain::Submitted>(allowed));
  engine->stop();
}

TEST_F(CopyTradeEngineTest, SuperviseOnceClosesAndFeedsBreaker) {
  engine->coordinator().executeCopyTrade(makeSignal("t-1", "m1"));
  client.setPrice("m1", dec("0.44"));

  auto report = engine->superviseOnce();

  EXPECT_EQ(report.scanned, 1u);
  EXPECT_EQ(report.closed, 1u);
  EXPECT_TRUE(engine->coordinator().openPositions().empty());
  EXPECT_EQ(engine->circuitBreaker().snapshot().daily_loss, dec("0.6"));
  EXPECT_EQ(engine->circuitBreaker().consecutiveLosses(), 1);
}

// -----------------------------------------------------------------------------
// 4. A halt survives a restart of the whole engine.
// Why: a crash loop must not be a way around the circuit breaker.
// -----------------------------------------------------------------------------
TEST_F(CopyTradeEngineTest, HaltSurvivesRestart) {
  command("HALT manual");
  engine.reset();

  clock.advance(std::chrono::minutes(10));
  engine = std::make_unique<CopyTradeEngine>(config, client, clock);

  EXPECT_TRUE(engine->circuitBreaker().isActive());
  EXPECT_EQ(command("STATUS").at("breaker").at("recovery_eta"), "50 minutes");
}
