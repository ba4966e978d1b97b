#include "copytrade/engine/copy_trade_engine.hpp"
#include "copytrade/risk/state_store.hpp"
#include "copytrade/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <utility>

namespace copytrade {

namespace {

nlohmann::json positionToJson(const domain::Position& p) {
  nlohmann::json j;
  j["id"] = p.id;
  j["market_id"] = p.market_id;
  j["trade_id"] = p.trade_id;
  j["side"] = domain::toString(p.side);
  j["size"] = p.size.toString();
  j["entry_price"] = p.entry_price.toString();
  j["stop_loss_price"] = p.stop_loss_price.toString();
  j["take_profit_price"] = p.take_profit_price.toString();
  j["order_id"] = p.order_id;
  j["opened_at"] = formatIso8601(p.opened_at_ms);
  j["status"] = domain::toString(p.status);
  return j;
}

std::string errorResponse(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = message;
  return j.dump();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: build the risk core; threads and sockets wait for start()
// -----------------------------------------------------------------------------
CopyTradeEngine::CopyTradeEngine(EngineConfig config,
                                 IOrderExecutionClient& client,
                                 const ITimeProvider& clock)
    : config_(std::move(config)), client_(client), clock_(clock) {
  if (!config_.control_cmd_endpoint.empty() &&
      !config_.control_pub_endpoint.empty()) {
    control_server_ = std::make_unique<ControlServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.control_cmd_endpoint, config_.control_pub_endpoint);
  }

  breaker_ = std::make_unique<CircuitBreaker>(
      config_.risk, StateStore(config_.risk.state_file_path), clock_,
      control_server_.get());
  coordinator_ = std::make_unique<TradeExecutionCoordinator>(
      config_.risk, *breaker_, client_, clock_, control_server_.get());

  signal_subscription_ = signal_loop_.eventBus().subscribe<SignalEvent>(
      [this](const SignalEvent& e) { onSignal(e); });
}

CopyTradeEngine::~CopyTradeEngine() {
  stop();
  signal_loop_.eventBus().unsubscribe(signal_subscription_);
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void CopyTradeEngine::start() {
  if (running_) {
    return;
  }

  signal_loop_.start();

  supervisor_ = std::make_unique<PeriodicTask>(
      "Supervisor", config_.supervision_interval,
      [this] { superviseOnce(); });
  supervisor_->start();

  running_ = true;

  try {
    if (control_server_) {
      control_server_->start();
    }
    if (!config_.signal_endpoint.empty()) {
      gateway_ = std::make_unique<SignalGateway>(
          [this](domain::TradeSignal signal) {
            pushSignal(std::move(signal));
          },
          config_.signal_endpoint);
      gateway_->start();
    }
  } catch (...) {
    stop();
    throw;
  }

  std::cout << "[CopyTradeEngine] started. supervision every "
            << config_.supervision_interval.count() << " ms\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void CopyTradeEngine::stop() {
  if (!running_) {
    return;
  }

  if (gateway_) {
    gateway_->stop();
    gateway_.reset();
  }
  signal_loop_.stop();
  if (supervisor_) {
    supervisor_->stop();
    supervisor_.reset();
  }
  if (control_server_) {
    control_server_->stop();
  }

  running_ = false;
  std::cout << "[CopyTradeEngine] stopped.\n";
}

void CopyTradeEngine::pushSignal(domain::TradeSignal signal) {
  signal_loop_.push(SignalEvent{std::move(signal), "api"});
}

// -----------------------------------------------------------------------------
// onSignal(): runs on the signal loop thread
// -----------------------------------------------------------------------------
void CopyTradeEngine::onSignal(const SignalEvent& event) {
  auto result = coordinator_->executeCopyTrade(event.signal);
  signal_loop_.eventBus().publish(
      ExecutionOutcomeEvent{event.signal.trade_id, std::move(result)});
}

SupervisionReport CopyTradeEngine::superviseOnce() {
  SupervisionReport report = coordinator_->managePositions();
  breaker_->periodicCheck();
  if (report.closed > 0 || report.failed > 0 || report.timed_out > 0) {
    std::cout << "[CopyTradeEngine] supervision: scanned=" << report.scanned
              << " closed=" << report.closed << " failed=" << report.failed
              << " timed_out=" << report.timed_out
              << " unavailable=" << report.unavailable << "\n";
  }
  return report;
}

// -----------------------------------------------------------------------------
// executeCommand(): operator commands (ControlServer thread or caller)
// -----------------------------------------------------------------------------
std::string CopyTradeEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  in >> verb;
  std::string argument;
  std::getline(in >> std::ws, argument);

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    auto breaker = StateStore::toJson(breaker_->snapshot());
    breaker["recovery_eta"] = breaker_->recoveryEta();

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& p : coordinator_->openPositions()) {
      positions.push_back(positionToJson(p));
    }

    response["status"] = "ok";
    response["running"] = running_;
    response["breaker"] = std::move(breaker);
    response["positions"] = std::move(positions);
    response["pending_signals"] = signal_loop_.pending();
  } else if (verb == "HEALTH") {
    const auto health = coordinator_->healthCheck();
    response["status"] = health.healthy ? "ok" : "error";
    response["healthy"] = health.healthy;
    if (health.balance) {
      response["balance"] = health.balance->toString();
    } else {
      response["balance"] = nullptr;
    }
    response["breaker_active"] = health.breaker_active;
    if (health.breaker_active) {
      response["recovery_eta"] = health.recovery_eta;
    }
    response["open_positions"] = health.open_positions;
    response["daily_loss"] = health.daily_loss.toString();
    response["warnings"] = health.warnings;
  } else if (verb == "METRICS") {
    const auto m = coordinator_->performanceMetrics();
    response["status"] = "ok";
    response["total_trades"] = m.total_trades;
    response["successful_trades"] = m.successful_trades;
    response["failed_trades"] = m.failed_trades;
    response["success_rate"] = m.success_rate.toString();
    response["daily_loss"] = m.daily_loss.toString();
    response["realized_pnl"] = m.realized_pnl.toString();
    response["closed_positions"] = m.closed_positions;
    response["open_positions"] = m.open_positions;
    response["breaker_active"] = m.breaker_active;
    if (m.last_trade_ms) {
      response["last_trade"] = formatIso8601(*m.last_trade_ms);
    } else {
      response["last_trade"] = nullptr;
    }
    response["uptime_seconds"] = m.uptime_ms / 1000;
  } else if (verb == "RESET") {
    const bool was_active = breaker_->isActive();
    breaker_->reset();
    response["status"] = "ok";
    response["response"] =
        was_active ? "Circuit breaker reset" : "Circuit breaker was not active";
  } else if (verb == "HALT") {
    breaker_->activate(argument.empty() ? "Manual halt" : argument);
    response["status"] = "ok";
    response["response"] = "Trading halted";
    response["recovery_eta"] = breaker_->recoveryEta();
  } else if (verb == "CLOSE") {
    if (argument.empty()) {
      return errorResponse("CLOSE requires a position id");
    }
    auto result = coordinator_->closePosition(argument, "MANUAL");
    response["status"] =
        result.outcome == domain::CloseOutcome::Failed ? "error" : "ok";
    response["response"] = domain::toString(result.outcome);
    response["position_id"] = result.position_id;
    response["realized_pnl"] = result.realized_pnl.toString();
    if (result.outcome == domain::CloseOutcome::Failed) {
      response["reason"] = result.reason;
    }
  } else {
    return errorResponse("Unknown command: " + cmd);
  }

  return response.dump();
}

}  // namespace copytrade
