#pragma once

#include "copytrade/concurrent/event_loop_thread.hpp"
#include "copytrade/concurrent/periodic_task.hpp"
#include "copytrade/config/config_loader.hpp"
#include "copytrade/domain/trade_signal.hpp"
#include "copytrade/execution/i_order_execution_client.hpp"
#include "copytrade/execution/trade_execution_coordinator.hpp"
#include "copytrade/gateway/signal_gateway.hpp"
#include "copytrade/network/control_server.hpp"
#include "copytrade/risk/circuit_breaker.hpp"
#include "copytrade/time/i_time_provider.hpp"

#include <memory>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// CopyTradeEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the copy-trading core: owns the circuit
//         breaker, the execution coordinator, the worker threads and the
//         network endpoints, and exposes a start/stop lifecycle.
//
// @details
// Thread layout after start():
//
//   signal loop      → EventLoopThread. Single consumer of TradeSignals:
//                      SignalEvent → executeCopyTrade → ExecutionOutcomeEvent
//   supervisor       → PeriodicTask every supervision_interval:
//                      managePositions(), then CircuitBreaker::periodicCheck()
//   control server   → ControlServer REP/PUB thread (commands, notifications)
//   signal gateway   → SignalGateway SUB thread (JSON signals → signal loop)
//
//   main thread      → engine.start(), wait for shutdown, engine.stop()
//
// Sockets are optional: an empty endpoint in EngineConfig skips the
// corresponding component, so tests drive the engine purely through
// pushSignal(), superviseOnce() and executeCommand().
//
// Construction loads the breaker state, so the engine can answer STATUS and
// accept RESET before start().
//
// Ownership:
//   CopyTradeEngine
//    ├── control_server_   (unique_ptr<ControlServer>, also the notification sink)
//    ├── breaker_          (unique_ptr<CircuitBreaker>)
//    ├── coordinator_      (unique_ptr<TradeExecutionCoordinator>)
//    ├── signal_loop_      (EventLoopThread, value member)
//    ├── supervisor_       (unique_ptr<PeriodicTask>)
//    └── gateway_          (unique_ptr<SignalGateway>)
//   The execution client and the clock are borrowed and must outlive the
//   engine.
// -----------------------------------------------------------------------------
class CopyTradeEngine {
 public:
  CopyTradeEngine(EngineConfig config, IOrderExecutionClient& client,
                  const ITimeProvider& clock);

  ~CopyTradeEngine();

  CopyTradeEngine(const CopyTradeEngine&) = delete;
  CopyTradeEngine& operator=(const CopyTradeEngine&) = delete;
  CopyTradeEngine(CopyTradeEngine&&) = delete;
  CopyTradeEngine& operator=(CopyTradeEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Starts the signal loop, the supervisor, then the control server and the
  // signal gateway (when configured). Idempotent. Socket errors propagate as
  // zmq::error_t after the already started threads have been stopped.
  // -------------------------------------------------------------------------
  void start();

  // Stops inputs first (gateway), then the signal loop, the supervisor and
  // finally the control server so late notifications still go out.
  // Idempotent.
  void stop();

  bool running() const { return running_; }

  // Thread-safe. Signals pushed before start() wait in the queue.
  void pushSignal(domain::TradeSignal signal);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Operator commands, also served by ControlServer:
  //
  //   PING                 → {"status":"ok","response":"PONG"}
  //   STATUS               → breaker snapshot, recovery ETA, open positions
  //   HEALTH               → balance, breaker and position warnings;
  //                          "error" status when the balance is unreadable
  //   METRICS              → trade counts, success rate, realized PnL, uptime
  //   RESET                → manual breaker reset
  //   HALT [reason]        → manual breaker activation
  //   CLOSE <position_id>  → manual close via the coordinator
  //
  // @return JSON text. Unknown or malformed commands yield
  //         {"status":"error", ...}.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // One supervision pass, the same work the supervisor thread performs.
  SupervisionReport superviseOnce();

  EventBus& signalEventBus() { return signal_loop_.eventBus(); }
  CircuitBreaker& circuitBreaker() { return *breaker_; }
  TradeExecutionCoordinator& coordinator() { return *coordinator_; }

 private:
  void onSignal(const SignalEvent& event);

  EngineConfig config_;
  IOrderExecutionClient& client_;
  const ITimeProvider& clock_;

  std::unique_ptr<ControlServer> control_server_;
  std::unique_ptr<CircuitBreaker> breaker_;
  std::unique_ptr<TradeExecutionCoordinator> coordinator_;

  EventLoopThread signal_loop_{"SignalLoop"};
  EventBus::SubscriptionId signal_subscription_{0};

  std::unique_ptr<PeriodicTask> supervisor_;
  std::unique_ptr<SignalGateway> gateway_;

  bool running_{false};
};

}  // namespace copytrade
