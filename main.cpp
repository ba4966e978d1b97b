// -----------------------------------------------------------------------------
// copytrade_engine: single executable entry point.
//
// Paper-trading mode:
//   1) Load the EngineConfig from the JSON file named on the command line
//      (defaults when no argument is given).
//   2) Create a LiveTimeProvider and a MockOrderExecutionClient that fills
//      every order at the requested price, knows every market, and reports
//      the configured paper balance.
//   3) Build and start the CopyTradeEngine: signal loop, supervisor, control
//      server (REP commands + PUB notifications) and the signal gateway.
//   4) Sleep until SIGINT / SIGTERM, then stop the engine cleanly.
//
// Thread layout:
//   main thread        → waits for the shutdown flag
//   signal loop        → executeCopyTrade, one signal at a time
//   supervisor         → managePositions + breaker periodicCheck
//   control server     → operator commands, notification publishing
//   signal gateway     → JSON signals from the upstream wallet monitor
// -----------------------------------------------------------------------------

#include "copytrade/config/config_loader.hpp"
#include "copytrade/engine/copy_trade_engine.hpp"
#include "copytrade/errors/errors.hpp"
#include "copytrade/execution/mock_order_execution_client.hpp"
#include "copytrade/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

namespace {

// Set by the signal handler, polled by main(). The only global in the
// program; a lock-free atomic store is async-signal-safe.
std::atomic<bool> g_shutdown_requested{false};

void onShutdownSignal(int /*signum*/) { g_shutdown_requested.store(true); }

}  // namespace

int main(int argc, char** argv) {
  copytrade::EngineConfig config;
  try {
    if (argc > 1) {
      config = copytrade::loadEngineConfig(argv[1]);
      std::cout << "[main] Loaded configuration from " << argv[1] << "\n";
    } else {
      std::cout << "[main] No configuration file given. Using defaults.\n";
    }
  } catch (const copytrade::ConfigError& e) {
    std::cerr << "[main] ERROR: " << e.what() << "\n";
    return 1;
  }

  if (!config.paper_trading) {
    std::cerr << "[main] ERROR: this build only ships the paper-trading "
                 "execution client. Set \"paper_trading\": true.\n";
    return 1;
  }

  copytrade::LiveTimeProvider clock;

  copytrade::MockOrderExecutionClient client(clock);
  client.setAutoRegisterMarkets(true);
  client.setBalance(config.paper_balance);

  copytrade::CopyTradeEngine engine(config, client, clock);

  std::signal(SIGINT, onShutdownSignal);
  std::signal(SIGTERM, onShutdownSignal);

  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] ERROR: engine failed to start: " << e.what() << "\n";
    return 1;
  }

  std::cout << "[main] Paper trading with balance " << config.paper_balance
            << ". Signals on " << config.signal_endpoint << ", commands on "
            << config.control_cmd_endpoint << ".\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine.stop();
  return 0;
}
