#pragma once

#include "copytrade/domain/trade_signal.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace copytrade {

// -----------------------------------------------------------------------------
// SignalGateway: ZeroMQ SUB bridge for incoming copy-trade signals
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON trade signals from the upstream wallet monitor,
//         converts them into typed TradeSignal values and hands them to the
//         engine's signal loop.
//
// @details
// Expected JSON payload (one signal per message):
//   {
//     "trade_id":     "0xabc...",        // required, non-empty
//     "market_id":    "will-it-rain",    // required, non-empty
//     "side":         "BUY",             // required, BUY or SELL (any case)
//     "amount":       "250",             // required, decimal string or number
//     "price":        "0.42",            // required, decimal string or number
//     "confidence":   0.8,               // optional, defaults to 1
//     "timestamp_ms": 1760000000000      // optional; or "timestamp" ISO-8601
//   }
//
// Messages that fail to parse are logged as WARNING and counted; they never
// reach the coordinator. Range checks (price band, confidence floor, known
// market) are left to TradeExecutionCoordinator, which owns the risk
// configuration.
//
// Shutdown:
//   The SUB socket uses ZMQ_RCVTIMEO so the receive loop re-checks its stop
//   flag every kRecvTimeoutMs.
//
// Thread model:
//   start() creates the socket and spawns the receive thread; stop() joins
//   it. The sink is invoked on the receive thread and must be thread-safe
//   (CopyTradeEngine binds it to EventLoopThread::push()).
//
// Ownership:
//   Owns the ZMQ context, the socket and the receive thread.
// -----------------------------------------------------------------------------
class SignalGateway {
 public:
  using SignalSink = std::function<void(domain::TradeSignal)>;

  SignalGateway(SignalSink sink, std::string endpoint);

  ~SignalGateway();

  SignalGateway(const SignalGateway&) = delete;
  SignalGateway& operator=(const SignalGateway&) = delete;
  SignalGateway(SignalGateway&&) = delete;
  SignalGateway& operator=(SignalGateway&&) = delete;

  // Idempotent. Throws zmq::error_t if the endpoint cannot be connected.
  void start();

  // Idempotent.
  void stop();

  std::uint64_t received() const { return received_.load(); }
  std::uint64_t rejected() const { return rejected_.load(); }

  // -------------------------------------------------------------------------
  // parseTradeSignal(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes one JSON payload into a TradeSignal.
  //
  // @throws ValidationError on malformed JSON, missing or mistyped fields,
  //         an unknown side, or an unparsable decimal / timestamp.
  // -------------------------------------------------------------------------
  static domain::TradeSignal parseTradeSignal(const std::string& payload);
  static domain::TradeSignal parseTradeSignal(const nlohmann::json& j);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  void run();

  SignalSink sink_;
  std::string endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::thread thread_;
};

}  // namespace copytrade
