#pragma once

#include "copytrade/domain/decimal.hpp"
#include "copytrade/domain/order.hpp"

#include <cstdint>
#include <string>

namespace copytrade {
namespace domain {

// -----------------------------------------------------------------------------
// TradeSignal: one copy-trade instruction
// -----------------------------------------------------------------------------
//
// @brief  A trade observed on a followed wallet, to be mirrored at our own
//         size.
//
// @details
// Produced outside this core (wallet monitoring, scoring) and delivered
// either through CopyTradeEngine::pushSignal() or as JSON on the
// SignalGateway socket. The gateway turns the untyped payload into this
// struct once; TradeExecutionCoordinator validates the values once more
// against the risk configuration before anything else touches them.
//
//   amount      size of the original trade (the leader's size, not ours)
//   price       the leader's execution price, used as our entry price
//   confidence  upstream score in [0, 1]
//   timestamp_ms when the original trade happened, 0 if unknown
// -----------------------------------------------------------------------------
struct TradeSignal {
  std::string trade_id;
  std::string market_id;
  Side side{Side::Buy};
  Decimal amount;
  Decimal price;
  Decimal confidence;
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace copytrade
