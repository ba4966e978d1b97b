#pragma once

#include "copytrade/domain/decimal.hpp"
#include "copytrade/domain/order.hpp"

#include <chrono>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// IOrderExecutionClient: exchange boundary consumed by the coordinator
// -----------------------------------------------------------------------------
//
// @brief  Places orders, quotes prices and reports the account balance.
//
// @details
// TradeExecutionCoordinator is the only caller. It never knows whether it
// talks to a live exchange or to MockOrderExecutionClient, so paper trading,
// tests and a future live client share every risk rule.
//
// Failure contract:
//   placeOrder()       throws OrderError. Never retried by the caller: a
//                      timed-out order may still have been filled, and a
//                      second placement would double the exposure.
//   getCurrentPrice()  throws PriceUnavailableError (retryable) or
//                      PriceTimeoutError when `timeout` elapses.
//   getBalance()       throws BalanceUnavailableError.
//
// Thread model:
//   Implementations MUST be safe for concurrent calls: the signal loop, the
//   supervision thread and the control thread may all be inside the client
//   at once.
//
// Ownership:
//   Owned by the hosting application; the coordinator holds a reference.
// -----------------------------------------------------------------------------
class IOrderExecutionClient {
 public:
  virtual ~IOrderExecutionClient() = default;

  virtual domain::OrderResult placeOrder(const std::string& market_id,
                                         domain::Side side, Decimal size,
                                         Decimal price) = 0;

  virtual Decimal getCurrentPrice(const std::string& market_id,
                                  std::chrono::milliseconds timeout) = 0;

  virtual Decimal getBalance() = 0;

  // Whether the market exists on the exchange. Unknown markets fail signal
  // validation before any order is attempted.
  virtual bool isKnownMarket(const std::string& market_id) const = 0;
};

}  // namespace copytrade
