#pragma once

#include "copytrade/execution/i_order_execution_client.hpp"
#include "copytrade/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace copytrade {

// -----------------------------------------------------------------------------
// MockOrderExecutionClient: deterministic exchange for tests and paper mode
// -----------------------------------------------------------------------------
//
// @brief  In-memory IOrderExecutionClient with scripted prices, a scripted
//         balance and failure injection.
//
// @details
// Fill model:
//   - Immediate fill: every order is Filled at the requested price.
//   - Order ids are "mock-<n>" from a monotonically increasing atomic
//     counter starting at 1.
//   - Fill timestamps come from the injected ITimeProvider, so a
//     SimulationTimeProvider gives reproducible results.
//
// Failure injection:
//   failNextOrders(n)            next n placeOrder() calls throw OrderError.
//   setPriceUnavailable(m, n)    next n price reads for m throw
//                                PriceUnavailableError.
//   setPriceTimeout(m, on)       price reads for m throw PriceTimeoutError
//                                until switched off.
//   setBalanceUnavailable(on)    getBalance() throws BalanceUnavailableError.
//   setPlaceOrderDelay(d)        placeOrder() sleeps d before filling (used
//                                to widen race windows in concurrency tests).
//
// Paper mode:
//   setAutoRegisterMarkets(true) treats every market as known and quotes an
//   unpriced market at the price of the last order sent to it.
//
// Thread model:
//   All methods are safe to call concurrently. One mutex guards the scripted
//   data and the order log; the delay sleep runs outside it.
// -----------------------------------------------------------------------------
class MockOrderExecutionClient final : public IOrderExecutionClient {
 public:
  struct PlacedOrder {
    std::string order_id;
    std::string market_id;
    domain::Side side{domain::Side::Buy};
    Decimal size;
    Decimal price;
  };

  explicit MockOrderExecutionClient(const ITimeProvider& time_provider);

  MockOrderExecutionClient(const MockOrderExecutionClient&) = delete;
  MockOrderExecutionClient& operator=(const MockOrderExecutionClient&) = delete;
  MockOrderExecutionClient(MockOrderExecutionClient&&) = delete;
  MockOrderExecutionClient& operator=(MockOrderExecutionClient&&) = delete;

  // --- IOrderExecutionClient ------------------------------------------------
  domain::OrderResult placeOrder(const std::string& market_id,
                                 domain::Side side, Decimal size,
                                 Decimal price) override;
  Decimal getCurrentPrice(const std::string& market_id,
                          std::chrono::milliseconds timeout) override;
  Decimal getBalance() override;
  bool isKnownMarket(const std::string& market_id) const override;

  // --- Scripting --------------------------------------------------------------
  // setPrice() also registers the market.
  void setPrice(const std::string& market_id, Decimal price);
  void registerMarket(const std::string& market_id);
  void setBalance(Decimal balance);
  void setAutoRegisterMarkets(bool enabled);

  // --- Failure injection ------------------------------------------------------
  void failNextOrders(int count);
  void setPriceUnavailable(const std::string& market_id, int count);
  void setPriceTimeout(const std::string& market_id, bool enabled);
  void setBalanceUnavailable(bool enabled);
  void setPlaceOrderDelay(std::chrono::milliseconds delay);

  // --- Inspection -------------------------------------------------------------
  std::vector<PlacedOrder> placedOrders() const;
  std::size_t placedOrderCount() const;
  int priceRequestCount(const std::string& market_id) const;

 private:
  const ITimeProvider& time_provider_;
  std::atomic<std::uint64_t> next_order_id_{1};

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Decimal> prices_;
  std::unordered_set<std::string> markets_;
  std::unordered_map<std::string, int> price_unavailable_;
  std::unordered_set<std::string> price_timeout_;
  std::unordered_map<std::string, int> price_requests_;
  std::optional<Decimal> balance_;
  bool balance_unavailable_{false};
  bool auto_register_{false};
  int orders_to_fail_{0};
  std::chrono::milliseconds place_delay_{0};
  std::vector<PlacedOrder> placed_;
};

}  // namespace copytrade
