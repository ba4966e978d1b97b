#include "copytrade/execution/mock_order_execution_client.hpp"
#include "copytrade/errors/errors.hpp"

#include <thread>

namespace copytrade {

MockOrderExecutionClient::MockOrderExecutionClient(
    const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// placeOrder: immediate fill at the requested price unless a failure is queued
// -----------------------------------------------------------------------------
domain::OrderResult MockOrderExecutionClient::placeOrder(
    const std::string& market_id, domain::Side side, Decimal size,
    Decimal price) {
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard lock(mutex_);
    delay = place_delay_;
  }
  if (delay.count() > 0) {
    std::this_thread::sleep_for(delay);
  }

  std::lock_guard lock(mutex_);
  if (orders_to_fail_ > 0) {
    --orders_to_fail_;
    throw OrderError("order rejected by exchange for " + market_id);
  }
  if (!auto_register_ && markets_.count(market_id) == 0) {
    throw OrderError("unknown market " + market_id);
  }
  if (!size.isPositive()) {
    throw OrderError("order size must be positive");
  }

  domain::OrderResult result;
  result.order_id =
      "mock-" + std::to_string(
                    next_order_id_.fetch_add(1, std::memory_order_relaxed));
  result.filled_price = price;
  result.status = domain::OrderStatus::Filled;
  result.timestamp_ms = time_provider_.now_ms();

  placed_.push_back(PlacedOrder{result.order_id, market_id, side, size, price});
  if (auto_register_ && prices_.count(market_id) == 0) {
    prices_[market_id] = price;
  }
  return result;
}

// -----------------------------------------------------------------------------
// getCurrentPrice
// -----------------------------------------------------------------------------
Decimal MockOrderExecutionClient::getCurrentPrice(
    const std::string& market_id, std::chrono::milliseconds timeout) {
  std::lock_guard lock(mutex_);
  ++price_requests_[market_id];

  if (price_timeout_.count(market_id) != 0) {
    throw PriceTimeoutError("price fetch for " + market_id + " timed out after " +
                            std::to_string(timeout.count()) + " ms");
  }
  auto failing = price_unavailable_.find(market_id);
  if (failing != price_unavailable_.end() && failing->second > 0) {
    --failing->second;
    throw PriceUnavailableError("no quote for " + market_id);
  }
  auto it = prices_.find(market_id);
  if (it == prices_.end()) {
    throw PriceUnavailableError("no quote for " + market_id);
  }
  return it->second;
}

Decimal MockOrderExecutionClient::getBalance() {
  std::lock_guard lock(mutex_);
  if (balance_unavailable_ || !balance_) {
    throw BalanceUnavailableError("balance unavailable");
  }
  return *balance_;
}

bool MockOrderExecutionClient::isKnownMarket(
    const std::string& market_id) const {
  std::lock_guard lock(mutex_);
  return auto_register_ || markets_.count(market_id) != 0;
}

// -----------------------------------------------------------------------------
// Scripting and failure injection
// -----------------------------------------------------------------------------
void MockOrderExecutionClient::setPrice(const std::string& market_id,
                                        Decimal price) {
  std::lock_guard lock(mutex_);
  markets_.insert(market_id);
  prices_[market_id] = price;
}

void MockOrderExecutionClient::registerMarket(const std::string& market_id) {
  std::lock_guard lock(mutex_);
  markets_.insert(market_id);
}

void MockOrderExecutionClient::setBalance(Decimal balance) {
  std::lock_guard lock(mutex_);
  balance_ = balance;
}

void MockOrderExecutionClient::setAutoRegisterMarkets(bool enabled) {
  std::lock_guard lock(mutex_);
  auto_register_ = enabled;
}

void MockOrderExecutionClient::failNextOrders(int count) {
  std::lock_guard lock(mutex_);
  orders_to_fail_ = count;
}

void MockOrderExecutionClient::setPriceUnavailable(const std::string& market_id,
                                                   int count) {
  std::lock_guard lock(mutex_);
  price_unavailable_[market_id] = count;
}

void MockOrderExecutionClient::setPriceTimeout(const std::string& market_id,
                                               bool enabled) {
  std::lock_guard lock(mutex_);
  if (enabled) {
    price_timeout_.insert(market_id);
  } else {
    price_timeout_.erase(market_id);
  }
}

void MockOrderExecutionClient::setBalanceUnavailable(bool enabled) {
  std::lock_guard lock(mutex_);
  balance_unavailable_ = enabled;
}

void MockOrderExecutionClient::setPlaceOrderDelay(
    std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  place_delay_ = delay;
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------
std::vector<MockOrderExecutionClient::PlacedOrder>
MockOrderExecutionClient::placedOrders() const {
  std::lock_guard lock(mutex_);
  return placed_;
}

std::size_t MockOrderExecutionClient::placedOrderCount() const {
  std::lock_guard lock(mutex_);
  return placed_.size();
}

int MockOrderExecutionClient::priceRequestCount(
    const std::string& market_id) const {
  std::lock_guard lock(mutex_);
  auto it = price_requests_.find(market_id);
  return it == price_requests_.end() ? 0 : it->second;
}

}  // namespace copytrade
