#pragma once

#include "copytrade/domain/decimal.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace copytrade {
namespace domain {

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Responsibility: Encodes the trading side (buy or sell) of a signal, an order
// or a position.
// -----------------------------------------------------------------------------
enum class Side {
  Buy,
  Sell,
};

inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

inline const char* toString(Side side) {
  return side == Side::Buy ? "BUY" : "SELL";
}

// Case-insensitive "buy" / "sell". Returns std::nullopt for anything else.
std::optional<Side> parseSide(const std::string& text);

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
// Status reported by the exchange client for a placed order. Anything other
// than Filled or Accepted is treated as a failed placement.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Accepted,  // Live on the book, not yet (fully) filled
  Filled,    // Fully filled
  Rejected,  // Refused by the exchange
};

const char* toString(OrderStatus status);

// -----------------------------------------------------------------------------
// OrderResult
// -----------------------------------------------------------------------------
// Responsibility: What the exchange returns for a successful placeOrder()
// call.
//
// filled_price may be zero for an Accepted (resting) order; callers then fall
// back to the requested price.
// -----------------------------------------------------------------------------
struct OrderResult {
  std::string order_id;
  Decimal filled_price;
  OrderStatus status{OrderStatus::Filled};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace copytrade
