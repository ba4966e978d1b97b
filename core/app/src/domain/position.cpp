#include "copytrade/domain/position.hpp"

namespace copytrade {
namespace domain {

const char* toString(PositionStatus status) {
  switch (status) {
    case PositionStatus::Pending: return "Pending";
    case PositionStatus::Open:    return "Open";
    case PositionStatus::Closing: return "Closing";
    case PositionStatus::Closed:  return "Closed";
  }
  return "Unknown";
}

std::string makePositionId(const std::string& market_id, Side side) {
  return market_id + "_" + toString(side);
}

// Long:  size * (exit - entry)
// Short: size * (entry - exit)
Decimal realizedPnl(const Position& pos, Decimal exit_price) {
  Decimal diff = pos.side == Side::Buy ? exit_price - pos.entry_price
                                       : pos.entry_price - exit_price;
  return diff * pos.size;
}

Decimal stopLossPrice(Side side, Decimal entry_price, Decimal stop_loss_pct) {
  const Decimal one = Decimal::fromInt(1);
  return side == Side::Buy ? entry_price * (one - stop_loss_pct)
                           : entry_price * (one + stop_loss_pct);
}

Decimal takeProfitPrice(Side side, Decimal entry_price,
                        Decimal take_profit_pct) {
  const Decimal one = Decimal::fromInt(1);
  return side == Side::Buy ? entry_price * (one + take_profit_pct)
                           : entry_price * (one - take_profit_pct);
}

}  // namespace domain
}  // namespace copytrade
