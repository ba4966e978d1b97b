#pragma once

#include "copytrade/domain/decimal.hpp"
#include "copytrade/domain/order.hpp"

#include <cstdint>
#include <string>

namespace copytrade {
namespace domain {

// -----------------------------------------------------------------------------
// PositionStatus
// -----------------------------------------------------------------------------
// Lifecycle of one copy-position:
//
//   Pending ──► Open ──► Closing ──► Closed
//                 ▲         │
//                 └─────────┘  (close order failed, position stays open)
//
// Closed positions are removed from the PositionTable in the same guarded
// step that marks them Closed, so an observer never sees a Closed entry.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Pending,
  Open,
  Closing,
  Closed,
};

const char* toString(PositionStatus status);

// -----------------------------------------------------------------------------
// Position: one open copy-trade exposure
// -----------------------------------------------------------------------------
//
// @brief  Size, entry and exit thresholds of a position opened by
//         TradeExecutionCoordinator.
//
// @details
// id is the composite key market_id + "_" + side (see makePositionId), so at
// most one position per market and direction is open at a time.
//
// stop_loss_price and take_profit_price are absolute prices derived from the
// entry price when the position is opened:
//   Buy:  stop = entry * (1 - stop_loss_pct),  target = entry * (1 + tp_pct)
//   Sell: stop = entry * (1 + stop_loss_pct),  target = entry * (1 - tp_pct)
//
// Thread model:
//   Value type. The authoritative copy lives in PositionTable and is mutated
//   only while the per-id lock is held. Readers get copies.
// -----------------------------------------------------------------------------
struct Position {
  std::string id;
  std::string market_id;
  std::string trade_id;  // signal that opened the position
  Side side{Side::Buy};
  Decimal size;
  Decimal entry_price;
  Decimal stop_loss_price;
  Decimal take_profit_price;
  std::string order_id;
  std::int64_t opened_at_ms{0};
  PositionStatus status{PositionStatus::Pending};
};

std::string makePositionId(const std::string& market_id, Side side);

// Realized P&L of closing `pos` at exit_price: positive is a profit.
Decimal realizedPnl(const Position& pos, Decimal exit_price);

Decimal stopLossPrice(Side side, Decimal entry_price, Decimal stop_loss_pct);
Decimal takeProfitPrice(Side side, Decimal entry_price,
                        Decimal take_profit_pct);

}  // namespace domain
}  // namespace copytrade
