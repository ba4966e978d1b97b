#pragma once

#include "copytrade/domain/decimal.hpp"
#include "copytrade/domain/risk_config.hpp"

#include <optional>

namespace copytrade {

// -----------------------------------------------------------------------------
// PositionSizer: risk-budget sizing in exact decimal arithmetic
// -----------------------------------------------------------------------------
//
// @brief  Turns a signal into our order size.
//
// @details
//   price_risk  = max(|entry - stop|, current_price * price_risk_epsilon)
//   risk_budget = balance * risk_budget_fraction
//   raw         = min(risk_budget / price_risk, copy_ratio * signal_amount)
//   size        = clamp(round4(raw), min_position_size, max_position_size)
//
// The epsilon floor keeps a stop placed on (or extremely close to) the entry
// from producing a near-infinite size. When the balance is unknown the risk
// budget term is dropped and raw = min(copy_ratio * amount,
// max_position_size).
//
// Sizes are quantized to 4 fractional digits (exchange share precision).
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  static constexpr int kSizePlaces = 4;

  explicit PositionSizer(const domain::RiskConfig& config);

  // @throws ValidationError when price_risk is zero (stop on entry and a
  //         zero current price or epsilon).
  Decimal priceRisk(Decimal entry_price, Decimal stop_price,
                    Decimal current_price) const;

  // @throws ValidationError on a zero price risk or a non-positive amount.
  Decimal size(Decimal entry_price, Decimal stop_price, Decimal current_price,
               Decimal signal_amount, std::optional<Decimal> balance) const;

 private:
  domain::RiskConfig config_;
};

}  // namespace copytrade
