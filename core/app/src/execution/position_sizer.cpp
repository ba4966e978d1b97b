#include "copytrade/execution/position_sizer.hpp"
#include "copytrade/errors/errors.hpp"

namespace copytrade {

PositionSizer::PositionSizer(const domain::RiskConfig& config)
    : config_(config) {}

Decimal PositionSizer::priceRisk(Decimal entry_price, Decimal stop_price,
                                 Decimal current_price) const {
  const Decimal distance = (entry_price - stop_price).abs();
  const Decimal floor = current_price.abs() * config_.price_risk_epsilon;
  const Decimal risk = max(distance, floor);
  if (!risk.isPositive()) {
    throw ValidationError("price risk is zero (entry " +
                          entry_price.toString() + ", stop " +
                          stop_price.toString() + ")");
  }
  return risk;
}

Decimal PositionSizer::size(Decimal entry_price, Decimal stop_price,
                            Decimal current_price, Decimal signal_amount,
                            std::optional<Decimal> balance) const {
  if (!signal_amount.isPositive()) {
    throw ValidationError("signal amount must be positive");
  }

  const Decimal proportional = config_.copy_ratio * signal_amount;
  Decimal raw;
  if (balance) {
    const Decimal risk_budget = *balance * config_.risk_budget_fraction;
    const Decimal by_risk =
        risk_budget / priceRisk(entry_price, stop_price, current_price);
    raw = min(by_risk, proportional);
  } else {
    raw = min(proportional, config_.max_position_size);
  }

  return clamp(raw.roundTo(kSizePlaces), config_.min_position_size,
               config_.max_position_size);
}

}  // namespace copytrade
