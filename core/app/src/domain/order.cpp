#include "copytrade/domain/order.hpp"

#include <algorithm>
#include <cctype>

namespace copytrade {
namespace domain {

std::optional<Side> parseSide(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  if (upper == "BUY") {
    return Side::Buy;
  }
  if (upper == "SELL") {
    return Side::Sell;
  }
  return std::nullopt;
}

const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Accepted: return "Accepted";
    case OrderStatus::Filled:   return "Filled";
    case OrderStatus::Rejected: return "Rejected";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace copytrade
