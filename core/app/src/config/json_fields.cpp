#include "copytrade/config/json_fields.hpp"

#include <stdexcept>
#include <string>

namespace copytrade {

std::optional<Decimal> parseJsonDecimal(const nlohmann::json& value) {
  try {
    if (value.is_string()) {
      return Decimal::parse(value.get<std::string>());
    }
    if (value.is_number_integer()) {
      return Decimal::fromInt(value.get<std::int64_t>());
    }
    if (value.is_number()) {
      return Decimal::fromDouble(value.get<double>());
    }
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::overflow_error&) {
    return std::nullopt;
  }
  return std::nullopt;
}

}  // namespace copytrade
