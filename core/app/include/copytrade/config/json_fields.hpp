#pragma once

#include "copytrade/domain/decimal.hpp"

#include <nlohmann/json.hpp>

#include <optional>

namespace copytrade {

// -----------------------------------------------------------------------------
// parseJsonDecimal(value)
// -----------------------------------------------------------------------------
// Reads a Decimal from a JSON string ("12.5", exact) or a JSON number
// (rounded to 8 places). Returns std::nullopt for any other JSON type or
// for malformed text; callers turn that into their own error type.
// -----------------------------------------------------------------------------
std::optional<Decimal> parseJsonDecimal(const nlohmann::json& value);

}  // namespace copytrade
