#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// Decimal: exact fixed-point number for money, prices and sizes
// -----------------------------------------------------------------------------
//
// @brief  Signed decimal value stored as an int64 count of 10^-8 units.
//
// @details
// Every figure that flows into the circuit breaker's daily_loss (order
// sizes, entry/exit prices, realized P&L) is a Decimal. Addition and
// subtraction are exact. Multiplication and division are computed in 128-bit
// intermediates and rounded half away from zero to 8 fractional digits, so a
// sum of realized losses never accumulates binary floating-point drift.
//
// Range:
//   kScale = 8 fractional digits; the integer part covers roughly
//   +/- 9.2e10, far beyond any position or balance this engine handles.
//   Results outside the int64 range throw std::overflow_error.
//
// Text form:
//   parse() accepts "-12.5", "0.00000001", "42"; toString() emits the
//   shortest exact form ("110", "0.5", "-3.25"). This is the representation
//   used in the persisted breaker state and in config files.
//
// Thread model:
//   Plain value type. Safe to copy between threads.
// -----------------------------------------------------------------------------
class Decimal {
 public:
  static constexpr int kScale = 8;
  static constexpr std::int64_t kOne = 100000000;

  constexpr Decimal() = default;

  static constexpr Decimal fromRaw(std::int64_t raw) { return Decimal(raw); }

  static Decimal fromInt(std::int64_t value);

  // -------------------------------------------------------------------------
  // parse(text)
  // -------------------------------------------------------------------------
  // @brief  Parses a plain decimal literal (no exponent).
  //
  // @throws std::invalid_argument on malformed text, std::overflow_error
  //         when the value does not fit. Digits beyond the 8th fractional
  //         place are rounded half away from zero.
  // -------------------------------------------------------------------------
  static Decimal parse(const std::string& text);

  // -------------------------------------------------------------------------
  // fromDouble(value)
  // -------------------------------------------------------------------------
  // @brief  Rounds a binary double to the nearest 10^-8.
  //
  // @details
  // Only used at input boundaries (JSON numbers in config files and signal
  // payloads). No arithmetic is ever carried out in double.
  // -------------------------------------------------------------------------
  static Decimal fromDouble(double value);

  std::int64_t raw() const { return raw_; }
  std::string toString() const;
  double toDouble() const;

  bool isZero() const { return raw_ == 0; }
  bool isNegative() const { return raw_ < 0; }
  bool isPositive() const { return raw_ > 0; }

  Decimal abs() const;

  // Rounds half away from zero to `places` fractional digits (0..8).
  Decimal roundTo(int places) const;

  Decimal operator-() const;
  Decimal operator+(Decimal other) const;
  Decimal operator-(Decimal other) const;
  Decimal operator*(Decimal other) const;
  // Throws std::domain_error on division by zero.
  Decimal operator/(Decimal other) const;

  Decimal& operator+=(Decimal other);
  Decimal& operator-=(Decimal other);

  bool operator==(Decimal other) const { return raw_ == other.raw_; }
  bool operator!=(Decimal other) const { return raw_ != other.raw_; }
  bool operator<(Decimal other) const { return raw_ < other.raw_; }
  bool operator<=(Decimal other) const { return raw_ <= other.raw_; }
  bool operator>(Decimal other) const { return raw_ > other.raw_; }
  bool operator>=(Decimal other) const { return raw_ >= other.raw_; }

 private:
  constexpr explicit Decimal(std::int64_t raw) : raw_(raw) {}

  std::int64_t raw_{0};
};

Decimal min(Decimal a, Decimal b);
Decimal max(Decimal a, Decimal b);
Decimal clamp(Decimal value, Decimal lo, Decimal hi);

std::ostream& operator<<(std::ostream& os, Decimal value);

}  // namespace copytrade
