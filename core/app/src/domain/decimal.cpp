#include "copytrade/domain/decimal.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace copytrade {

namespace {

using Wide = __int128;

constexpr Wide kMaxRaw = std::numeric_limits<std::int64_t>::max();
constexpr Wide kMinRaw = std::numeric_limits<std::int64_t>::min();

std::int64_t narrow(Wide value) {
  if (value > kMaxRaw || value < kMinRaw) {
    throw std::overflow_error("Decimal overflow");
  }
  return static_cast<std::int64_t>(value);
}

// Integer division rounding half away from zero. divisor must be non-zero.
Wide divRound(Wide dividend, Wide divisor) {
  bool negative = (dividend < 0) != (divisor < 0);
  Wide n = dividend < 0 ? -dividend : dividend;
  Wide d = divisor < 0 ? -divisor : divisor;
  Wide q = n / d;
  Wide r = n % d;
  if (r * 2 >= d) {
    ++q;
  }
  return negative ? -q : q;
}

Wide pow10(int exp) {
  Wide result = 1;
  for (int i = 0; i < exp; ++i) {
    result *= 10;
  }
  return result;
}

}  // namespace

// -----------------------------------------------------------------------------
// Construction helpers
// -----------------------------------------------------------------------------
Decimal Decimal::fromInt(std::int64_t value) {
  return Decimal(narrow(static_cast<Wide>(value) * kOne));
}

Decimal Decimal::parse(const std::string& text) {
  if (text.empty()) {
    throw std::invalid_argument("Decimal: empty string");
  }

  std::size_t pos = 0;
  bool negative = false;
  if (text[pos] == '+' || text[pos] == '-') {
    negative = text[pos] == '-';
    ++pos;
  }

  Wide integer_part = 0;
  Wide fraction_part = 0;
  int fraction_digits = 0;
  bool round_up = false;
  bool seen_digit = false;
  bool seen_point = false;

  for (; pos < text.size(); ++pos) {
    char c = text[pos];
    if (c == '.') {
      if (seen_point) {
        throw std::invalid_argument("Decimal: multiple decimal points in '" +
                                    text + "'");
      }
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') {
      throw std::invalid_argument("Decimal: invalid character in '" + text +
                                  "'");
    }
    seen_digit = true;
    int digit = c - '0';
    if (!seen_point) {
      integer_part = integer_part * 10 + digit;
      if (integer_part > kMaxRaw) {
        throw std::overflow_error("Decimal: value out of range '" + text +
                                  "'");
      }
    } else if (fraction_digits < kScale) {
      fraction_part = fraction_part * 10 + digit;
      ++fraction_digits;
    } else if (fraction_digits == kScale) {
      // First dropped digit decides rounding; the rest are ignored.
      round_up = digit >= 5;
      ++fraction_digits;
    }
  }

  if (!seen_digit) {
    throw std::invalid_argument("Decimal: no digits in '" + text + "'");
  }

  int kept = fraction_digits > kScale ? kScale : fraction_digits;
  Wide raw = integer_part * kOne + fraction_part * pow10(kScale - kept);
  if (round_up) {
    ++raw;
  }
  return Decimal(narrow(negative ? -raw : raw));
}

Decimal Decimal::fromDouble(double value) {
  if (!std::isfinite(value)) {
    throw std::invalid_argument("Decimal: non-finite double");
  }
  long double scaled = static_cast<long double>(value) * kOne;
  if (scaled > static_cast<long double>(kMaxRaw) ||
      scaled < static_cast<long double>(kMinRaw)) {
    throw std::overflow_error("Decimal: double out of range");
  }
  return Decimal(static_cast<std::int64_t>(std::llroundl(scaled)));
}

// -----------------------------------------------------------------------------
// Conversions
// -----------------------------------------------------------------------------
std::string Decimal::toString() const {
  Wide value = raw_;
  bool negative = value < 0;
  if (negative) {
    value = -value;
  }

  Wide integer_part = value / kOne;
  Wide fraction_part = value % kOne;

  std::string int_str;
  do {
    int_str.insert(int_str.begin(), static_cast<char>('0' + integer_part % 10));
    integer_part /= 10;
  } while (integer_part > 0);

  std::string result = negative ? "-" + int_str : int_str;
  if (fraction_part == 0) {
    return result;
  }

  std::string frac_str(kScale, '0');
  for (int i = kScale - 1; i >= 0; --i) {
    frac_str[static_cast<std::size_t>(i)] =
        static_cast<char>('0' + fraction_part % 10);
    fraction_part /= 10;
  }
  while (!frac_str.empty() && frac_str.back() == '0') {
    frac_str.pop_back();
  }
  return result + "." + frac_str;
}

double Decimal::toDouble() const {
  return static_cast<double>(raw_) / static_cast<double>(kOne);
}

// -----------------------------------------------------------------------------
// Arithmetic
// -----------------------------------------------------------------------------
Decimal Decimal::abs() const { return raw_ < 0 ? -*this : *this; }

Decimal Decimal::roundTo(int places) const {
  if (places < 0 || places > kScale) {
    throw std::invalid_argument("Decimal::roundTo: places out of range");
  }
  Wide step = pow10(kScale - places);
  return Decimal(narrow(divRound(raw_, step) * step));
}

Decimal Decimal::operator-() const { return Decimal(narrow(-static_cast<Wide>(raw_))); }

Decimal Decimal::operator+(Decimal other) const {
  return Decimal(narrow(static_cast<Wide>(raw_) + other.raw_));
}

Decimal Decimal::operator-(Decimal other) const {
  return Decimal(narrow(static_cast<Wide>(raw_) - other.raw_));
}

Decimal Decimal::operator*(Decimal other) const {
  return Decimal(narrow(divRound(static_cast<Wide>(raw_) * other.raw_, kOne)));
}

Decimal Decimal::operator/(Decimal other) const {
  if (other.raw_ == 0) {
    throw std::domain_error("Decimal: division by zero");
  }
  return Decimal(narrow(divRound(static_cast<Wide>(raw_) * kOne, other.raw_)));
}

Decimal& Decimal::operator+=(Decimal other) {
  *this = *this + other;
  return *this;
}

Decimal& Decimal::operator-=(Decimal other) {
  *this = *this - other;
  return *this;
}

Decimal min(Decimal a, Decimal b) { return b < a ? b : a; }

Decimal max(Decimal a, Decimal b) { return a < b ? b : a; }

Decimal clamp(Decimal value, Decimal lo, Decimal hi) {
  return min(max(value, lo), hi);
}

std::ostream& operator<<(std::ostream& os, Decimal value) {
  return os << value.toString();
}

}  // namespace copytrade
