#include "copytrade/time/time_utils.hpp"

#include <cctype>
#include <cstdio>

namespace copytrade {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian y/m/d.
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

struct Civil {
  std::int64_t year;
  unsigned month;
  unsigned day;
};

Civil civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  return Civil{m <= 2 ? y + 1 : y, m, d};
}

bool isLeap(std::int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(std::int64_t y, unsigned m) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                   31, 31, 30, 31, 30, 31};
  return (m == 2 && isLeap(y)) ? 29 : kDays[m - 1];
}

// Reads exactly `count` digits starting at pos. Advances pos on success.
bool readDigits(const std::string& s, std::size_t& pos, std::size_t count,
                int& out) {
  if (pos + count > s.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = 0; i < count; ++i) {
    char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  pos += count;
  return true;
}

bool expect(const std::string& s, std::size_t& pos, char c) {
  if (pos >= s.size() || s[pos] != c) {
    return false;
  }
  ++pos;
  return true;
}

// Parses "YYYY-MM-DD" at pos into a day number.
std::optional<std::int64_t> readDate(const std::string& s, std::size_t& pos) {
  int y = 0;
  int m = 0;
  int d = 0;
  if (!readDigits(s, pos, 4, y) || !expect(s, pos, '-') ||
      !readDigits(s, pos, 2, m) || !expect(s, pos, '-') ||
      !readDigits(s, pos, 2, d)) {
    return std::nullopt;
  }
  if (m < 1 || m > 12 || d < 1 ||
      static_cast<unsigned>(d) > daysInMonth(y, static_cast<unsigned>(m))) {
    return std::nullopt;
  }
  return daysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d));
}

}  // namespace

std::int64_t utcDay(std::int64_t epoch_ms) {
  std::int64_t day = epoch_ms / kMillisPerDay;
  if (epoch_ms % kMillisPerDay < 0) {
    --day;
  }
  return day;
}

std::string formatUtcDate(std::int64_t utc_day) {
  Civil c = civilFromDays(utc_day);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                static_cast<long long>(c.year), c.month, c.day);
  return buf;
}

std::optional<std::int64_t> parseUtcDate(const std::string& text) {
  std::size_t pos = 0;
  auto day = readDate(text, pos);
  if (!day || pos != text.size()) {
    return std::nullopt;
  }
  return day;
}

std::string formatIso8601(std::int64_t epoch_ms) {
  std::int64_t day = utcDay(epoch_ms);
  std::int64_t ms_of_day = epoch_ms - day * kMillisPerDay;
  Civil c = civilFromDays(day);

  auto hours = static_cast<int>(ms_of_day / kMillisPerHour);
  auto minutes = static_cast<int>((ms_of_day % kMillisPerHour) / kMillisPerMinute);
  auto seconds =
      static_cast<int>((ms_of_day % kMillisPerMinute) / kMillisPerSecond);
  auto millis = static_cast<int>(ms_of_day % kMillisPerSecond);

  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<long long>(c.year), c.month, c.day, hours, minutes,
                seconds, millis);
  return buf;
}

std::optional<std::int64_t> parseIso8601(const std::string& text) {
  std::size_t pos = 0;
  auto day = readDate(text, pos);
  if (!day) {
    return std::nullopt;
  }
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' ')) {
    return std::nullopt;
  }
  ++pos;

  int hh = 0;
  int mm = 0;
  int ss = 0;
  if (!readDigits(text, pos, 2, hh) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, mm) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, ss)) {
    return std::nullopt;
  }
  if (hh > 23 || mm > 59 || ss > 59) {
    return std::nullopt;
  }

  // Optional fraction: keep the first three digits (milliseconds).
  int millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::size_t digits = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
      }
      ++digits;
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (std::size_t i = digits; i < 3; ++i) {
      millis *= 10;
    }
  }

  if (pos < text.size()) {
    std::string suffix = text.substr(pos);
    if (suffix != "Z" && suffix != "+00:00") {
      return std::nullopt;
    }
  }

  return *day * kMillisPerDay + hh * kMillisPerHour + mm * kMillisPerMinute +
         ss * kMillisPerSecond + millis;
}

std::string formatRecoveryEta(std::int64_t remaining_ms) {
  if (remaining_ms <= 0) {
    return "Available now";
  }
  std::int64_t total_minutes = remaining_ms / kMillisPerMinute;
  if (total_minutes < 60) {
    return std::to_string(total_minutes) + " minutes";
  }
  return std::to_string(total_minutes / 60) + "h " +
         std::to_string(total_minutes % 60) + "m";
}

}  // namespace copytrade
