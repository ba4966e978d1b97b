#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace copytrade {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting between epoch milliseconds, UTC calendar
//         days, and the text forms used by the persisted breaker state.
//
// @details
// A "UTC day" is the number of whole days since 1970-01-01 in UTC. Two
// timestamps fall on the same UTC date iff utcDay() returns the same value,
// which is all the midnight-reset rule needs.
//
// Calendar conversion uses the days-from-civil / civil-from-days algorithms
// (proleptic Gregorian), so no dependency on the process time zone or on
// gmtime_r.
//
// Thread-safety: stateless; safe from any thread.
// -----------------------------------------------------------------------------

constexpr std::int64_t kMillisPerSecond = 1000;
constexpr std::int64_t kMillisPerMinute = 60 * kMillisPerSecond;
constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// Floor division, so instants before the epoch map to negative days.
std::int64_t utcDay(std::int64_t epoch_ms);

// "YYYY-MM-DD" for a UTC day number.
std::string formatUtcDate(std::int64_t utc_day);

// Parses "YYYY-MM-DD". Returns std::nullopt on malformed input.
std::optional<std::int64_t> parseUtcDate(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string formatIso8601(std::int64_t epoch_ms);

// -------------------------------------------------------------------------
// parseIso8601(text)
// -------------------------------------------------------------------------
// @brief  Parses "YYYY-MM-DDTHH:MM:SS" with optional ".fff" fraction and an
//         optional "Z" or "+00:00" suffix.
//
// @return Epoch milliseconds, or std::nullopt on malformed input or a
//         non-UTC offset.
// -------------------------------------------------------------------------
std::optional<std::int64_t> parseIso8601(const std::string& text);

// -------------------------------------------------------------------------
// formatRecoveryEta(remaining_ms)
// -------------------------------------------------------------------------
// @brief  Human-readable time until the breaker auto-recovers.
//
// @return "Available now" when remaining_ms <= 0, "<m> minutes" below one
//         hour (whole minutes, truncated), otherwise "<h>h <m>m".
// -------------------------------------------------------------------------
std::string formatRecoveryEta(std::int64_t remaining_ms);

}  // namespace copytrade
