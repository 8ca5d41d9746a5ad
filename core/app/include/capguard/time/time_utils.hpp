#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace capguard {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions over int64 epoch milliseconds (UTC).
//
// @details
// The pipeline never touches local time. Calendar math uses the proleptic
// Gregorian civil-from-days algorithm, so results do not depend on the
// process time zone or on gmtime()'s static buffer.
//
// Thread-safety: Stateless: safe to call from any thread.
// -----------------------------------------------------------------------------

inline constexpr std::int64_t kMillisPerMinute = 60'000;
inline constexpr std::int64_t kMillisPerHour = 60 * kMillisPerMinute;
inline constexpr std::int64_t kMillisPerDay = 24 * kMillisPerHour;

// Days since 1970-01-01 (floor division; negative before the epoch).
std::int64_t utcDayIndex(std::int64_t epoch_ms);

// "2026-02-17T02:30:05.120Z"
std::string formatIso8601(std::int64_t epoch_ms);

// "2026-02-17T02:30": the minute bucket used by content-addressed ids.
std::string minuteBucket(std::int64_t epoch_ms);

// Accepts "YYYY-MM-DDTHH:MM[:SS[.fff]][Z]". Returns nullopt on anything else.
std::optional<std::int64_t> parseIso8601(std::string_view text);

}  // namespace capguard
