#include "capguard/time/time_utils.hpp"

#include <cstdio>

namespace capguard {

namespace {

struct CivilDate {
  std::int64_t year;
  unsigned month;  // 1..12
  unsigned day;    // 1..31
};

std::int64_t floorDiv(std::int64_t a, std::int64_t b) {
  std::int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) {
    --q;
  }
  return q;
}

// days since 1970-01-01 → civil date (H. Hinnant, "chrono-Compatible
// Low-Level Date Algorithms").
CivilDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

bool isLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
  static constexpr int kDays[12] = {31, 28, 31, 30, 31, 30,
                                    31, 31, 30, 31, 30, 31};
  return m == 2 && isLeapYear(y) ? 29 : kDays[m - 1];
}

bool readDigits(std::string_view text, std::size_t pos, std::size_t count,
                int& out) {
  if (pos + count > text.size()) {
    return false;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    char c = text[i];
    if (c < '0' || c > '9') {
      return false;
    }
    value = value * 10 + (c - '0');
  }
  out = value;
  return true;
}

}  // namespace

std::int64_t utcDayIndex(std::int64_t epoch_ms) {
  return floorDiv(epoch_ms, kMillisPerDay);
}

std::string formatIso8601(std::int64_t epoch_ms) {
  const std::int64_t days = utcDayIndex(epoch_ms);
  const std::int64_t ms_of_day = epoch_ms - days * kMillisPerDay;
  const CivilDate date = civilFromDays(days);

  const auto hh = static_cast<int>(ms_of_day / kMillisPerHour);
  const auto mm = static_cast<int>((ms_of_day / kMillisPerMinute) % 60);
  const auto ss = static_cast<int>((ms_of_day / 1000) % 60);
  const auto fff = static_cast<int>(ms_of_day % 1000);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02d.%03dZ",
                static_cast<long long>(date.year), date.month, date.day, hh,
                mm, ss, fff);
  return buf;
}

std::string minuteBucket(std::int64_t epoch_ms) {
  return formatIso8601(epoch_ms).substr(0, 16);
}

std::optional<std::int64_t> parseIso8601(std::string_view text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0,
      millis = 0;

  if (!readDigits(text, 0, 4, year) || text.size() < 16 || text[4] != '-' ||
      !readDigits(text, 5, 2, month) || text[7] != '-' ||
      !readDigits(text, 8, 2, day) || text[10] != 'T' ||
      !readDigits(text, 11, 2, hour) || text[13] != ':' ||
      !readDigits(text, 14, 2, minute)) {
    return std::nullopt;
  }

  std::size_t pos = 16;
  if (pos < text.size() && text[pos] == ':') {
    if (!readDigits(text, pos + 1, 2, second)) {
      return std::nullopt;
    }
    pos += 3;
    if (pos < text.size() && text[pos] == '.') {
      if (!readDigits(text, pos + 1, 3, millis)) {
        return std::nullopt;
      }
      pos += 4;
    }
  }
  if (pos < text.size() && text[pos] == 'Z') {
    ++pos;
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  if (month < 1 || month > 12 || day < 1 || hour > 23 || minute > 59 ||
      second > 59) {
    return std::nullopt;
  }
  if (day > daysInMonth(year, month)) {
    return std::nullopt;
  }

  const std::int64_t days = daysFromCivil(year, static_cast<unsigned>(month),
                                          static_cast<unsigned>(day));
  return days * kMillisPerDay + hour * kMillisPerHour +
         minute * kMillisPerMinute + second * 1000 + millis;
}

}  // namespace capguard
