#include "arb/time/time_utils.hpp"

#include <cctype>
#include <cstdio>

namespace arb {

namespace {

struct CivilTime {
  std::int64_t year;
  unsigned month;   // 1..12
  unsigned day;     // 1..31
  unsigned hour;
  unsigned minute;
  unsigned second;
};

// Days since 1970-01-01 for a Gregorian date (H. Hinnant's algorithm).
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const auto yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civilFromDays(std::int64_t z, std::int64_t& y, unsigned& m,
                   unsigned& d) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const auto doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  d = doy - (153 * mp + 2) / 5 + 1;
  m = mp < 10 ? mp + 3 : mp - 9;
  y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2 ? 1 : 0);
}

CivilTime toCivil(std::int64_t epoch_ms) {
  std::int64_t secs = epoch_ms / kMsPerSecond;
  if (epoch_ms < 0 && epoch_ms % kMsPerSecond != 0) {
    --secs;  // floor toward the earlier second
  }
  std::int64_t days = secs / 86400;
  std::int64_t rem = secs % 86400;
  if (rem < 0) {
    rem += 86400;
    --days;
  }

  CivilTime t{};
  civilFromDays(days, t.year, t.month, t.day);
  t.hour = static_cast<unsigned>(rem / 3600);
  t.minute = static_cast<unsigned>((rem % 3600) / 60);
  t.second = static_cast<unsigned>(rem % 60);
  return t;
}

bool readDigits(const std::string& text, std::size_t pos, std::size_t count,
                unsigned& out) {
  out = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
    out = out * 10 + static_cast<unsigned>(text[i] - '0');
  }
  return true;
}

unsigned daysInMonth(std::int64_t year, unsigned month) {
  static const unsigned kDays[] = {31, 28, 31, 30, 31, 30,
                                   31, 31, 30, 31, 30, 31};
  if (month == 2) {
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return leap ? 29 : 28;
  }
  return kDays[month - 1];
}

}  // namespace

std::string formatCompactUtc(std::int64_t epoch_ms) {
  CivilTime t = toCivil(epoch_ms);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld%02u%02u_%02u%02u%02u",
                static_cast<long long>(t.year), t.month, t.day, t.hour,
                t.minute, t.second);
  return buf;
}

std::optional<std::int64_t> parseCompactUtc(const std::string& text) {
  if (text.size() != 15 || text[8] != '_') {
    return std::nullopt;
  }

  unsigned year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (!readDigits(text, 0, 4, year) || !readDigits(text, 4, 2, month) ||
      !readDigits(text, 6, 2, day) || !readDigits(text, 9, 2, hour) ||
      !readDigits(text, 11, 2, minute) || !readDigits(text, 13, 2, second)) {
    return std::nullopt;
  }

  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month) ||
      hour > 23 || minute > 59 || second > 59) {
    return std::nullopt;
  }

  std::int64_t days = daysFromCivil(year, month, day);
  std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
  return secs * kMsPerSecond;
}

std::string formatIsoUtc(std::int64_t epoch_ms) {
  CivilTime t = toCivil(epoch_ms);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02u:%02u:%02u",
                static_cast<long long>(t.year), t.month, t.day, t.hour,
                t.minute, t.second);
  return buf;
}

}  // namespace arb
