#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace arb {

constexpr std::int64_t kMsPerSecond = 1000;
constexpr std::int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr std::int64_t kMsPerHour = 60 * kMsPerMinute;
constexpr std::int64_t kMsPerDay = 24 * kMsPerHour;

// -----------------------------------------------------------------------------
// Compact UTC timestamps ("yyyyMMdd_HHmmss")
// -----------------------------------------------------------------------------
// Used in backup storage keys. Second resolution: milliseconds are dropped
// when formatting. Parsing accepts exactly 15 characters with '_' at
// index 8 and in-range fields; anything else yields std::nullopt.
//
// Calendar math is done on the proleptic Gregorian calendar directly, so
// neither the process time zone nor the C library's timegm is involved.
// -----------------------------------------------------------------------------
std::string formatCompactUtc(std::int64_t epoch_ms);

std::optional<std::int64_t> parseCompactUtc(const std::string& text);

// "2024-01-31 23:59:59", for log lines.
std::string formatIsoUtc(std::int64_t epoch_ms);

}  // namespace arb
