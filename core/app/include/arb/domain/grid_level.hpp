#pragma once

#include <optional>
#include <string>

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// SpreadDirection / LevelKind
// -----------------------------------------------------------------------------
// Wire forms are "LONG_SPREAD" / "SHORT_SPREAD" and "ENTRY" / "EXIT". These
// strings appear in natural keys, tags and configuration files, so they are
// part of the persisted format and must not change.
// -----------------------------------------------------------------------------
enum class SpreadDirection {
  LongSpread,   // Buy leg1, sell leg2
  ShortSpread,  // Sell leg1, buy leg2
};

enum class LevelKind {
  Entry,
  Exit,
};

const char* toString(SpreadDirection direction);
const char* toString(LevelKind kind);

// Returns std::nullopt for anything other than the exact wire form.
std::optional<SpreadDirection> parseSpreadDirection(const std::string& text);
std::optional<LevelKind> parseLevelKind(const std::string& text);

SpreadDirection opposite(SpreadDirection direction);

// -----------------------------------------------------------------------------
// GridLevel
// -----------------------------------------------------------------------------
//
// @brief  Immutable trigger rule: (spread threshold, direction, kind, size).
//
// @details
// spread_pct is a signed fraction (-0.02 == -2%). position_size_pct is the
// signed fraction of allocatable capital the level commits; exit levels
// carry the negated entry size.
//
// The natural key "{spread:F4}|{direction}|{kind}" identifies a level
// within one trading pair only. Two pairs may hold levels with the same key.
//
// Thread model: plain value, safe to copy between threads.
// -----------------------------------------------------------------------------
struct GridLevel {
  double spread_pct{0.0};
  SpreadDirection direction{SpreadDirection::LongSpread};
  LevelKind kind{LevelKind::Entry};
  double position_size_pct{0.0};

  std::string naturalKey() const;

  bool operator==(const GridLevel& other) const;
  bool operator!=(const GridLevel& other) const { return !(*this == other); }
};

// -----------------------------------------------------------------------------
// GridLevelPair
// -----------------------------------------------------------------------------
//
// @brief  An entry level and its matching exit level.
//
// @details
// Construction validates the thresholds and throws std::invalid_argument
// with a message naming the offending parameter:
//
//   LongSpread:  entry < 0 and exit > entry
//   ShortSpread: entry > 0 and exit < entry
//
// entry, exit and size must also be exact at four decimal places (the
// precision of tags and natural keys), so every valid pair round-trips
// through encodeGridTag / tryDecodeGridTag.
//
// The exit level gets the opposite direction and the negated size. Once
// constructed a pair is immutable; there is no default state, so holders
// use std::optional where "no pair" must be representable.
// -----------------------------------------------------------------------------
class GridLevelPair {
 public:
  GridLevelPair(double entry_spread_pct, double exit_spread_pct,
                SpreadDirection direction, double position_size_pct);

  const GridLevel& entry() const { return entry_; }
  const GridLevel& exit() const { return exit_; }

  SpreadDirection direction() const { return entry_.direction; }

  bool operator==(const GridLevelPair& other) const;
  bool operator!=(const GridLevelPair& other) const {
    return !(*this == other);
  }

  // "[LONG_SPREAD] entry=-0.0200 exit=0.0100 size=0.5000", for logs.
  std::string toString() const;

 private:
  GridLevel entry_;
  GridLevel exit_;
};

// Fixed-point rendering shared by natural keys and tags ("%.4f", "C" locale).
std::string formatFixed4(double value);

}  // namespace domain
}  // namespace arb
