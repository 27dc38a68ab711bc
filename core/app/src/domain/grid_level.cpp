#include "arb/domain/grid_level.hpp"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace arb {
namespace domain {

const char* toString(SpreadDirection direction) {
  switch (direction) {
    case SpreadDirection::LongSpread:  return "LONG_SPREAD";
    case SpreadDirection::ShortSpread: return "SHORT_SPREAD";
  }
  return "UNKNOWN";
}

const char* toString(LevelKind kind) {
  switch (kind) {
    case LevelKind::Entry: return "ENTRY";
    case LevelKind::Exit:  return "EXIT";
  }
  return "UNKNOWN";
}

std::optional<SpreadDirection> parseSpreadDirection(const std::string& text) {
  if (text == "LONG_SPREAD") {
    return SpreadDirection::LongSpread;
  }
  if (text == "SHORT_SPREAD") {
    return SpreadDirection::ShortSpread;
  }
  return std::nullopt;
}

std::optional<LevelKind> parseLevelKind(const std::string& text) {
  if (text == "ENTRY") {
    return LevelKind::Entry;
  }
  if (text == "EXIT") {
    return LevelKind::Exit;
  }
  return std::nullopt;
}

SpreadDirection opposite(SpreadDirection direction) {
  return direction == SpreadDirection::LongSpread
             ? SpreadDirection::ShortSpread
             : SpreadDirection::LongSpread;
}

std::string formatFixed4(double value) {
  // Classic locale so a process-wide locale never turns '.' into ','.
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(4) << value;
  return out.str();
}

// -----------------------------------------------------------------------------
// GridLevel
// -----------------------------------------------------------------------------
std::string GridLevel::naturalKey() const {
  return formatFixed4(spread_pct) + "|" + toString(direction) + "|" +
         toString(kind);
}

bool GridLevel::operator==(const GridLevel& other) const {
  return spread_pct == other.spread_pct && direction == other.direction &&
         kind == other.kind && position_size_pct == other.position_size_pct;
}

// -----------------------------------------------------------------------------
// GridLevelPair
// -----------------------------------------------------------------------------
namespace {

// Tags and natural keys carry exactly four decimals.
void requireFourDecimals(double value, const char* name) {
  if (!std::isfinite(value) || std::round(value * 1e4) / 1e4 != value) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::setprecision(17) << value;
    throw std::invalid_argument(std::string("GridLevelPair: ") + name +
                                " must have at most 4 decimal places, got " +
                                out.str());
  }
}

}  // namespace

GridLevelPair::GridLevelPair(double entry_spread_pct, double exit_spread_pct,
                             SpreadDirection direction,
                             double position_size_pct) {
  requireFourDecimals(entry_spread_pct, "entry_spread_pct");
  requireFourDecimals(exit_spread_pct, "exit_spread_pct");
  requireFourDecimals(position_size_pct, "position_size_pct");

  if (direction == SpreadDirection::LongSpread) {
    if (!(entry_spread_pct < 0.0)) {
      throw std::invalid_argument(
          "GridLevelPair: entry_spread_pct must be negative for LONG_SPREAD, "
          "got " + formatFixed4(entry_spread_pct));
    }
    if (!(exit_spread_pct > entry_spread_pct)) {
      throw std::invalid_argument(
          "GridLevelPair: exit_spread_pct must be greater than "
          "entry_spread_pct for LONG_SPREAD, got entry=" +
          formatFixed4(entry_spread_pct) +
          " exit=" + formatFixed4(exit_spread_pct));
    }
  } else {
    if (!(entry_spread_pct > 0.0)) {
      throw std::invalid_argument(
          "GridLevelPair: entry_spread_pct must be positive for "
          "SHORT_SPREAD, got " + formatFixed4(entry_spread_pct));
    }
    if (!(exit_spread_pct < entry_spread_pct)) {
      throw std::invalid_argument(
          "GridLevelPair: exit_spread_pct must be less than "
          "entry_spread_pct for SHORT_SPREAD, got entry=" +
          formatFixed4(entry_spread_pct) +
          " exit=" + formatFixed4(exit_spread_pct));
    }
  }

  entry_.spread_pct = entry_spread_pct;
  entry_.direction = direction;
  entry_.kind = LevelKind::Entry;
  entry_.position_size_pct = position_size_pct;

  exit_.spread_pct = exit_spread_pct;
  exit_.direction = opposite(direction);
  exit_.kind = LevelKind::Exit;
  exit_.position_size_pct = -position_size_pct;
}

bool GridLevelPair::operator==(const GridLevelPair& other) const {
  return entry_ == other.entry_ && exit_ == other.exit_;
}

std::string GridLevelPair::toString() const {
  return std::string("[") + domain::toString(entry_.direction) +
         "] entry=" + formatFixed4(entry_.spread_pct) +
         " exit=" + formatFixed4(exit_.spread_pct) +
         " size=" + formatFixed4(entry_.position_size_pct);
}

}  // namespace domain
}  // namespace arb
