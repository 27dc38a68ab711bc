#pragma once

#include "arb/domain/grid_level.hpp"

#include <cstdint>
#include <string>

namespace arb {
namespace domain {

enum class SignalDirection {
  Down = -1,
  Flat = 0,
  Up = 1,
};

inline int sign(SignalDirection direction) {
  return static_cast<int>(direction);
}

inline const char* toString(SignalDirection direction) {
  switch (direction) {
    case SignalDirection::Up:   return "Up";
    case SignalDirection::Down: return "Down";
    case SignalDirection::Flat: return "Flat";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// GridSignal
// -----------------------------------------------------------------------------
//
// @brief  A single-leg trading signal raised for one grid level.
//
// @details
// The signal names only leg1 (symbol). Everything needed to act on both
// legs travels in tag, the encoded grid tag. level is the level that
// fired: the entry level for Up/Down, the exit level for Flat.
//
// A signal is active on [generated_ms, close_ms). Cancellation moves
// close_ms back to the cancellation time, so a cancelled signal reads as
// expired from then on.
// -----------------------------------------------------------------------------
struct GridSignal {
  std::uint64_t id{0};
  std::string symbol;
  SignalDirection direction{SignalDirection::Flat};
  GridLevel level;
  double confidence{1.0};
  std::string tag;
  std::int64_t generated_ms{0};
  std::int64_t close_ms{0};
  std::string source;

  bool isActive(std::int64_t now_ms) const {
    return now_ms >= generated_ms && now_ms < close_ms;
  }

  bool isExpired(std::int64_t now_ms) const { return now_ms >= close_ms; }
};

}  // namespace domain
}  // namespace arb
