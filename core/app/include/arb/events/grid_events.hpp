#pragma once

#include "arb/domain/grid_signal.hpp"

#include <cstdint>
#include <string>

namespace arb {

// Published on the evaluation loop bus for every signal the alpha model
// emits. Telemetry only; the signal itself lives in the SignalCollection.
struct GridSignalEvent {
  domain::GridSignal signal;
};

// -----------------------------------------------------------------------------
// GridPositionUpdateEvent
// -----------------------------------------------------------------------------
// Published after a fill changes a grid position, and once more with
// removed = true when a flat position is dropped from its pair.
// -----------------------------------------------------------------------------
struct GridPositionUpdateEvent {
  std::string pair_key;
  std::string tag;
  double leg1_quantity{0.0};
  double leg1_average_cost{0.0};
  double leg2_quantity{0.0};
  double leg2_average_cost{0.0};
  bool invested{false};
  bool removed{false};
  std::int64_t timestamp_ms{0};
};

}  // namespace arb
