#pragma once

#include "arb/domain/grid_signal.hpp"

#include <cstdint>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ISignalCollection
// -----------------------------------------------------------------------------
// The store of live signals the alpha model consults instead of keeping its
// own dedup state. Cancelling a signal closes it at cancel time; it then
// reads as expired like any other signal past its close time.
// -----------------------------------------------------------------------------
class ISignalCollection {
 public:
  virtual ~ISignalCollection() = default;

  virtual std::vector<domain::GridSignal> getActiveSignals(
      std::int64_t now_ms) const = 0;

  virtual void cancel(const std::vector<domain::GridSignal>& signals,
                      std::int64_t now_ms) = 0;
};

}  // namespace arb
