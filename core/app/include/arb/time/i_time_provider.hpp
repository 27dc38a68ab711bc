#pragma once

#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Source of "now" as epoch milliseconds (UTC).
//
// @details
// Signal generation and expiry, backup tier scheduling, reconciliation
// windows and paper fills all ask this interface for the time, never the
// system clock. Live runs inject LiveTimeProvider; replays and tests inject
// SimulationTimeProvider and move time explicitly, which makes signal
// expiry and backup rate limiting deterministic.
//
// Implementations must allow concurrent now_ms() calls from any thread.
// Components hold a const reference and never own the provider.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace arb
