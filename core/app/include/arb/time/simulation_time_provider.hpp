#pragma once

#include "arb/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace arb {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Clock that only moves when told to.
//
// @details
// MarketDataGateway calls advance_time() with each quote's timestamp before
// publishing it, so during a replay "now" is always the time of the latest
// quote. Tests use advance_by() to step past signal periods and backup
// intervals without sleeping.
//
// Monotonicity is the caller's responsibility and is not checked.
//
// Thread model: single writer (gateway thread or test body), any number of
// readers. The value is a std::atomic, so readers never block the writer.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace arb
