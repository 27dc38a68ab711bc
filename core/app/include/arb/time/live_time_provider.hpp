#pragma once

#include "arb/time/i_time_provider.hpp"

namespace arb {

// Wall clock: std::chrono::system_clock in epoch milliseconds.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace arb
