#pragma once

#include "arb/domain/account.hpp"

#include <cstdint>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// IExecutionHistoryProvider
// -----------------------------------------------------------------------------
//
// @brief  Optional brokerage capability: list past executions.
//
// @details
// Used by reconciliation to replay fills that were missed while the engine
// was down or a connection dropped. A brokerage advertises the capability
// by returning a non-null pointer from IBrokerage::executionHistory();
// MultiBrokerageManager resolves it once, when the brokerage is registered.
//
// Returns executions with start_ms <= time_ms <= end_ms, in any order.
// Implementations may throw on transport errors; callers log and carry on.
// -----------------------------------------------------------------------------
class IExecutionHistoryProvider {
 public:
  virtual ~IExecutionHistoryProvider() = default;

  virtual std::vector<domain::ExecutionRecord> getExecutionHistory(
      std::int64_t start_ms, std::int64_t end_ms) = 0;
};

}  // namespace arb
