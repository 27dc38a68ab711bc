#pragma once

#include "arb/alpha/signal_collection.hpp"
#include "arb/domain/grid_signal.hpp"
#include "arb/portfolio/portfolio_target.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ArbitragePortfolioConstructionModel
// -----------------------------------------------------------------------------
//
// @brief  Turns active single-leg grid signals into paired percentage
//         targets.
//
// @details
// Each cycle, when a rebalance is due:
//
//   1. Active signals with a tag are collected, newest first. Only the
//      newest signal per tag is used (an exit signal supersedes the entry
//      signal of the same level pair while both are active). N is the
//      number of distinct tags.
//
//   2. Each one is decoded. A tag that does not decode is logged and
//      skipped; the rest of the batch goes on. Otherwise two targets are
//      emitted with the signal's tag:
//
//         leg1 = (1 / N) * entry.position_size_pct * sign(direction)
//         leg2 = -leg1
//
//      Flat (exit) signals therefore produce 0 / 0.
//
//   3. Expired signals are removed from the collection. For each one whose
//      symbol has no active signal left, both legs decoded from its tag
//      get a 0 target. If the tag does not decode, only the signal's own
//      symbol is flattened.
//
// A rebalance is due when new signals arrived this cycle, when any signal
// in the collection has expired, or when the optional rebalance function's
// next time has been reached.
//
// Thread model: evaluation loop only.
// -----------------------------------------------------------------------------
class ArbitragePortfolioConstructionModel {
 public:
  // Given the current time, returns when the next periodic rebalance is
  // due, or std::nullopt for "not on a schedule".
  using RebalanceFunc =
      std::function<std::optional<std::int64_t>(std::int64_t now_ms)>;

  explicit ArbitragePortfolioConstructionModel(SignalCollection& signals,
                                               RebalanceFunc rebalance = {});

  std::vector<PortfolioTarget> createTargets(
      std::int64_t now_ms, const std::vector<domain::GridSignal>& new_signals);

  bool isRebalanceDue(std::int64_t now_ms,
                      const std::vector<domain::GridSignal>& new_signals) const;

 private:
  std::vector<PortfolioTarget> targetsForActiveSignals(std::int64_t now_ms);
  std::vector<PortfolioTarget> flattenExpiredSignals(std::int64_t now_ms);

  SignalCollection& signals_;
  RebalanceFunc rebalance_;
  std::optional<std::int64_t> next_rebalance_ms_;
};

}  // namespace arb
