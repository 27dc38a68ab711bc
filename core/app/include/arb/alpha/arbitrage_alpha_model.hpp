#pragma once

#include "arb/alpha/i_signal_collection.hpp"
#include "arb/domain/grid_level.hpp"
#include "arb/domain/grid_signal.hpp"
#include "arb/pairs/trading_pair.hpp"
#include "arb/pairs/trading_pair_manager.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace arb {

using GridTemplates = std::map<std::string, std::vector<domain::GridLevelPair>>;

// Level pairs applied to newly added pairs, by pair type. "spread" has no
// template; its levels are configured explicitly.
GridTemplates defaultGridTemplates();

struct AlphaSettings {
  std::int64_t signal_period_ms{5 * 60 * 1000};
  double confidence{1.0};
  bool require_valid_prices{true};
  // Merged over defaultGridTemplates(); an entry here replaces the default
  // for its pair type.
  GridTemplates grid_templates;
};

// -----------------------------------------------------------------------------
// ArbitrageAlphaModel
// -----------------------------------------------------------------------------
//
// @brief  Turns spread threshold crossings into single-leg, tag-bearing
//         signals.
//
// @details
// Per pair, per tick:
//
//   Entry, for each configured level pair (skipped while the pair is
//   pending removal):
//     LONG_SPREAD   fires when spread <= entry threshold  -> Up on leg1
//     SHORT_SPREAD  fires when spread >= entry threshold  -> Down on leg1
//
//   Exit, for each live grid position of the pair:
//     GridPosition::shouldExit(spread) on the position's own level pair
//                                                         -> Flat on leg1
//
// Each firing emits exactly one signal on leg1 carrying the encoded grid
// tag, unless the signal collection already holds an active signal on leg1
// for the same level. The model itself remembers nothing between ticks.
//
// onTradingPairsChanged() applies grid templates to added pairs and
// cancels every active signal on either leg of a removed pair.
//
// Thread model: update() runs on the evaluation loop. Construction throws
// std::invalid_argument for a confidence outside [0, 1] or a non-positive
// signal period.
// -----------------------------------------------------------------------------
class ArbitrageAlphaModel {
 public:
  ArbitrageAlphaModel(ISignalCollection& signals, AlphaSettings settings = {});

  std::vector<domain::GridSignal> update(
      const std::vector<std::shared_ptr<TradingPair>>& pairs,
      std::int64_t now_ms);

  void onTradingPairsChanged(const TradingPairChanges& changes,
                             std::int64_t now_ms);

  const AlphaSettings& settings() const { return settings_; }
  const GridTemplates& templates() const { return templates_; }

  static constexpr const char* kName = "ArbitrageAlphaModel";

 private:
  bool shouldEmit(const std::string& symbol, const domain::GridLevel& level,
                  std::int64_t now_ms) const;

  domain::GridSignal makeSignal(const TradingPair& pair,
                                const domain::GridLevelPair& level_pair,
                                domain::SignalDirection direction,
                                domain::LevelKind kind, std::int64_t now_ms);

  ISignalCollection& signals_;
  AlphaSettings settings_;
  GridTemplates templates_;
  std::atomic<std::uint64_t> next_signal_id_{1};
};

}  // namespace arb
