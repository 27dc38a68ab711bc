#pragma once

#include "arb/pairs/trading_pair_manager.hpp"
#include "arb/portfolio/portfolio_target.hpp"

#include <cstdint>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// TargetSizer
// -----------------------------------------------------------------------------
//
// @brief  Converts paired percentage targets into absolute-quantity
//         ArbitragePortfolioTargets.
//
// @details
// Targets are grouped by tag. A tag needs one target for each leg it
// decodes to; anything else (undecodable tag, single flatten target,
// unknown pair) is logged and skipped.
//
//     quantity = percent * portfolio_value / mid_price(leg)
//
// rounded to the leg's lot size, half to even. A zero percent needs no
// price. A non-zero percent on a leg without a usable quote skips the tag.
//
// The grid position's current quantities are captured as the initial
// quantities of the sized target.
//
// Thread model: evaluation loop only; reads pairs through their own locks.
// -----------------------------------------------------------------------------
class TargetSizer {
 public:
  // @throws std::invalid_argument if portfolio_value <= 0.
  TargetSizer(const TradingPairManager& pairs, double portfolio_value);

  std::vector<ArbitragePortfolioTarget> size(
      const std::vector<PortfolioTarget>& targets, std::int64_t now_ms) const;

  double portfolioValue() const { return portfolio_value_; }

  // Rounds quantity to a whole number of lots, ties to even.
  static double roundToLot(double quantity, double lot_size);

 private:
  const TradingPairManager& pairs_;
  double portfolio_value_;
};

}  // namespace arb
