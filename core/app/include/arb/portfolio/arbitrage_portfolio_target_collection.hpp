#pragma once

#include "arb/concurrent/concurrent_map.hpp"
#include "arb/domain/order.hpp"
#include "arb/pairs/i_grid_position_view.hpp"
#include "arb/portfolio/portfolio_target.hpp"

#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ArbitragePortfolioTargetCollection
// -----------------------------------------------------------------------------
//
// @brief  Outstanding two-leg targets, keyed by grid tag.
//
// @details
// The key is the tag, not the symbol: one instrument can carry several
// grid levels at once (different entry thresholds on the same pair), and
// each is an independent position with its own target.
//
// add() is an upsert; the last target written for a tag wins.
//
// clearFulfilled() drops a target once, for both legs,
//
//     |(target - initial) - (current - initial)| < lot
//     |open order quantity tagged with this tag| < lot
//
// The open-order sum only counts orders whose tag equals the target's tag,
// so a working order for another level on the same symbol never holds a
// target back. A target whose tag no longer resolves to a known pair is
// dropped with a warning. A target replaced by add() while the check ran is
// kept.
//
// Thread model:
//   Backed by a ConcurrentMap: every call is one short critical section,
//   and targets() returns a point-in-time copy.
// -----------------------------------------------------------------------------
class ArbitragePortfolioTargetCollection {
 public:
  void add(const ArbitragePortfolioTarget& target);
  void addRange(const std::vector<ArbitragePortfolioTarget>& targets);

  std::optional<ArbitragePortfolioTarget> tryGet(const std::string& tag) const;
  bool contains(const std::string& tag) const { return targets_.contains(tag); }
  bool remove(const std::string& tag) { return targets_.erase(tag); }
  void clear() { targets_.clear(); }

  std::vector<ArbitragePortfolioTarget> targets() const;
  std::size_t size() const { return targets_.size(); }
  bool empty() const { return targets_.empty(); }

  // Returns the tags that were removed.
  std::vector<std::string> clearFulfilled(
      const IGridPositionView& positions,
      const std::vector<domain::Order>& open_orders);

  static bool isFulfilled(const ArbitragePortfolioTarget& target,
                          const LegQuantities& current,
                          const std::vector<domain::Order>& open_orders);

  // Signed remaining quantity of open orders on symbol carrying tag.
  static double openQuantity(const std::vector<domain::Order>& open_orders,
                             const std::string& symbol, const std::string& tag);

 private:
  ConcurrentMap<std::string, ArbitragePortfolioTarget> targets_;
};

}  // namespace arb
