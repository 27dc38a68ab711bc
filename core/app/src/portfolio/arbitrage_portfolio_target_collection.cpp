#include "arb/portfolio/arbitrage_portfolio_target_collection.hpp"

#include <cmath>
#include <iostream>
#include <map>

namespace arb {

void ArbitragePortfolioTargetCollection::add(
    const ArbitragePortfolioTarget& target) {
  targets_.insertOrAssign(target.tag, target);
}

void ArbitragePortfolioTargetCollection::addRange(
    const std::vector<ArbitragePortfolioTarget>& targets) {
  for (const auto& target : targets) {
    targets_.insertOrAssign(target.tag, target);
  }
}

std::optional<ArbitragePortfolioTarget> ArbitragePortfolioTargetCollection::tryGet(
    const std::string& tag) const {
  return targets_.find(tag);
}

std::vector<ArbitragePortfolioTarget> ArbitragePortfolioTargetCollection::targets()
    const {
  return targets_.values();
}

double ArbitragePortfolioTargetCollection::openQuantity(
    const std::vector<domain::Order>& open_orders, const std::string& symbol,
    const std::string& tag) {
  double total = 0.0;
  for (const auto& order : open_orders) {
    if (order.symbol == symbol && order.tag == tag &&
        domain::isOpen(order.status)) {
      total += order.signedRemaining();
    }
  }
  return total;
}

bool ArbitragePortfolioTargetCollection::isFulfilled(
    const ArbitragePortfolioTarget& target, const LegQuantities& current,
    const std::vector<domain::Order>& open_orders) {
  const double leg1_delta = target.leg1_quantity - target.leg1_initial_quantity;
  const double leg1_traded = current.leg1 - target.leg1_initial_quantity;
  const double leg2_delta = target.leg2_quantity - target.leg2_initial_quantity;
  const double leg2_traded = current.leg2 - target.leg2_initial_quantity;

  if (std::abs(leg1_delta - leg1_traded) >= target.leg1_lot_size ||
      std::abs(leg2_delta - leg2_traded) >= target.leg2_lot_size) {
    return false;
  }

  const double leg1_open =
      openQuantity(open_orders, target.leg1_symbol, target.tag);
  const double leg2_open =
      openQuantity(open_orders, target.leg2_symbol, target.tag);
  return std::abs(leg1_open) < target.leg1_lot_size &&
         std::abs(leg2_open) < target.leg2_lot_size;
}

std::vector<std::string> ArbitragePortfolioTargetCollection::clearFulfilled(
    const IGridPositionView& positions,
    const std::vector<domain::Order>& open_orders) {
  std::map<std::string, ArbitragePortfolioTarget> done;
  for (const auto& target : targets_.values()) {
    auto current = positions.gridQuantities(target.tag);
    if (!current) {
      std::cerr << "[ArbitragePortfolioTargetCollection] WARNING: no trading "
                   "pair for target "
                << target.tag << ", dropped\n";
      done.emplace(target.tag, target);
      continue;
    }
    if (isFulfilled(target, *current, open_orders)) {
      done.emplace(target.tag, target);
    }
  }
  if (done.empty()) {
    return {};
  }

  // Only erase what was checked; a target replaced meanwhile stays.
  return targets_.eraseIf(
      [&done](const std::string& tag, const ArbitragePortfolioTarget& value) {
        auto it = done.find(tag);
        return it != done.end() && it->second == value;
      });
}

}  // namespace arb
