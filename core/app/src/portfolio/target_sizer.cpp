#include "arb/portfolio/target_sizer.hpp"

#include "arb/tag/grid_tag.hpp"

#include <cmath>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>

namespace arb {

TargetSizer::TargetSizer(const TradingPairManager& pairs,
                         double portfolio_value)
    : pairs_(pairs), portfolio_value_(portfolio_value) {
  if (!(portfolio_value_ > 0.0)) {
    throw std::invalid_argument("TargetSizer: portfolio_value must be > 0");
  }
}

double TargetSizer::roundToLot(double quantity, double lot_size) {
  if (!(lot_size > 0.0)) {
    return quantity;
  }
  // nearbyint honours the default FE_TONEAREST mode: ties go to even.
  return std::nearbyint(quantity / lot_size) * lot_size;
}

std::vector<ArbitragePortfolioTarget> TargetSizer::size(
    const std::vector<PortfolioTarget>& targets, std::int64_t now_ms) const {
  // Keep first-seen order of tags.
  std::vector<std::string> order;
  std::map<std::string, std::map<std::string, double>> by_tag;
  for (const auto& target : targets) {
    auto& legs = by_tag[target.tag];
    if (legs.empty()) {
      order.push_back(target.tag);
    }
    legs[target.symbol] = target.percent;
  }

  std::vector<ArbitragePortfolioTarget> sized;
  for (const auto& tag : order) {
    const auto& legs = by_tag[tag];
    auto decoded = tryDecodeGridTag(tag);
    if (!decoded) {
      std::cerr << "[TargetSizer] WARNING: cannot size target with tag '" << tag
                << "', skipped\n";
      continue;
    }
    auto leg1_it = legs.find(decoded->leg1);
    auto leg2_it = legs.find(decoded->leg2);
    if (leg1_it == legs.end() || leg2_it == legs.end()) {
      std::cerr << "[TargetSizer] WARNING: incomplete leg targets for " << tag
                << ", skipped\n";
      continue;
    }
    auto pair = pairs_.find(decoded->leg1, decoded->leg2);
    if (!pair) {
      std::cerr << "[TargetSizer] WARNING: unknown trading pair "
                << decoded->leg1 << "-" << decoded->leg2 << ", skipped\n";
      continue;
    }

    auto quantityFor = [&](const LegSpec& leg,
                           double percent) -> std::optional<double> {
      if (percent == 0.0) {
        return 0.0;
      }
      auto quote = pair->quoteFor(leg.symbol);
      if (!quote || !(quote->mid() > 0.0)) {
        return std::nullopt;
      }
      return roundToLot(percent * portfolio_value_ / quote->mid(),
                        leg.lot_size);
    };

    auto leg1_qty = quantityFor(pair->leg1(), leg1_it->second);
    auto leg2_qty = quantityFor(pair->leg2(), leg2_it->second);
    if (!leg1_qty || !leg2_qty) {
      std::cerr << "[TargetSizer] WARNING: no price to size " << tag
                << ", skipped\n";
      continue;
    }

    const LegQuantities current =
        pairs_.gridQuantities(tag).value_or(LegQuantities{});

    ArbitragePortfolioTarget out;
    out.tag = tag;
    out.leg1_symbol = decoded->leg1;
    out.leg2_symbol = decoded->leg2;
    out.leg1_quantity = *leg1_qty;
    out.leg2_quantity = *leg2_qty;
    out.leg1_initial_quantity = current.leg1;
    out.leg2_initial_quantity = current.leg2;
    out.leg1_lot_size = pair->leg1().lot_size;
    out.leg2_lot_size = pair->leg2().lot_size;
    const bool flatten = leg1_it->second == 0.0 && leg2_it->second == 0.0;
    out.level = flatten ? decoded->level_pair.exit()
                        : decoded->level_pair.entry();
    out.created_ms = now_ms;
    sized.push_back(out);
  }
  return sized;
}

}  // namespace arb
