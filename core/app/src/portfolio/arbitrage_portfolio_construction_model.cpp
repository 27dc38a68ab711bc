#include "arb/portfolio/arbitrage_portfolio_construction_model.hpp"

#include "arb/tag/grid_tag.hpp"

#include <iostream>
#include <set>
#include <utility>

namespace arb {

ArbitragePortfolioConstructionModel::ArbitragePortfolioConstructionModel(
    SignalCollection& signals, RebalanceFunc rebalance)
    : signals_(signals), rebalance_(std::move(rebalance)) {}

bool ArbitragePortfolioConstructionModel::isRebalanceDue(
    std::int64_t now_ms,
    const std::vector<domain::GridSignal>& new_signals) const {
  if (!new_signals.empty()) {
    return true;
  }
  if (signals_.hasExpiredSignals(now_ms)) {
    return true;
  }
  if (rebalance_) {
    return !next_rebalance_ms_ || now_ms >= *next_rebalance_ms_;
  }
  return false;
}

std::vector<PortfolioTarget> ArbitragePortfolioConstructionModel::createTargets(
    std::int64_t now_ms, const std::vector<domain::GridSignal>& new_signals) {
  if (!isRebalanceDue(now_ms, new_signals)) {
    return {};
  }
  if (rebalance_) {
    next_rebalance_ms_ = rebalance_(now_ms);
  }

  std::vector<PortfolioTarget> targets = targetsForActiveSignals(now_ms);
  std::vector<PortfolioTarget> flatten = flattenExpiredSignals(now_ms);
  targets.insert(targets.end(), flatten.begin(), flatten.end());
  return targets;
}

std::vector<PortfolioTarget>
ArbitragePortfolioConstructionModel::targetsForActiveSignals(
    std::int64_t now_ms) {
  // Newest first; keep the first signal seen per tag.
  std::vector<domain::GridSignal> selected;
  std::set<std::string> seen;
  for (auto& signal : signals_.getActiveSignals(now_ms)) {
    if (signal.tag.empty() || !seen.insert(signal.tag).second) {
      continue;
    }
    selected.push_back(std::move(signal));
  }
  if (selected.empty()) {
    return {};
  }

  std::cout << "[ArbitragePortfolioConstructionModel] active signals: "
            << selected.size() << "\n";

  const double share = 1.0 / static_cast<double>(selected.size());
  std::vector<PortfolioTarget> targets;
  targets.reserve(selected.size() * 2);

  for (const auto& signal : selected) {
    auto decoded = tryDecodeGridTag(signal.tag);
    if (!decoded) {
      std::cerr << "[ArbitragePortfolioConstructionModel] ERROR: failed to "
                   "decode grid tag '"
                << signal.tag << "' of signal " << signal.id << ", skipped\n";
      continue;
    }

    const double percent = share *
                           decoded->level_pair.entry().position_size_pct *
                           domain::sign(signal.direction);
    targets.push_back(PortfolioTarget{decoded->leg1, percent, signal.tag});
    targets.push_back(PortfolioTarget{decoded->leg2, -percent, signal.tag});
  }
  return targets;
}

std::vector<PortfolioTarget>
ArbitragePortfolioConstructionModel::flattenExpiredSignals(
    std::int64_t now_ms) {
  std::vector<PortfolioTarget> targets;
  for (const auto& expired : signals_.removeExpired(now_ms)) {
    if (signals_.hasActiveSignals(expired.symbol, now_ms)) {
      continue;
    }
    auto decoded = tryDecodeGridTag(expired.tag);
    if (decoded) {
      targets.push_back(PortfolioTarget{decoded->leg1, 0.0, expired.tag});
      targets.push_back(PortfolioTarget{decoded->leg2, 0.0, expired.tag});
    } else {
      std::cerr << "[ArbitragePortfolioConstructionModel] WARNING: expired "
                   "signal "
                << expired.id << " has undecodable tag '" << expired.tag
                << "', flattening " << expired.symbol << " only\n";
      targets.push_back(PortfolioTarget{expired.symbol, 0.0, expired.tag});
    }
  }
  return targets;
}

}  // namespace arb
