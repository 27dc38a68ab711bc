#include "arb/alpha/arbitrage_alpha_model.hpp"

#include "arb/tag/grid_tag.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace arb {

using domain::GridLevelPair;
using domain::LevelKind;
using domain::SignalDirection;
using domain::SpreadDirection;

GridTemplates defaultGridTemplates() {
  GridTemplates templates;
  // Tokenized stock against the listed stock.
  templates["crypto_stock"] = {
      GridLevelPair(-0.02, 0.01, SpreadDirection::LongSpread, 0.5),
      GridLevelPair(0.03, -0.005, SpreadDirection::ShortSpread, 0.5),
  };
  // Basis trade.
  templates["spot_future"] = {
      GridLevelPair(-0.015, 0.008, SpreadDirection::LongSpread, 0.3),
      GridLevelPair(0.025, -0.008, SpreadDirection::ShortSpread, 0.3),
  };
  return templates;
}

ArbitrageAlphaModel::ArbitrageAlphaModel(ISignalCollection& signals,
                                         AlphaSettings settings)
    : signals_(signals), settings_(std::move(settings)) {
  if (settings_.confidence < 0.0 || settings_.confidence > 1.0) {
    throw std::invalid_argument(
        "ArbitrageAlphaModel: confidence must be between 0 and 1");
  }
  if (settings_.signal_period_ms <= 0) {
    throw std::invalid_argument(
        "ArbitrageAlphaModel: signal_period_ms must be > 0");
  }

  templates_ = defaultGridTemplates();
  for (const auto& [type, levels] : settings_.grid_templates) {
    templates_[type] = levels;
  }
}

std::vector<domain::GridSignal> ArbitrageAlphaModel::update(
    const std::vector<std::shared_ptr<TradingPair>>& pairs,
    std::int64_t now_ms) {
  std::vector<domain::GridSignal> out;

  for (const auto& pair : pairs) {
    if (settings_.require_valid_prices && !pair->hasValidPrices()) {
      continue;
    }
    const double spread = pair->theoreticalSpread();
    const std::string& leg1 = pair->leg1().symbol;

    if (!pair->isPendingRemoval()) {
      for (const auto& level_pair : pair->levelPairs()) {
        const auto& entry = level_pair.entry();
        bool triggered = entry.direction == SpreadDirection::LongSpread
                             ? spread <= entry.spread_pct
                             : spread >= entry.spread_pct;
        if (!triggered || !shouldEmit(leg1, entry, now_ms)) {
          continue;
        }
        auto direction = entry.direction == SpreadDirection::LongSpread
                             ? SignalDirection::Up
                             : SignalDirection::Down;
        out.push_back(makeSignal(*pair, level_pair, direction,
                                 LevelKind::Entry, now_ms));
      }
    }

    for (const auto& position : pair->positions()) {
      if (!position.shouldExit(spread)) {
        continue;
      }
      const auto& level_pair = position.levelPair();
      if (!shouldEmit(leg1, level_pair.exit(), now_ms)) {
        continue;
      }
      out.push_back(makeSignal(*pair, level_pair, SignalDirection::Flat,
                               LevelKind::Exit, now_ms));
    }
  }

  return out;
}

bool ArbitrageAlphaModel::shouldEmit(const std::string& symbol,
                                     const domain::GridLevel& level,
                                     std::int64_t now_ms) const {
  for (const auto& active : signals_.getActiveSignals(now_ms)) {
    if (active.symbol == symbol && active.level == level) {
      return false;
    }
  }
  return true;
}

domain::GridSignal ArbitrageAlphaModel::makeSignal(
    const TradingPair& pair, const GridLevelPair& level_pair,
    SignalDirection direction, LevelKind kind, std::int64_t now_ms) {
  domain::GridSignal signal;
  signal.id = next_signal_id_.fetch_add(1);
  signal.symbol = pair.leg1().symbol;
  signal.direction = direction;
  signal.level = kind == LevelKind::Entry ? level_pair.entry()
                                          : level_pair.exit();
  signal.confidence = settings_.confidence;
  signal.tag = encodeGridTag(pair.leg1().symbol, pair.leg2().symbol,
                             level_pair);
  signal.generated_ms = now_ms;
  signal.close_ms = now_ms + settings_.signal_period_ms;
  signal.source = kName;
  return signal;
}

void ArbitrageAlphaModel::onTradingPairsChanged(
    const TradingPairChanges& changes, std::int64_t now_ms) {
  for (const auto& pair : changes.added) {
    auto it = templates_.find(pair->pairType());
    if (it == templates_.end()) {
      continue;
    }
    for (const auto& level_pair : it->second) {
      pair->addLevelPair(level_pair);
    }
    std::cout << "[ArbitrageAlphaModel] configured " << it->second.size()
              << " grid level(s) for " << pair->key() << " ("
              << pair->pairType() << ")\n";
  }

  for (const auto& pair : changes.removed) {
    std::vector<domain::GridSignal> to_cancel;
    for (const auto& signal : signals_.getActiveSignals(now_ms)) {
      if (signal.symbol == pair->leg1().symbol ||
          signal.symbol == pair->leg2().symbol) {
        to_cancel.push_back(signal);
      }
    }
    if (!to_cancel.empty()) {
      signals_.cancel(to_cancel, now_ms);
      std::cout << "[ArbitrageAlphaModel] cancelled " << to_cancel.size()
                << " signal(s) for removed pair " << pair->key() << "\n";
    }
  }
}

}  // namespace arb
