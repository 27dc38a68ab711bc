#include "arb/pairs/trading_pair.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace arb {

const char* toString(MarketState state) {
  switch (state) {
    case MarketState::Unknown:          return "Unknown";
    case MarketState::Crossed:          return "Crossed";
    case MarketState::LimitOpportunity: return "LimitOpportunity";
    case MarketState::NoOpportunity:    return "NoOpportunity";
  }
  return "Unknown";
}

namespace {

void validateLeg(const LegSpec& leg, const char* name) {
  if (leg.symbol.empty()) {
    throw std::invalid_argument(std::string("TradingPair: ") + name +
                                " symbol must not be empty");
  }
  if (!(leg.lot_size > 0.0)) {
    throw std::invalid_argument(std::string("TradingPair: ") + name +
                                " lot_size must be > 0 (" + leg.symbol + ")");
  }
}

}  // namespace

TradingPair::TradingPair(LegSpec leg1, LegSpec leg2, std::string pair_type)
    : leg1_(std::move(leg1)),
      leg2_(std::move(leg2)),
      pair_type_(std::move(pair_type)) {
  validateLeg(leg1_, "leg1");
  validateLeg(leg2_, "leg2");
  if (leg1_.symbol == leg2_.symbol) {
    throw std::invalid_argument("TradingPair: leg1 and leg2 must differ (" +
                                leg1_.symbol + ")");
  }
  key_ = leg1_.symbol + "-" + leg2_.symbol;
}

bool TradingPair::updateQuote(const std::string& symbol, double bid,
                              double ask, std::int64_t time_ms) {
  std::unique_lock lock(state_mutex_);
  if (symbol == leg1_.symbol) {
    market_.leg1_quote = Quote{bid, ask};
  } else if (symbol == leg2_.symbol) {
    market_.leg2_quote = Quote{bid, ask};
  } else {
    return false;
  }
  recompute(time_ms);
  return true;
}

void TradingPair::updateQuotes(const Quote& leg1, const Quote& leg2,
                               std::int64_t time_ms) {
  std::unique_lock lock(state_mutex_);
  market_.leg1_quote = leg1;
  market_.leg2_quote = leg2;
  recompute(time_ms);
}

// Caller holds state_mutex_ exclusively.
void TradingPair::recompute(std::int64_t time_ms) {
  const double b1 = market_.leg1_quote.bid;
  const double a1 = market_.leg1_quote.ask;
  const double b2 = market_.leg2_quote.bid;
  const double a2 = market_.leg2_quote.ask;

  market_.updated_ms = time_ms;
  market_.has_valid_prices = b1 > kPriceEpsilon && a1 > kPriceEpsilon &&
                             b2 > kPriceEpsilon && a2 > kPriceEpsilon &&
                             b1 <= a1 && b2 <= a2;

  if (!market_.has_valid_prices) {
    market_.market_state = MarketState::Unknown;
    market_.direction.reset();
    market_.short_spread = 0.0;
    market_.long_spread = 0.0;
    market_.theoretical_spread = 0.0;
    market_.executable_spread.reset();
    return;
  }

  market_.short_spread = (b1 - a2) / b1;
  market_.long_spread = (a1 - b2) / a1;
  market_.theoretical_spread =
      std::abs(market_.long_spread) > std::abs(market_.short_spread)
          ? market_.long_spread
          : market_.short_spread;

  using domain::SpreadDirection;
  if (b1 > a2) {
    // Sell leg1 at its bid, buy leg2 at its ask.
    market_.market_state = MarketState::Crossed;
    market_.direction = SpreadDirection::ShortSpread;
    market_.executable_spread = market_.short_spread;
  } else if (b2 > a1) {
    // Buy leg1 at its ask, sell leg2 at its bid.
    market_.market_state = MarketState::Crossed;
    market_.direction = SpreadDirection::LongSpread;
    market_.executable_spread = market_.long_spread;
  } else if (a1 > a2 && a2 > b1 && b1 > b2) {
    market_.market_state = MarketState::LimitOpportunity;
    market_.direction = SpreadDirection::ShortSpread;
    market_.executable_spread = std::max((a1 - a2) / a1, (b1 - b2) / b1);
  } else if (a2 > a1 && a1 > b2 && b2 > b1) {
    market_.market_state = MarketState::LimitOpportunity;
    market_.direction = SpreadDirection::LongSpread;
    market_.executable_spread = std::min((a1 - b2) / a1, (b1 - a2) / b1);
  } else {
    market_.market_state = MarketState::NoOpportunity;
    market_.direction.reset();
    market_.executable_spread.reset();
  }
}

PairMarketSnapshot TradingPair::marketSnapshot() const {
  std::shared_lock lock(state_mutex_);
  return market_;
}

MarketState TradingPair::marketState() const {
  std::shared_lock lock(state_mutex_);
  return market_.market_state;
}

double TradingPair::theoreticalSpread() const {
  std::shared_lock lock(state_mutex_);
  return market_.theoretical_spread;
}

bool TradingPair::hasValidPrices() const {
  std::shared_lock lock(state_mutex_);
  return market_.has_valid_prices;
}

std::optional<Quote> TradingPair::quoteFor(const std::string& symbol) const {
  std::shared_lock lock(state_mutex_);
  if (symbol == leg1_.symbol) {
    return market_.leg1_quote;
  }
  if (symbol == leg2_.symbol) {
    return market_.leg2_quote;
  }
  return std::nullopt;
}

void TradingPair::addLevelPair(const domain::GridLevelPair& level_pair) {
  std::unique_lock lock(state_mutex_);
  if (std::find(level_pairs_.begin(), level_pairs_.end(), level_pair) ==
      level_pairs_.end()) {
    level_pairs_.push_back(level_pair);
  }
}

void TradingPair::setLevelPairs(std::vector<domain::GridLevelPair> level_pairs) {
  std::unique_lock lock(state_mutex_);
  level_pairs_ = std::move(level_pairs);
}

std::vector<domain::GridLevelPair> TradingPair::levelPairs() const {
  std::shared_lock lock(state_mutex_);
  return level_pairs_;
}

GridPosition TradingPair::getOrCreatePosition(
    const domain::GridLevelPair& level_pair, std::int64_t now_ms) {
  return withPosition(level_pair, now_ms, [](GridPosition&) {});
}

std::optional<GridPosition> TradingPair::tryGetPosition(
    const std::string& natural_key) const {
  return positions_.find(natural_key);
}

bool TradingPair::removePosition(const std::string& natural_key) {
  return positions_.erase(natural_key);
}

bool TradingPair::removePositionIfFlat(const std::string& natural_key) {
  auto removed = positions_.eraseIf(
      [&](const std::string& key, const GridPosition& position) {
        return key == natural_key && !position.invested() &&
               !position.hasOpenOrders();
      });
  return !removed.empty();
}

void TradingPair::restorePosition(GridPosition position) {
  positions_.insertOrAssign(position.levelPair().entry().naturalKey(),
                            std::move(position));
}

std::vector<GridPosition> TradingPair::positions() const {
  return positions_.values();
}

std::size_t TradingPair::activePositionCount() const {
  std::size_t count = 0;
  for (const auto& position : positions_.values()) {
    if (position.invested()) {
      ++count;
    }
  }
  return count;
}

bool TradingPair::hasOpenExposure() const {
  for (const auto& position : positions_.values()) {
    if (position.invested() || position.hasOpenOrders()) {
      return true;
    }
  }
  return false;
}

}  // namespace arb
