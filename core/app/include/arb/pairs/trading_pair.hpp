#pragma once

#include "arb/concurrent/concurrent_map.hpp"
#include "arb/domain/grid_level.hpp"
#include "arb/domain/order.hpp"
#include "arb/pairs/grid_position.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace arb {

// Static description of one leg.
struct LegSpec {
  std::string symbol;
  std::string market;
  domain::SecurityType security_type{domain::SecurityType::Crypto};
  double lot_size{0.01};
};

struct Quote {
  double bid{0.0};
  double ask{0.0};

  double mid() const { return (bid + ask) / 2.0; }
};

// -----------------------------------------------------------------------------
// MarketState
// -----------------------------------------------------------------------------
//   Unknown           prices missing or inconsistent (bid > ask, <= 0)
//   Crossed           one leg's bid is above the other leg's ask: a spread
//                     that can be taken with two market orders
//   LimitOpportunity  books overlap so that resting limit orders on both
//                     legs could capture a spread
//   NoOpportunity     everything else
// -----------------------------------------------------------------------------
enum class MarketState {
  Unknown,
  Crossed,
  LimitOpportunity,
  NoOpportunity,
};

const char* toString(MarketState state);

// Point-in-time copy of a pair's market-derived state.
struct PairMarketSnapshot {
  Quote leg1_quote;
  Quote leg2_quote;
  bool has_valid_prices{false};
  MarketState market_state{MarketState::Unknown};
  std::optional<domain::SpreadDirection> direction;
  double short_spread{0.0};
  double long_spread{0.0};
  double theoretical_spread{0.0};
  std::optional<double> executable_spread;
  std::int64_t updated_ms{0};
};

// -----------------------------------------------------------------------------
// TradingPair
// -----------------------------------------------------------------------------
//
// @brief  Two legs, their latest quotes, the spread derived from them, the
//         configured grid levels and the live grid positions.
//
// @details
// Spread definitions (fractions of the leg1 price):
//
//     short_spread = (leg1.bid - leg2.ask) / leg1.bid
//     long_spread  = (leg1.ask - leg2.bid) / leg1.ask
//
// theoretical_spread is whichever has the larger magnitude (short on a tie)
// and is the value grid levels are compared against. executable_spread is
// and direction are only set when the market state is Crossed or
// LimitOpportunity.
//
// Grid state is owned by composition:
//   level pairs   configuration, replaced wholesale or appended
//   positions     ConcurrentMap keyed by entry natural key; each position
//                 is a value inside the map, reached only through the
//                 accessors below
//
// Lifecycle: created once per (leg1, leg2) by TradingPairManager, which
// hands out shared_ptrs. markPendingRemoval() stops new entries; the
// manager drops the pair once hasOpenExposure() is false, and re-adding the
// legs before then clears the flag.
//
// Thread model:
//   Market state and level pairs sit behind a shared_mutex: updates come
//   from the evaluation loop, reads from anywhere (IPC status, backups).
//   Positions are mutated by fill processing and read by the alpha and
//   execution models; the ConcurrentMap serializes each access.
// -----------------------------------------------------------------------------
class TradingPair {
 public:
  static constexpr double kPriceEpsilon = 1e-10;

  // @throws std::invalid_argument for empty or identical symbols, or a
  //         non-positive lot size.
  TradingPair(LegSpec leg1, LegSpec leg2, std::string pair_type = "spread");

  TradingPair(const TradingPair&) = delete;
  TradingPair& operator=(const TradingPair&) = delete;

  // "leg1-leg2"
  const std::string& key() const { return key_; }
  const LegSpec& leg1() const { return leg1_; }
  const LegSpec& leg2() const { return leg2_; }
  const std::string& pairType() const { return pair_type_; }

  // -------------------------------------------------------------------------
  // Market data
  // -------------------------------------------------------------------------

  // Stores the quote for whichever leg trades symbol and recomputes. Returns
  // false if symbol is not a leg of this pair.
  bool updateQuote(const std::string& symbol, double bid, double ask,
                   std::int64_t time_ms);

  void updateQuotes(const Quote& leg1, const Quote& leg2, std::int64_t time_ms);

  PairMarketSnapshot marketSnapshot() const;

  MarketState marketState() const;
  double theoreticalSpread() const;
  bool hasValidPrices() const;

  // Latest quote for a leg symbol, if this pair trades it.
  std::optional<Quote> quoteFor(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // Grid configuration
  // -------------------------------------------------------------------------

  // Appends unless an equal pair is already configured.
  void addLevelPair(const domain::GridLevelPair& level_pair);
  void setLevelPairs(std::vector<domain::GridLevelPair> level_pairs);
  std::vector<domain::GridLevelPair> levelPairs() const;

  // -------------------------------------------------------------------------
  // Grid positions
  // -------------------------------------------------------------------------

  // Creates the position for level_pair if absent, applies fn to it under
  // the map lock, and returns a copy of the result.
  template <typename Fn>
  GridPosition withPosition(const domain::GridLevelPair& level_pair,
                            std::int64_t now_ms, Fn&& fn) {
    return positions_.getOrCreate(
        level_pair.entry().naturalKey(),
        [&] {
          return GridPosition(leg1_.symbol, leg2_.symbol, level_pair,
                              leg1_.lot_size, leg2_.lot_size, now_ms);
        },
        std::forward<Fn>(fn));
  }

  GridPosition getOrCreatePosition(const domain::GridLevelPair& level_pair,
                                   std::int64_t now_ms);

  std::optional<GridPosition> tryGetPosition(
      const std::string& natural_key) const;

  template <typename Fn>
  bool updatePosition(const std::string& natural_key, Fn&& fn) {
    return positions_.update(natural_key, std::forward<Fn>(fn));
  }

  bool removePosition(const std::string& natural_key);

  // Removes the position only if it is flat and has no live tickets, in one
  // critical section. Returns true if it was removed.
  bool removePositionIfFlat(const std::string& natural_key);

  void restorePosition(GridPosition position);

  std::vector<GridPosition> positions() const;
  std::size_t activePositionCount() const;

  // True while any position is invested or still has working orders.
  bool hasOpenExposure() const;

  // -------------------------------------------------------------------------
  // Removal
  // -------------------------------------------------------------------------
  void markPendingRemoval() { pending_removal_.store(true); }
  void clearPendingRemoval() { pending_removal_.store(false); }
  bool isPendingRemoval() const { return pending_removal_.load(); }

 private:
  void recompute(std::int64_t time_ms);

  LegSpec leg1_;
  LegSpec leg2_;
  std::string pair_type_;
  std::string key_;

  mutable std::shared_mutex state_mutex_;  // market_ and level_pairs_
  PairMarketSnapshot market_;
  std::vector<domain::GridLevelPair> level_pairs_;

  ConcurrentMap<std::string, GridPosition> positions_;
  std::atomic<bool> pending_removal_{false};
};

}  // namespace arb
