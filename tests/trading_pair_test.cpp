// =============================================================================
// trading_pair_test.cpp
// =============================================================================
// Unit tests for arb::TradingPair and arb::GridPosition.
//
// Validates:
//   - Valid-price rules and the Unknown state
//   - Short / long / theoretical spread
//   - Market state classification (Crossed, LimitOpportunity, NoOpportunity)
//   - Level pair registration is idempotent
//   - GridPosition fills, invested threshold and exit rule
//   - Live ticket tracking and rebuild from open orders
// =============================================================================

#include "arb/pairs/grid_position.hpp"
#include "arb/pairs/trading_pair.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using arb::GridPosition;
using arb::LegSpec;
using arb::MarketState;
using arb::TradingPair;
using arb::domain::GridLevelPair;
using arb::domain::OrderStatus;
using arb::domain::SpreadDirection;

namespace {

LegSpec leg(const std::string& symbol, double lot = 0.01) {
  LegSpec spec;
  spec.symbol = symbol;
  spec.market = "test";
  spec.lot_size = lot;
  return spec;
}

}  // namespace

class TradingPairTest : public ::testing::Test {
 protected:
  TradingPair pair{leg("AAA"), leg("BBB"), "crypto_stock"};

  void quote(double b1, double a1, double b2, double a2) {
    pair.updateQuote("AAA", b1, a1, 1000);
    pair.updateQuote("BBB", b2, a2, 1000);
  }
};

// -----------------------------------------------------------------------------
// 1. Construction: key is "leg1-leg2"; bad legs throw.
// -----------------------------------------------------------------------------
TEST_F(TradingPairTest, KeyAndValidation) {
  EXPECT_EQ(pair.key(), "AAA-BBB");
  EXPECT_EQ(pair.pairType(), "crypto_stock");
  EXPECT_THROW(TradingPair(leg(""), leg("B")), std::invalid_argument);
  EXPECT_THROW(TradingPair(leg("A"), leg("A")), std::invalid_argument);
  EXPECT_THROW(TradingPair(leg("A", 0.0), leg("B")), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. Until both legs have a sane book the pair is Unknown with no spread.
// -----------------------------------------------------------------------------
TEST_F(TradingPairTest, UnknownWithoutValidPrices) {
  EXPECT_FALSE(pair.hasValidPrices());
  EXPECT_EQ(pair.marketState(), MarketState::Unknown);

  pair.updateQuote("AAA", 100.0, 101.0, 1000);
  EXPECT_FALSE(pair.hasValidPrices());

  // Crossed book on one leg (bid > ask) is not a valid price.
  quote(100.0, 101.0, 99.5, 99.0);
  EXPECT_FALSE(pair.hasValidPrices());
  auto snapshot = pair.marketSnapshot();
  EXPECT_EQ(snapshot.market_state, MarketState::Unknown);
  EXPECT_FALSE(snapshot.direction.has_value());
  EXPECT_FALSE(snapshot.executable_spread.has_value());
  EXPECT_DOUBLE_EQ(snapshot.theoretical_spread, 0.0);
}

TEST_F(TradingPairTest, UnrelatedSymbolIsIgnored) {
  EXPECT_FALSE(pair.updateQuote("CCC", 1.0, 2.0, 1000));
  EXPECT_FALSE(pair.quoteFor("CCC").has_value());
}

// -----------------------------------------------------------------------------
// 3. Crossed: leg1 bid above leg2 ask.
//    short = (100-99)/100 = 0.01, long = (101-98)/101; theoretical = larger
//    magnitude; executable = short.
// -----------------------------------------------------------------------------
TEST_F(TradingPairTest, CrossedShortSpread) {
  quote(100.0, 101.0, 98.0, 99.0);

  auto s = pair.marketSnapshot();
  EXPECT_TRUE(s.has_valid_prices);
  EXPECT_EQ(s.market_state, MarketState::Crossed);
  ASSERT_TRUE(s.direction.has_value());
  EXPECT_EQ(*s.direction, SpreadDirection::ShortSpread);
  EXPECT_NEAR(s.short_spread, 0.01, 1e-12);
  EXPECT_NEAR(s.long_spread, 3.0 / 101.0, 1e-12);
  EXPECT_NEAR(s.theoretical_spread, 3.0 / 101.0, 1e-12);
  ASSERT_TRUE(s.executable_spread.has_value());
  EXPECT_NEAR(*s.executable_spread, 0.01, 1e-12);
}

TEST_F(TradingPairTest, CrossedLongSpread) {
  quote(98.0, 99.0, 100.0, 101.0);

  auto s = pair.marketSnapshot();
  EXPECT_EQ(s.market_state, MarketState::Crossed);
  EXPECT_EQ(*s.direction, SpreadDirection::LongSpread);
  EXPECT_NEAR(*s.executable_spread, (99.0 - 100.0) / 99.0, 1e-12);
  EXPECT_LT(s.theoretical_spread, 0.0);
}

// -----------------------------------------------------------------------------
// 4. Overlapping books: a1 > a2 > b1 > b2 is a short-side limit opportunity.
// -----------------------------------------------------------------------------
TEST_F(TradingPairTest, LimitOpportunity) {
  quote(100.0, 102.0, 99.0, 101.0);

  auto s = pair.marketSnapshot();
  EXPECT_EQ(s.market_state, MarketState::LimitOpportunity);
  EXPECT_EQ(*s.direction, SpreadDirection::ShortSpread);
  EXPECT_NEAR(*s.executable_spread, 0.01, 1e-12);  // max(1/102, 1/100)
}

TEST_F(TradingPairTest, NoOpportunity) {
  quote(100.0, 101.0, 100.0, 101.0);

  auto s = pair.marketSnapshot();
  EXPECT_EQ(s.market_state, MarketState::NoOpportunity);
  EXPECT_FALSE(s.direction.has_value());
  EXPECT_FALSE(s.executable_spread.has_value());
}

TEST_F(TradingPairTest, AddLevelPairIgnoresDuplicates) {
  GridLevelPair level(-0.02, 0.01, SpreadDirection::LongSpread, 0.5);
  pair.addLevelPair(level);
  pair.addLevelPair(level);
  EXPECT_EQ(pair.levelPairs().size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Positions are keyed by the entry level's natural key.
// -----------------------------------------------------------------------------
TEST_F(TradingPairTest, PositionsKeyedByEntryLevel) {
  GridLevelPair level(-0.02, 0.01, SpreadDirection::LongSpread, 0.5);
  pair.getOrCreatePosition(level, 1000);
  pair.getOrCreatePosition(level, 2000);

  EXPECT_EQ(pair.positions().size(), 1u);
  auto position = pair.tryGetPosition(level.entry().naturalKey());
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->openTimeMs(), 1000);
  EXPECT_EQ(pair.activePositionCount(), 0u);

  EXPECT_TRUE(pair.removePositionIfFlat(level.entry().naturalKey()));
  EXPECT_TRUE(pair.positions().empty());
}

// =============================================================================
// GridPosition
// =============================================================================

class GridPositionTest : public ::testing::Test {
 protected:
  GridLevelPair long_level{-0.02, 0.01, SpreadDirection::LongSpread, 0.5};
  GridLevelPair short_level{0.03, -0.005, SpreadDirection::ShortSpread, 0.5};
};

// -----------------------------------------------------------------------------
// 6. Fills accumulate with a weighted average cost; other symbols are
//    rejected.
// -----------------------------------------------------------------------------
TEST_F(GridPositionTest, FillsAverageCost) {
  GridPosition p("AAA", "BBB", long_level, 0.01, 0.01, 0);

  EXPECT_TRUE(p.processFill("AAA", 1.0, 100.0, 10));
  EXPECT_TRUE(p.processFill("AAA", 1.0, 110.0, 20));
  EXPECT_TRUE(p.processFill("BBB", -2.0, 105.0, 30));
  EXPECT_FALSE(p.processFill("CCC", 1.0, 1.0, 40));

  EXPECT_DOUBLE_EQ(p.leg1Quantity(), 2.0);
  EXPECT_DOUBLE_EQ(p.leg1AverageCost(), 105.0);
  EXPECT_DOUBLE_EQ(p.leg2Quantity(), -2.0);
  EXPECT_DOUBLE_EQ(p.leg2AverageCost(), 105.0);
  ASSERT_TRUE(p.firstFillTimeMs().has_value());
  EXPECT_EQ(*p.firstFillTimeMs(), 10);
}

// -----------------------------------------------------------------------------
// 7. Invested means at least one lot on either leg.
// -----------------------------------------------------------------------------
TEST_F(GridPositionTest, InvestedNeedsOneLot) {
  GridPosition p("AAA", "BBB", long_level, 0.1, 1.0, 0);
  EXPECT_FALSE(p.invested());

  p.processFill("AAA", 0.05, 100.0, 1);
  EXPECT_FALSE(p.invested());

  p.processFill("AAA", 0.05, 100.0, 2);
  EXPECT_TRUE(p.invested());

  p.processFill("AAA", -0.1, 100.0, 3);
  EXPECT_FALSE(p.invested());
  EXPECT_DOUBLE_EQ(p.leg1AverageCost(), 0.0);
}

// -----------------------------------------------------------------------------
// 8. Exit follows the entry direction: a long spread exits once the spread
//    has risen to the exit threshold, a short spread once it has fallen to
//    it. Flat positions never exit.
// -----------------------------------------------------------------------------
TEST_F(GridPositionTest, ExitRule) {
  GridPosition flat("AAA", "BBB", long_level, 0.01, 0.01, 0);
  EXPECT_FALSE(flat.shouldExit(0.5));

  GridPosition longp("AAA", "BBB", long_level, 0.01, 0.01, 0);
  longp.processFill("AAA", 1.0, 100.0, 1);
  EXPECT_FALSE(longp.shouldExit(-0.03));
  EXPECT_FALSE(longp.shouldExit(0.0));
  EXPECT_TRUE(longp.shouldExit(0.01));
  EXPECT_TRUE(longp.shouldExit(0.02));

  GridPosition shortp("AAA", "BBB", short_level, 0.01, 0.01, 0);
  shortp.processFill("AAA", -1.0, 100.0, 1);
  EXPECT_FALSE(shortp.shouldExit(0.04));
  EXPECT_FALSE(shortp.shouldExit(0.0));
  EXPECT_TRUE(shortp.shouldExit(-0.005));
  EXPECT_TRUE(shortp.shouldExit(-0.01));
}

// -----------------------------------------------------------------------------
// 9. Tickets: open statuses add, terminal statuses remove; every broker id
//    is remembered so tickets can be rebuilt after a restart.
// -----------------------------------------------------------------------------
TEST_F(GridPositionTest, TicketsTrackOpenOrders) {
  GridPosition p("AAA", "BBB", long_level, 0.01, 0.01, 0);

  p.onOrderStatus("b-1", OrderStatus::Submitted);
  p.onOrderStatus("b-2", OrderStatus::Submitted);
  EXPECT_TRUE(p.hasOpenOrders());
  EXPECT_EQ(p.liveTickets().size(), 2u);

  p.onOrderStatus("b-1", OrderStatus::Filled);
  EXPECT_EQ(p.liveTickets().size(), 1u);
  EXPECT_EQ(p.brokerOrderIds().size(), 2u);

  arb::domain::Order open;
  open.broker_order_id = "b-1";
  open.status = OrderStatus::Submitted;
  arb::domain::Order unknown;
  unknown.broker_order_id = "b-9";
  unknown.status = OrderStatus::Submitted;

  p.rebuildTickets({open, unknown});
  ASSERT_EQ(p.liveTickets().size(), 1u);
  EXPECT_EQ(p.liveTickets().front(), "b-1");
}
