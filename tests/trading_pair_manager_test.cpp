// =============================================================================
// trading_pair_manager_test.cpp
// =============================================================================
// Unit tests for arb::TradingPairManager.
//
// Validates:
//   - Registry: idempotent addPair, removePair notifies then erases
//   - Removal is deferred while positions are invested or orders working;
//     the closing fill completes it, re-adding cancels it
//   - Fill processing by grid tag, duplicate execution ids, flat removal
//   - gridQuantities() view used by the target ledger
//   - Baseline initialization and comparison
//   - Reconciliation replays only executions that were missed
//   - Grid state survives a JSON round trip through the serializer
// =============================================================================

#include "arb/pairs/grid_state_serializer.hpp"
#include "arb/pairs/trading_pair_manager.hpp"
#include "arb/tag/grid_tag.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <vector>

using arb::LegSpec;
using arb::OrderStatusEvent;
using arb::TradingPairChanges;
using arb::TradingPairManager;
using arb::domain::GridLevelPair;
using arb::domain::OrderStatus;
using arb::domain::SpreadDirection;

namespace {

LegSpec leg(const std::string& symbol, const std::string& market) {
  LegSpec spec;
  spec.symbol = symbol;
  spec.market = market;
  spec.lot_size = 0.01;
  return spec;
}

// Execution history served from a fixed list, filtered by time window.
class FakeHistory : public arb::IExecutionHistoryProvider {
 public:
  std::vector<arb::domain::ExecutionRecord> records;
  int calls{0};

  std::vector<arb::domain::ExecutionRecord> getExecutionHistory(
      std::int64_t start_ms, std::int64_t end_ms) override {
    ++calls;
    std::vector<arb::domain::ExecutionRecord> out;
    for (const auto& r : records) {
      if (r.time_ms >= start_ms && r.time_ms <= end_ms) {
        out.push_back(r);
      }
    }
    return out;
  }
};

}  // namespace

class TradingPairManagerTest : public ::testing::Test {
 protected:
  arb::SimulationTimeProvider clock{10 * 60 * 1000};
  TradingPairManager manager{clock};
  GridLevelPair level{-0.02, 0.01, SpreadDirection::LongSpread, 0.5};
  std::string tag;

  void SetUp() override {
    auto pair = manager.addPair(leg("AAA", "gate"), leg("BBB", "nyse"));
    pair->addLevelPair(level);
    tag = arb::encodeGridTag("AAA", "BBB", level);
  }

  OrderStatusEvent fill(const std::string& symbol, const std::string& market,
                        double qty, const std::string& exec_id,
                        std::int64_t time_ms,
                        OrderStatus status = OrderStatus::Filled) {
    OrderStatusEvent e;
    e.account = market;
    e.broker_order_id = "b-" + exec_id;
    e.symbol = symbol;
    e.market = market;
    e.status = status;
    e.fill_quantity = qty;
    e.fill_price = 100.0;
    e.execution_id = exec_id;
    e.tag = tag;
    e.timestamp_ms = time_ms;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. addPair is idempotent and notifies listeners once.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, AddPairIsIdempotent) {
  int added = 0;
  manager.addChangeListener(
      [&](const TradingPairChanges& c) { added += c.added.size(); });

  auto first = manager.addPair(leg("X", "m"), leg("Y", "m"));
  auto second = manager.addPair(leg("X", "m"), leg("Y", "m"));

  EXPECT_EQ(first, second);
  EXPECT_EQ(added, 1);
  EXPECT_EQ(manager.size(), 2u);
  EXPECT_EQ(manager.find("X", "Y"), first);
  EXPECT_EQ(manager.find("Y", "X"), nullptr);
}

// -----------------------------------------------------------------------------
// 2. removePair of a flat pair marks it pending, notifies, then erases it.
//    Why: listeners cancel signals while the pair is still reachable.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, RemovePairNotifiesBeforeErase) {
  bool seen_pending = false;
  bool still_registered = false;
  manager.addChangeListener([&](const TradingPairChanges& c) {
    for (const auto& pair : c.removed) {
      seen_pending = pair->isPendingRemoval();
      still_registered = manager.find("AAA", "BBB") != nullptr;
    }
  });

  EXPECT_TRUE(manager.removePair("AAA", "BBB"));
  EXPECT_TRUE(seen_pending);
  EXPECT_TRUE(still_registered);
  EXPECT_EQ(manager.find("AAA", "BBB"), nullptr);
  EXPECT_FALSE(manager.removePair("AAA", "BBB"));
}

// -----------------------------------------------------------------------------
// 3. An invested pair stays registered until its exit fills flatten it.
// Why: dropping it at once would strand the position: exits would never be
//      signalled and their fills would find no pair to land on.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, RemovePairWaitsForInvestedPosition) {
  int removed = 0;
  manager.addChangeListener(
      [&](const TradingPairChanges& c) { removed += c.removed.size(); });

  manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1", 1000));
  manager.processGridOrderEvent(fill("BBB", "nyse", -1.0, "x2", 1000));
  auto pair = manager.find("AAA", "BBB");
  ASSERT_EQ(pair->activePositionCount(), 1u);

  EXPECT_TRUE(manager.removePair("AAA", "BBB"));
  EXPECT_EQ(manager.size(), 1u);
  EXPECT_EQ(manager.find("AAA", "BBB"), pair);
  EXPECT_TRUE(pair->isPendingRemoval());
  EXPECT_EQ(removed, 0);

  // Removing again is accepted and changes nothing.
  EXPECT_TRUE(manager.removePair("AAA", "BBB"));
  EXPECT_EQ(manager.size(), 1u);

  // First exit leg: still invested on BBB.
  auto first = manager.processGridOrderEvent(fill("AAA", "gate", -1.0, "x3",
                                                  2000));
  ASSERT_TRUE(first.has_value());
  EXPECT_DOUBLE_EQ(first->leg1_quantity, 0.0);
  EXPECT_FALSE(first->removed);
  EXPECT_EQ(manager.size(), 1u);
  EXPECT_EQ(removed, 0);

  // Second exit leg closes the last position and completes the removal.
  auto last = manager.processGridOrderEvent(fill("BBB", "nyse", 1.0, "x4",
                                                 2000));
  ASSERT_TRUE(last.has_value());
  EXPECT_TRUE(last->removed);
  EXPECT_EQ(manager.size(), 0u);
  EXPECT_EQ(manager.find("AAA", "BBB"), nullptr);
  EXPECT_EQ(removed, 1);
  EXPECT_DOUBLE_EQ(manager.aggregateGridPositions()["AAA"], 0.0);
  EXPECT_DOUBLE_EQ(manager.aggregateGridPositions()["BBB"], 0.0);
}

TEST_F(TradingPairManagerTest, RemovePairWaitsForWorkingOrder) {
  manager.processGridOrderEvent(
      fill("AAA", "gate", 0.0, "o1", 1000, OrderStatus::Submitted));

  EXPECT_TRUE(manager.removePair("AAA", "BBB"));
  EXPECT_EQ(manager.size(), 1u);

  manager.processGridOrderEvent(
      fill("AAA", "gate", 0.0, "o1", 1500, OrderStatus::Canceled));
  EXPECT_EQ(manager.size(), 0u);
}

TEST_F(TradingPairManagerTest, ReAddingCancelsPendingRemoval) {
  int added = 0;
  manager.addChangeListener(
      [&](const TradingPairChanges& c) { added += c.added.size(); });

  manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1", 1000));
  auto pair = manager.find("AAA", "BBB");
  manager.removePair("AAA", "BBB");
  ASSERT_TRUE(pair->isPendingRemoval());

  auto again = manager.addPair(leg("AAA", "gate"), leg("BBB", "nyse"));
  EXPECT_EQ(again, pair);
  EXPECT_FALSE(pair->isPendingRemoval());
  EXPECT_EQ(pair->activePositionCount(), 1u);
  EXPECT_EQ(added, 0);

  // Flattening now only drops the position, not the pair.
  auto update = manager.processGridOrderEvent(fill("AAA", "gate", -1.0, "x2",
                                                   2000));
  ASSERT_TRUE(update.has_value());
  EXPECT_TRUE(update->removed);
  EXPECT_EQ(manager.find("AAA", "BBB"), pair);
}

// -----------------------------------------------------------------------------
// 4. A tagged fill lands in the grid position and produces an update.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, TaggedFillUpdatesPosition) {
  auto update = manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1",
                                                   1000));
  ASSERT_TRUE(update.has_value());
  EXPECT_EQ(update->pair_key, "AAA-BBB");
  EXPECT_EQ(update->tag, tag);
  EXPECT_DOUBLE_EQ(update->leg1_quantity, 1.0);
  EXPECT_TRUE(update->invested);
  EXPECT_FALSE(update->removed);

  auto q = manager.gridQuantities(tag);
  ASSERT_TRUE(q.has_value());
  EXPECT_DOUBLE_EQ(q->leg1, 1.0);
  EXPECT_DOUBLE_EQ(q->leg2, 0.0);
  EXPECT_EQ(manager.lastFillTimes().at("gate"), 1000);
}

TEST_F(TradingPairManagerTest, DuplicateExecutionIsIgnored) {
  manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1", 1000));
  EXPECT_FALSE(manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1",
                                                  1000))
                   .has_value());
  EXPECT_DOUBLE_EQ(manager.gridQuantities(tag)->leg1, 1.0);
  EXPECT_EQ(manager.processedExecutionCount(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Untagged or foreign-tagged events are not grid events.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, NonGridEventsIgnored) {
  auto untagged = fill("AAA", "gate", 1.0, "x1", 1000);
  untagged.tag.clear();
  EXPECT_FALSE(manager.processGridOrderEvent(untagged).has_value());

  auto foreign = fill("AAA", "gate", 1.0, "x2", 1000);
  foreign.tag = arb::encodeGridTag("CCC", "DDD", level);
  EXPECT_FALSE(manager.processGridOrderEvent(foreign).has_value());

  EXPECT_FALSE(manager.gridQuantities("garbage").has_value());
  EXPECT_FALSE(manager.gridQuantities(foreign.tag).has_value());
}

// -----------------------------------------------------------------------------
// 6. A Filled event that leaves the position flat removes it.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, FlatPositionRemovedOnFill) {
  manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1", 1000));
  auto update =
      manager.processGridOrderEvent(fill("AAA", "gate", -1.0, "x2", 2000));

  ASSERT_TRUE(update.has_value());
  EXPECT_TRUE(update->removed);
  EXPECT_TRUE(manager.find("AAA", "BBB")->positions().empty());

  // A missing position reads as zero, not as unknown.
  auto q = manager.gridQuantities(tag);
  ASSERT_TRUE(q.has_value());
  EXPECT_DOUBLE_EQ(q->leg1, 0.0);
}

TEST_F(TradingPairManagerTest, PartialFillKeepsPosition) {
  auto update = manager.processGridOrderEvent(
      fill("AAA", "gate", 0.5, "x1", 1000, OrderStatus::PartiallyFilled));
  ASSERT_TRUE(update.has_value());
  EXPECT_DOUBLE_EQ(update->leg1_quantity, 0.5);
  EXPECT_EQ(manager.find("AAA", "BBB")->positions().size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. Baseline = holdings - grid. Unchanged baseline prunes processed
//    executions older than the market's last fill; a change reconciles.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, BaselineComparison) {
  std::vector<arb::domain::Holding> holdings{{"AAA", 5.0, 100.0, "gate"}};
  manager.initializeBaseline(holdings);
  EXPECT_DOUBLE_EQ(manager.baseline().at("AAA"), 5.0);

  FakeHistory history;
  EXPECT_FALSE(manager.compareBaseline(holdings, &history));
  EXPECT_EQ(history.calls, 0);

  holdings[0].quantity = 6.0;
  EXPECT_TRUE(manager.compareBaseline(holdings, &history));
  EXPECT_EQ(history.calls, 1);
}

TEST_F(TradingPairManagerTest, BaselineSkippedAfterFills) {
  manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1", 1000));
  manager.initializeBaseline({{"AAA", 7.0, 100.0, "gate"}});
  EXPECT_TRUE(manager.baseline().empty());
}

// -----------------------------------------------------------------------------
// 8. Reconcile replays only executions that are new and not older than the
//    market's last fill, in time order.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, ReconcileReplaysMissedExecutions) {
  manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1", 5 * 60 * 1000));

  FakeHistory history;
  auto record = [&](const std::string& id, const std::string& symbol,
                    const std::string& market, double qty, std::int64_t t) {
    arb::domain::ExecutionRecord r;
    r.execution_id = id;
    r.symbol = symbol;
    r.market = market;
    r.quantity = qty;
    r.price = 100.0;
    r.time_ms = t;
    r.tag = tag;
    r.broker_order_id = "b-" + id;
    return r;
  };
  history.records = {
      record("x1", "AAA", "gate", 1.0, 5 * 60 * 1000),   // already processed
      record("x0", "AAA", "gate", 1.0, 4 * 60 * 1000),   // before last fill
      record("x3", "BBB", "nyse", -1.0, 7 * 60 * 1000),  // new market
      record("x2", "AAA", "gate", 0.5, 6 * 60 * 1000),   // missed
  };

  EXPECT_EQ(manager.reconcile(&history), 2u);

  auto q = manager.gridQuantities(tag);
  ASSERT_TRUE(q.has_value());
  EXPECT_DOUBLE_EQ(q->leg1, 1.5);
  EXPECT_DOUBLE_EQ(q->leg2, -1.0);

  // Second pass finds nothing new.
  EXPECT_EQ(manager.reconcile(&history), 0u);
}

TEST_F(TradingPairManagerTest, ReconcileWithoutProviderIsNoop) {
  EXPECT_EQ(manager.reconcile(nullptr), 0u);
}

// -----------------------------------------------------------------------------
// 9. Grid state (levels, positions, durable order ids, last fill times)
//    restores into a fresh manager.
// -----------------------------------------------------------------------------
TEST_F(TradingPairManagerTest, GridStateRoundTrip) {
  manager.processGridOrderEvent(fill("AAA", "gate", 1.0, "x1", 1000));
  manager.processGridOrderEvent(fill("BBB", "nyse", -1.0, "x2", 1500));
  auto doc = arb::gridStateToJson(manager, 2000);

  TradingPairManager restored(clock);
  ASSERT_TRUE(arb::restoreGridState(restored, doc));

  auto pair = restored.find("AAA", "BBB");
  ASSERT_NE(pair, nullptr);
  ASSERT_EQ(pair->levelPairs().size(), 1u);
  EXPECT_EQ(pair->levelPairs().front(), level);

  auto q = restored.gridQuantities(tag);
  ASSERT_TRUE(q.has_value());
  EXPECT_DOUBLE_EQ(q->leg1, 1.0);
  EXPECT_DOUBLE_EQ(q->leg2, -1.0);

  auto position = pair->tryGetPosition(level.entry().naturalKey());
  ASSERT_TRUE(position.has_value());
  EXPECT_EQ(position->brokerOrderIds().count("b-x1"), 1u);
  EXPECT_EQ(restored.lastFillTimes().at("nyse"), 1500);
}

TEST_F(TradingPairManagerTest, RestoreRejectsGarbage) {
  TradingPairManager restored(clock);
  EXPECT_FALSE(arb::restoreGridState(restored, nlohmann::json::array()));
  EXPECT_FALSE(arb::restoreGridState(restored, nlohmann::json{{"pairs", 3}}));
}
