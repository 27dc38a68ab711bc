// =============================================================================
// pipeline_integration_test.cpp
// =============================================================================
// Integration tests for the full evaluation pipeline inside ArbitrageEngine:
//   QuoteEvent -> TradingPair -> ArbitrageAlphaModel -> GridSignal
//     -> ArbitragePortfolioConstructionModel -> TargetSizer
//     -> ArbitrageExecutionModel -> PaperBrokerage (auto fill)
//     -> OrderStatusEvent bridged back -> GridPosition
//
// Validates:
//   - A spread crossing the entry level opens both legs in opposite
//     directions on the routed accounts
//   - Grid position, account holdings and telemetry agree
//   - A spread crossing the exit level flattens both legs and removes the
//     position
//   - Targets are cleared once fulfilled
//   - A pair removed while invested still exits, then leaves the registry
//   - Grid state is backed up and restored by a second engine
//
// Design:
//   Engines run with empty endpoints and a SimulationTimeProvider. Tests
//   subscribe to the evaluation loop bus before start() and poll engine
//   state with a deadline; no fixed sleeps.
// =============================================================================

#include "arb/engine/arbitrage_engine.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr std::int64_t kT0 = 1700000000000;

arb::LegSpec leg(const std::string& symbol, const std::string& market) {
  arb::LegSpec spec;
  spec.symbol = symbol;
  spec.market = market;
  spec.lot_size = 1.0;
  return spec;
}

arb::config::EngineConfig makeConfig() {
  arb::config::EngineConfig cfg;
  cfg.endpoints = {"", "", ""};

  arb::config::PairConfig pair;
  pair.leg1 = leg("AAA", "gate");
  pair.leg2 = leg("BBB", "nyse");
  pair.levels.emplace_back(-0.02, 0.01,
                           arb::domain::SpreadDirection::LongSpread, 0.5);
  cfg.pairs.push_back(pair);

  arb::config::AccountConfig gate;
  gate.name = "gate";
  arb::config::AccountConfig ibkr;
  ibkr.name = "ibkr";
  ibkr.paper.base_currency = "USD";
  cfg.accounts = {gate, ibkr};

  cfg.routing.kind = "market";
  cfg.routing.mapping = {{"gate", "gate"}, {"nyse", "ibkr"}};
  cfg.routing.default_account = "gate";
  return cfg;
}

// Polls pred until it holds or two seconds pass.
bool eventually(const std::function<bool()>& pred) {
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

std::map<std::string, double> holdingsBySymbol(arb::ArbitrageEngine& engine) {
  std::map<std::string, double> out;
  for (const auto& h : engine.brokerages().getAllHoldings()) {
    out[h.symbol] += h.quantity;
  }
  return out;
}

}  // namespace

// =============================================================================
// Test fixture: one engine, telemetry recorded from the loop bus.
// =============================================================================
class PipelineIntegrationTest : public ::testing::Test {
 protected:
  arb::SimulationTimeProvider clock{kT0};
  std::unique_ptr<arb::ArbitrageEngine> engine;

  std::mutex mutex;
  std::vector<arb::domain::GridSignal> signals;
  std::vector<arb::GridPositionUpdateEvent> updates;

  void startEngine(arb::config::EngineConfig cfg) {
    engine = std::make_unique<arb::ArbitrageEngine>(std::move(cfg), clock);
    engine->evaluationEventBus().subscribe<arb::GridSignalEvent>(
        [this](const arb::GridSignalEvent& e) {
          std::lock_guard lock(mutex);
          signals.push_back(e.signal);
        });
    engine->evaluationEventBus().subscribe<arb::GridPositionUpdateEvent>(
        [this](const arb::GridPositionUpdateEvent& e) {
          std::lock_guard lock(mutex);
          updates.push_back(e);
        });
    engine->start();
  }

  void TearDown() override {
    if (engine) {
      engine->stop();
    }
  }

  void quotes(double b1, double a1, double b2, double a2) {
    arb::QuoteEvent q1{"AAA", b1, a1, clock.now_ms(), 0};
    arb::QuoteEvent q2{"BBB", b2, a2, clock.now_ms(), 0};
    engine->pushEvent(q1);
    engine->pushEvent(q2);
  }

  std::vector<arb::GridPosition> positions() {
    return engine->pairManager()->pairs().front()->positions();
  }

  std::size_t signalCount() {
    std::lock_guard lock(mutex);
    return signals.size();
  }
};

// -----------------------------------------------------------------------------
// 1. Entry: buy AAA on gate, sell BBB on ibkr, position invested.
// Why: this is the core path; every component between the quote and the
//      fill must hand over the tag for the fill to land on the position.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, EntrySpreadOpensBothLegs) {
  startEngine(makeConfig());

  // long spread = (97.1 - 100) / 97.1 ~ -0.030, past the -0.02 entry.
  quotes(97.0, 97.1, 100.0, 100.1);

  ASSERT_TRUE(eventually([this] {
    auto p = positions();
    return p.size() == 1 && p[0].leg1Quantity() > 0.0 &&
           p[0].leg2Quantity() < 0.0 && engine->targets()->empty();
  }));

  auto position = positions().front();
  EXPECT_TRUE(position.invested());
  EXPECT_EQ(position.levelPair().direction(),
            arb::domain::SpreadDirection::LongSpread);

  auto held = holdingsBySymbol(*engine);
  EXPECT_DOUBLE_EQ(held["AAA"], position.leg1Quantity());
  EXPECT_DOUBLE_EQ(held["BBB"], position.leg2Quantity());
  EXPECT_EQ(engine->orderTracker()->size(), 0u);

  std::lock_guard lock(mutex);
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(signals[0].symbol, "AAA");
  EXPECT_EQ(signals[0].direction, arb::domain::SignalDirection::Up);
  ASSERT_FALSE(updates.empty());
  EXPECT_TRUE(updates.back().invested);
}

// -----------------------------------------------------------------------------
// 2. Exit: once the spread reaches the exit level, both legs are flattened
//    and the position is dropped.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, ExitSpreadFlattensPosition) {
  startEngine(makeConfig());

  quotes(97.0, 97.1, 100.0, 100.1);
  ASSERT_TRUE(eventually([this] {
    auto p = positions();
    return p.size() == 1 && p[0].invested() && engine->targets()->empty();
  }));

  clock.advance_by(1000);
  // long spread = (102.1 - 100) / 102.1 ~ +0.021, past the 0.01 exit.
  quotes(102.0, 102.1, 100.0, 100.1);

  ASSERT_TRUE(eventually([this] { return positions().empty(); }));

  auto held = holdingsBySymbol(*engine);
  EXPECT_DOUBLE_EQ(held["AAA"], 0.0);
  EXPECT_DOUBLE_EQ(held["BBB"], 0.0);

  std::lock_guard lock(mutex);
  EXPECT_EQ(signals.size(), 2u);
  EXPECT_EQ(signals.back().direction, arb::domain::SignalDirection::Flat);
  ASSERT_FALSE(updates.empty());
  EXPECT_TRUE(updates.back().removed);
}

// -----------------------------------------------------------------------------
// 3. A spread between the levels produces nothing.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, NeutralSpreadDoesNotTrade) {
  startEngine(makeConfig());

  quotes(99.9, 100.0, 99.95, 100.05);
  ASSERT_TRUE(eventually([this] { return engine->dispatchedCount() >= 2; }));

  EXPECT_EQ(signalCount(), 0u);
  EXPECT_TRUE(positions().empty());
  EXPECT_TRUE(engine->brokerages().getAllHoldings().empty());
}

// -----------------------------------------------------------------------------
// 4. Removing an invested pair blocks new entries but the exit still trades;
//    the pair is dropped once the exit fills land.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, RemovedPairExitsBeforeLeaving) {
  startEngine(makeConfig());

  quotes(97.0, 97.1, 100.0, 100.1);
  ASSERT_TRUE(eventually([this] {
    auto p = positions();
    return p.size() == 1 && p[0].invested() && engine->targets()->empty();
  }));

  auto manager = engine->pairManager();
  EXPECT_TRUE(manager->removePair("AAA", "BBB"));
  EXPECT_EQ(manager->size(), 1u);
  EXPECT_TRUE(manager->pairs().front()->isPendingRemoval());

  clock.advance_by(1000);
  quotes(102.0, 102.1, 100.0, 100.1);

  ASSERT_TRUE(eventually([manager] { return manager->size() == 0; }));
  auto held = holdingsBySymbol(*engine);
  EXPECT_DOUBLE_EQ(held["AAA"], 0.0);
  EXPECT_DOUBLE_EQ(held["BBB"], 0.0);

  std::lock_guard lock(mutex);
  ASSERT_EQ(signals.size(), 2u);
  EXPECT_EQ(signals.back().direction, arb::domain::SignalDirection::Flat);
}

// -----------------------------------------------------------------------------
// 5. Grid state written by one engine is restored by the next.
// Why: after a restart the engine must keep managing positions it opened,
//      including exiting them at their own exit level.
// -----------------------------------------------------------------------------
TEST_F(PipelineIntegrationTest, GridStateSurvivesRestart) {
  const auto dir =
      std::filesystem::temp_directory_path() /
      ("arb_pipeline_backup_" +
       std::to_string(
           std::chrono::steady_clock::now().time_since_epoch().count()));

  auto cfg = makeConfig();
  cfg.backup.enabled = true;
  cfg.backup.owner = "pipeline";
  cfg.backup.directory = dir.string();
  cfg.backup.tiers = {arb::TierSettings("min", 1000, 5)};

  startEngine(cfg);
  quotes(97.0, 97.1, 100.0, 100.1);
  ASSERT_TRUE(eventually([this] {
    auto p = positions();
    return p.size() == 1 && p[0].invested() && engine->targets()->empty();
  }));
  const double leg1 = positions().front().leg1Quantity();

  // The quote-driven backup ran before the fills; force one with the
  // filled state.
  clock.advance_by(1000);
  EXPECT_TRUE(engine->saveBackup());
  engine->stop();
  engine.reset();

  startEngine(cfg);
  auto restored = positions();
  ASSERT_EQ(restored.size(), 1u);
  EXPECT_DOUBLE_EQ(restored[0].leg1Quantity(), leg1);
  EXPECT_TRUE(restored[0].invested());

  engine->stop();
  engine.reset();
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
