// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for arb::config::parseConfig / loadConfig and the component
// factories.
//
// Validates:
//   - A full document parses into EngineConfig with every section
//   - Defaults for optional sections
//   - Errors name the offending key
//   - Routing accounts must exist; default account falls back to the first
//   - makeRouter() per kind, makeBrokerage() per type
//   - loadConfig() distinguishes unreadable files from malformed JSON
// =============================================================================

#include "arb/config/config_loader.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using arb::config::EngineConfig;
using arb::config::parseConfig;
using nlohmann::json;

namespace {

json minimalDoc() {
  return json::parse(R"({
    "pairs": [
      { "leg1": { "symbol": "BTCUSDT", "market": "gate" },
        "leg2": { "symbol": "BTC-PERP", "market": "binance",
                  "security_type": "crypto_future" } }
    ],
    "accounts": [ { "name": "gate" }, { "name": "binance" } ]
  })");
}

// Runs parseConfig and returns the exception text, or "" if it parsed.
std::string parseError(const json& doc) {
  try {
    parseConfig(doc);
  } catch (const std::invalid_argument& e) {
    return e.what();
  }
  return "";
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Minimal document: defaults everywhere else.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MinimalDocumentDefaults) {
  EngineConfig cfg = parseConfig(minimalDoc());

  EXPECT_DOUBLE_EQ(cfg.portfolio_value, 100000.0);
  EXPECT_FALSE(cfg.replay_clock);
  ASSERT_EQ(cfg.pairs.size(), 1u);
  EXPECT_EQ(cfg.pairs[0].leg1.symbol, "BTCUSDT");
  EXPECT_EQ(cfg.pairs[0].leg2.security_type,
            arb::domain::SecurityType::CryptoFuture);
  EXPECT_EQ(cfg.pairs[0].pair_type, "spread");
  EXPECT_TRUE(cfg.pairs[0].levels.empty());
  ASSERT_EQ(cfg.accounts.size(), 2u);
  EXPECT_EQ(cfg.accounts[0].type, "paper");
  EXPECT_EQ(cfg.routing.kind, "market");
  EXPECT_EQ(cfg.routing.default_account, "gate");
  EXPECT_FALSE(cfg.backup.enabled);
  EXPECT_EQ(cfg.backup.tiers.size(), 3u);
  EXPECT_EQ(cfg.endpoints.market_data, "tcp://127.0.0.1:5555");
}

// -----------------------------------------------------------------------------
// 2. Every section populated.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, FullDocument) {
  json doc = minimalDoc();
  doc["portfolio_value"] = 50000;
  doc["replay_clock"] = true;
  doc["alpha"] = {{"signal_period_ms", 1000},
                  {"confidence", 0.5},
                  {"grid_templates",
                   {{"spot_future",
                     {{{"entry", -0.01},
                       {"exit", 0.002},
                       {"direction", "LONG_SPREAD"},
                       {"size", 0.2}}}}}}};
  doc["pairs"][0]["pair_type"] = "spot_future";
  doc["pairs"][0]["levels"] = {{{"entry", 0.03},
                                {"exit", -0.005},
                                {"direction", "SHORT_SPREAD"},
                                {"size", 0.5}}};
  doc["accounts"][0]["initial_cash"] = 2500.0;
  doc["accounts"][0]["auto_fill"] = false;
  doc["routing"] = {{"kind", "symbol"},
                    {"mapping", {{"BTC-PERP", "binance"}}},
                    {"default_account", "gate"}};
  doc["backup"] = {{"enabled", true},
                   {"owner", "unit"},
                   {"tiers",
                    {{{"name", "fast"}, {"interval_ms", 1000},
                      {"max_count", 2}}}}};
  doc["endpoints"] = {{"command", ""}};

  EngineConfig cfg = parseConfig(doc);
  EXPECT_DOUBLE_EQ(cfg.portfolio_value, 50000.0);
  EXPECT_TRUE(cfg.replay_clock);
  EXPECT_EQ(cfg.alpha.signal_period_ms, 1000);
  EXPECT_DOUBLE_EQ(cfg.alpha.confidence, 0.5);
  ASSERT_EQ(cfg.alpha.grid_templates.at("spot_future").size(), 1u);
  ASSERT_EQ(cfg.pairs[0].levels.size(), 1u);
  EXPECT_EQ(cfg.pairs[0].levels[0].direction(),
            arb::domain::SpreadDirection::ShortSpread);
  EXPECT_DOUBLE_EQ(cfg.accounts[0].paper.initial_cash, 2500.0);
  EXPECT_FALSE(cfg.accounts[0].paper.auto_fill);
  EXPECT_EQ(cfg.routing.kind, "symbol");
  EXPECT_EQ(cfg.routing.mapping.at("BTC-PERP"), "binance");
  EXPECT_TRUE(cfg.backup.enabled);
  ASSERT_EQ(cfg.backup.tiers.size(), 1u);
  EXPECT_EQ(cfg.backup.tiers[0].name, "fast");
  EXPECT_EQ(cfg.endpoints.command, "");
  EXPECT_EQ(cfg.endpoints.telemetry, "tcp://127.0.0.1:5557");
}

// -----------------------------------------------------------------------------
// 3. Errors carry the key path.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, ErrorsNameTheKey) {
  json no_pairs = minimalDoc();
  no_pairs.erase("pairs");
  EXPECT_NE(parseError(no_pairs).find("'pairs'"), std::string::npos);

  json bad_lot = minimalDoc();
  bad_lot["pairs"][0]["leg1"]["lot_size"] = 0;
  EXPECT_NE(parseError(bad_lot).find("pairs[0].leg1.lot_size"),
            std::string::npos);

  json bad_type = minimalDoc();
  bad_type["portfolio_value"] = "lots";
  EXPECT_NE(parseError(bad_type).find("portfolio_value"), std::string::npos);

  json bad_level = minimalDoc();
  bad_level["pairs"][0]["levels"] = {{{"entry", 0.01},
                                      {"exit", 0.02},
                                      {"direction", "LONG_SPREAD"},
                                      {"size", 0.5}}};
  EXPECT_NE(parseError(bad_level).find("pairs[0].levels[0]"),
            std::string::npos);

  json bad_direction = minimalDoc();
  bad_direction["pairs"][0]["levels"] = {{{"entry", -0.01},
                                          {"exit", 0.02},
                                          {"direction", "UP"},
                                          {"size", 0.5}}};
  EXPECT_NE(parseError(bad_direction).find("direction"), std::string::npos);

  json same_legs = minimalDoc();
  same_legs["pairs"][0]["leg2"]["symbol"] = "BTCUSDT";
  EXPECT_FALSE(parseError(same_legs).empty());

  EXPECT_FALSE(parseError(json::array()).empty());
}

TEST(ConfigLoaderTest, AccountValidation) {
  json no_accounts = minimalDoc();
  no_accounts["accounts"] = json::array();
  EXPECT_FALSE(parseError(no_accounts).empty());

  json duplicate = minimalDoc();
  duplicate["accounts"][1]["name"] = "gate";
  EXPECT_NE(parseError(duplicate).find("duplicate"), std::string::npos);

  json unknown_default = minimalDoc();
  unknown_default["routing"] = {{"default_account", "nobody"}};
  EXPECT_NE(parseError(unknown_default).find("routing.default_account"),
            std::string::npos);

  json unknown_mapping = minimalDoc();
  unknown_mapping["routing"] = {{"mapping", {{"nyse", "ibkr"}}}};
  EXPECT_NE(parseError(unknown_mapping).find("routing.mapping.nyse"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 4. Factories.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, MakeRouterPerKind) {
  arb::config::RoutingConfig routing;
  routing.mapping = {{"equity", "ibkr"}};
  routing.default_account = "gate";

  for (const char* kind : {"market", "symbol", "security_type", "simple"}) {
    routing.kind = kind;
    auto router = arb::config::makeRouter(routing);
    ASSERT_NE(router, nullptr);
    EXPECT_STREQ(router->kind(), kind);
  }

  routing.kind = "random";
  EXPECT_THROW(arb::config::makeRouter(routing), std::invalid_argument);

  routing.kind = "security_type";
  routing.mapping = {{"bonds", "ibkr"}};
  EXPECT_THROW(arb::config::makeRouter(routing), std::invalid_argument);
}

TEST(ConfigLoaderTest, MakeBrokeragePerType) {
  arb::SimulationTimeProvider clock;
  arb::config::AccountConfig account;
  account.name = "paper1";

  auto brokerage = arb::config::makeBrokerage(account, clock);
  ASSERT_NE(brokerage, nullptr);
  EXPECT_EQ(brokerage->name(), "paper1");
  EXPECT_NE(brokerage->executionHistory(), nullptr);

  account.type = "gate_live";
  EXPECT_THROW(arb::config::makeBrokerage(account, clock),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 5. loadConfig(): missing file -> runtime_error, bad JSON ->
//    invalid_argument.
// -----------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigFromFile) {
  const auto dir = std::filesystem::temp_directory_path();
  const auto stamp = std::to_string(
      std::chrono::steady_clock::now().time_since_epoch().count());
  const auto good = dir / ("arb_config_good_" + stamp + ".json");
  const auto bad = dir / ("arb_config_bad_" + stamp + ".json");

  {
    std::ofstream out(good);
    out << minimalDoc().dump(2);
  }
  {
    std::ofstream out(bad);
    out << "{ \"pairs\": [ ";
  }

  EXPECT_EQ(arb::config::loadConfig(good.string()).pairs.size(), 1u);
  EXPECT_THROW(arb::config::loadConfig(bad.string()), std::invalid_argument);
  EXPECT_THROW(arb::config::loadConfig((dir / "arb_no_such_config.json")
                                           .string()),
               std::runtime_error);

  std::filesystem::remove(good);
  std::filesystem::remove(bad);
}
