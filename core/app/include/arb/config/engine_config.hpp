#pragma once

#include "arb/alpha/arbitrage_alpha_model.hpp"
#include "arb/brokerage/paper_brokerage.hpp"
#include "arb/domain/grid_level.hpp"
#include "arb/pairs/trading_pair.hpp"
#include "arb/storage/backup_types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace arb {
namespace config {

// One trading pair. levels are added on top of the pair type's grid
// template; a "spread" pair has no template and trades only these.
struct PairConfig {
  LegSpec leg1;
  LegSpec leg2;
  std::string pair_type{"spread"};
  std::vector<domain::GridLevelPair> levels;
};

// A brokerage account. "paper" is the only type this build knows.
struct AccountConfig {
  std::string name;
  std::string type{"paper"};
  PaperBrokerageOptions paper;
};

// kind is one of "market", "symbol", "security_type", "simple". For
// "simple" the mapping is ignored and every order goes to default_account.
struct RoutingConfig {
  std::string kind{"market"};
  std::map<std::string, std::string> mapping;
  std::string default_account;
};

struct BackupConfig {
  bool enabled{false};
  std::string owner{"arb_core_engine"};
  std::string directory{"backups"};
  std::vector<TierSettings> tiers{defaultBackupTiers()};
};

struct Endpoints {
  std::string market_data{"tcp://127.0.0.1:5555"};
  std::string command{"tcp://127.0.0.1:5556"};
  std::string telemetry{"tcp://127.0.0.1:5557"};
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything ArbitrageEngine needs to build its components.
//
// @details
// Defaults are usable as-is for a paper session once at least one account
// and one pair are filled in. Loaded from JSON by config::loadConfig();
// tests build it directly.
//
//   replay_clock           true: time follows quote timestamps (backtest
//                          replay). false: wall clock.
//   reconcile_interval_ms  how often (engine time) holdings are compared
//                          with the grid baseline after a fill. 0 = after
//                          every fill.
//   rebalance_interval_ms  periodic target rebuild even without new
//                          signals. 0 = only on new or expired signals.
//
// Thread model: plain data, copied into the engine at construction.
// -----------------------------------------------------------------------------
struct EngineConfig {
  AlphaSettings alpha;
  std::vector<PairConfig> pairs;
  std::vector<AccountConfig> accounts;
  RoutingConfig routing;
  BackupConfig backup;
  Endpoints endpoints;

  double portfolio_value{100000.0};
  bool replay_clock{false};
  std::int64_t reconcile_interval_ms{60 * 1000};
  std::int64_t rebalance_interval_ms{0};
};

}  // namespace config
}  // namespace arb
