#pragma once

#include "arb/brokerage/i_brokerage.hpp"
#include "arb/config/engine_config.hpp"
#include "arb/routing/i_order_router.hpp"
#include "arb/time/i_time_provider.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace arb {
namespace config {

// -----------------------------------------------------------------------------
// Config loading
// -----------------------------------------------------------------------------
//
// @brief  JSON document -> EngineConfig, plus the factories that turn config
//         sections into live components.
//
// @details
// Document layout (every key optional unless noted):
//
//   {
//     "portfolio_value": 100000,
//     "replay_clock": false,
//     "reconcile_interval_ms": 60000,
//     "rebalance_interval_ms": 0,
//     "alpha": {
//       "signal_period_ms": 300000, "confidence": 1.0,
//       "require_valid_prices": true,
//       "grid_templates": { "crypto_stock": [ <level>, ... ] }
//     },
//     "pairs": [                                             (required)
//       { "leg1": <leg>, "leg2": <leg>, "pair_type": "crypto_stock",
//         "levels": [ <level>, ... ] }
//     ],
//     "accounts": [                                          (required)
//       { "name": "gate", "type": "paper", "initial_cash": 100000,
//         "base_currency": "USDT", "fee_rate": 0.0 }
//     ],
//     "routing": { "kind": "market", "mapping": { "gate": "gate" },
//                  "default_account": "gate" },
//     "backup": { "enabled": true, "owner": "arb", "directory": "backups",
//                 "tiers": [ { "name": "min", "interval_ms": 300000,
//                              "max_count": 50 } ] },
//     "endpoints": { "market_data": "...", "command": "...",
//                    "telemetry": "..." }
//   }
//
//   <leg>   = { "symbol": "BTCUSDT", "market": "gate",
//               "security_type": "crypto", "lot_size": 0.01 }
//   <level> = { "entry": -0.02, "exit": 0.01,
//               "direction": "LONG_SPREAD", "size": 0.5 }
//
// parseConfig() throws std::invalid_argument naming the offending key for
// anything missing, mistyped or out of range. loadConfig() additionally
// throws std::runtime_error when the file cannot be read.
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& doc);

EngineConfig loadConfig(const std::string& path);

// Router for the configured policy. Not yet validated; the engine calls
// validate() on start.
std::unique_ptr<IOrderRouter> makeRouter(const RoutingConfig& routing);

// Throws std::invalid_argument for an unknown account type.
std::shared_ptr<IBrokerage> makeBrokerage(const AccountConfig& account,
                                          const ITimeProvider& time_provider);

}  // namespace config
}  // namespace arb
