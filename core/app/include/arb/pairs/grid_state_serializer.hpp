#pragma once

#include "arb/pairs/trading_pair_manager.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// Grid state serialization
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of everything needed to resume trading after a restart.
//
// @details
// Document layout (version 1):
//
//   {
//     "version": 1,
//     "saved_ms": 1700000000000,
//     "pairs": [
//       { "leg1": {...LegSpec}, "leg2": {...}, "pair_type": "crypto_stock",
//         "level_pairs": [ {"entry":-0.02,"exit":0.01,
//                           "direction":"LONG_SPREAD","size":0.5} ],
//         "positions":   [ {"level_pair":{...}, "open_time_ms":...,
//                           "first_fill_time_ms":... | null,
//                           "leg1_quantity":..., "leg1_average_cost":...,
//                           "leg2_quantity":..., "leg2_average_cost":...,
//                           "broker_order_ids":["..."]} ] } ],
//     "last_fill_by_market": { "gate": 1700000000000 }
//   }
//
// Live tickets are not written; they are rebuilt from open orders once the
// brokerages are connected.
// -----------------------------------------------------------------------------

nlohmann::json gridStateToJson(const TradingPairManager& manager,
                               std::int64_t saved_ms);

// Registers pairs missing from the manager, then replaces their level pairs
// and positions with the document's. Returns false (after logging) if the
// document is malformed; pairs restored before the error stay restored.
bool restoreGridState(TradingPairManager& manager, const nlohmann::json& doc);

}  // namespace arb
