#pragma once

#include "arb/domain/grid_level.hpp"
#include "arb/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// GridPosition
// -----------------------------------------------------------------------------
//
// @brief  Live two-leg position opened by one GridLevelPair of one pair.
//
// @details
// Owned by value inside its TradingPair's position map, keyed by the entry
// level's natural key. Nothing else holds a pointer to it; other components
// refer to a position by (pair key, natural key) or by its tag.
//
// Quantities and costs change only through processFill(). Each leg keeps a
// weighted average cost:
//
//     new_cost = (old_cost * old_qty + fill_price * fill_qty)
//                / (old_qty + fill_qty)
//
// reset to 0 when the resulting quantity is 0. Legs are independent, so
// fills may arrive in any order and in separate callbacks.
//
// invested() compares each leg's |quantity| against that leg's lot size:
// a position is invested while at least one leg holds a full lot or more.
// Residual dust below one lot on both legs counts as flat.
//
// Order bookkeeping:
//   broker_order_ids  durable; every venue order id ever seen for this
//                     position. Persisted in backups.
//   live_tickets      transient; venue ids of orders still working. Not
//                     persisted; rebuilt from the venues' open orders via
//                     rebuildTickets() after a restart.
//
// Thread model: not synchronized. Callers go through the owning
// TradingPair, whose map serializes access.
// -----------------------------------------------------------------------------
class GridPosition {
 public:
  GridPosition(std::string leg1_symbol, std::string leg2_symbol,
               domain::GridLevelPair level_pair, double leg1_lot_size,
               double leg2_lot_size, std::int64_t open_time_ms);

  // -------------------------------------------------------------------------
  // processFill(symbol, signed_quantity, price, time_ms)
  // -------------------------------------------------------------------------
  // Applies one execution to the leg whose symbol matches. Returns false,
  // leaving the position untouched, if symbol is neither leg. The first
  // fill stamps first_fill_time.
  // -------------------------------------------------------------------------
  bool processFill(const std::string& symbol, double signed_quantity,
                   double price, std::int64_t time_ms);

  bool invested() const;

  // -------------------------------------------------------------------------
  // shouldExit(current_spread)
  // -------------------------------------------------------------------------
  // Uses this position's own exit level, whatever the pair's configured
  // levels are now. Never exits a position that is not invested.
  //   entered LONG_SPREAD:  spread has risen to   >= exit threshold
  //   entered SHORT_SPREAD: spread has fallen to  <= exit threshold
  // -------------------------------------------------------------------------
  bool shouldExit(double current_spread) const;

  // Records venue order id and updates the live ticket list for a status
  // report. Empty ids are ignored.
  void onOrderStatus(const std::string& broker_order_id,
                     domain::OrderStatus status);

  // Replaces live_tickets with the known venue ids that are still open.
  void rebuildTickets(const std::vector<domain::Order>& open_orders);

  bool hasOpenOrders() const { return !live_tickets_.empty(); }

  // Restores durable state from a backup.
  void restore(double leg1_quantity, double leg1_average_cost,
               double leg2_quantity, double leg2_average_cost,
               std::optional<std::int64_t> first_fill_time_ms,
               std::set<std::string> broker_order_ids);

  const std::string& leg1Symbol() const { return leg1_symbol_; }
  const std::string& leg2Symbol() const { return leg2_symbol_; }
  const domain::GridLevelPair& levelPair() const { return level_pair_; }
  double leg1LotSize() const { return leg1_lot_size_; }
  double leg2LotSize() const { return leg2_lot_size_; }
  std::int64_t openTimeMs() const { return open_time_ms_; }
  std::optional<std::int64_t> firstFillTimeMs() const {
    return first_fill_time_ms_;
  }
  double leg1Quantity() const { return leg1_quantity_; }
  double leg1AverageCost() const { return leg1_average_cost_; }
  double leg2Quantity() const { return leg2_quantity_; }
  double leg2AverageCost() const { return leg2_average_cost_; }
  const std::set<std::string>& brokerOrderIds() const {
    return broker_order_ids_;
  }
  const std::vector<std::string>& liveTickets() const {
    return live_tickets_;
  }

 private:
  static void applyFill(double& quantity, double& average_cost,
                        double fill_quantity, double fill_price);

  std::string leg1_symbol_;
  std::string leg2_symbol_;
  domain::GridLevelPair level_pair_;
  double leg1_lot_size_;
  double leg2_lot_size_;
  std::int64_t open_time_ms_;
  std::optional<std::int64_t> first_fill_time_ms_;

  double leg1_quantity_{0.0};
  double leg1_average_cost_{0.0};
  double leg2_quantity_{0.0};
  double leg2_average_cost_{0.0};

  std::set<std::string> broker_order_ids_;
  std::vector<std::string> live_tickets_;
};

}  // namespace arb
