#include "arb/pairs/grid_position.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace arb {

GridPosition::GridPosition(std::string leg1_symbol, std::string leg2_symbol,
                           domain::GridLevelPair level_pair,
                           double leg1_lot_size, double leg2_lot_size,
                           std::int64_t open_time_ms)
    : leg1_symbol_(std::move(leg1_symbol)),
      leg2_symbol_(std::move(leg2_symbol)),
      level_pair_(std::move(level_pair)),
      leg1_lot_size_(leg1_lot_size),
      leg2_lot_size_(leg2_lot_size),
      open_time_ms_(open_time_ms) {}

bool GridPosition::processFill(const std::string& symbol,
                               double signed_quantity, double price,
                               std::int64_t time_ms) {
  if (symbol == leg1_symbol_) {
    applyFill(leg1_quantity_, leg1_average_cost_, signed_quantity, price);
  } else if (symbol == leg2_symbol_) {
    applyFill(leg2_quantity_, leg2_average_cost_, signed_quantity, price);
  } else {
    return false;
  }

  if (!first_fill_time_ms_) {
    first_fill_time_ms_ = time_ms;
  }
  return true;
}

void GridPosition::applyFill(double& quantity, double& average_cost,
                             double fill_quantity, double fill_price) {
  double total_cost = average_cost * quantity + fill_price * fill_quantity;
  quantity += fill_quantity;
  average_cost = quantity != 0.0 ? total_cost / quantity : 0.0;
}

bool GridPosition::invested() const {
  return std::abs(leg1_quantity_) >= leg1_lot_size_ ||
         std::abs(leg2_quantity_) >= leg2_lot_size_;
}

bool GridPosition::shouldExit(double current_spread) const {
  if (!invested()) {
    return false;
  }

  const double exit_spread = level_pair_.exit().spread_pct;
  if (level_pair_.direction() == domain::SpreadDirection::LongSpread) {
    return current_spread >= exit_spread;
  }
  return current_spread <= exit_spread;
}

void GridPosition::onOrderStatus(const std::string& broker_order_id,
                                 domain::OrderStatus status) {
  if (broker_order_id.empty()) {
    return;
  }

  broker_order_ids_.insert(broker_order_id);

  auto it = std::find(live_tickets_.begin(), live_tickets_.end(),
                      broker_order_id);
  if (domain::isOpen(status)) {
    if (it == live_tickets_.end()) {
      live_tickets_.push_back(broker_order_id);
    }
  } else if (it != live_tickets_.end()) {
    live_tickets_.erase(it);
  }
}

void GridPosition::rebuildTickets(
    const std::vector<domain::Order>& open_orders) {
  live_tickets_.clear();
  for (const auto& order : open_orders) {
    if (order.broker_order_id.empty() || !domain::isOpen(order.status)) {
      continue;
    }
    if (broker_order_ids_.count(order.broker_order_id) > 0) {
      live_tickets_.push_back(order.broker_order_id);
    }
  }
}

void GridPosition::restore(double leg1_quantity, double leg1_average_cost,
                           double leg2_quantity, double leg2_average_cost,
                           std::optional<std::int64_t> first_fill_time_ms,
                           std::set<std::string> broker_order_ids) {
  leg1_quantity_ = leg1_quantity;
  leg1_average_cost_ = leg1_average_cost;
  leg2_quantity_ = leg2_quantity;
  leg2_average_cost_ = leg2_average_cost;
  first_fill_time_ms_ = first_fill_time_ms;
  broker_order_ids_ = std::move(broker_order_ids);
  live_tickets_.clear();
}

}  // namespace arb
