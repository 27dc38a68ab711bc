#include "arb/execution/arbitrage_execution_model.hpp"

#include "arb/portfolio/target_sizer.hpp"
#include "arb/tag/grid_tag.hpp"

#include <cmath>
#include <iostream>
#include <set>

namespace arb {

ArbitrageExecutionModel::ArbitrageExecutionModel(
    ArbitragePortfolioTargetCollection& targets,
    const TradingPairManager& pairs, const IOrderRouter& router,
    MultiBrokerageManager& brokerages, OrderTracker& tracker,
    OrderIdGenerator& order_ids, const ITimeProvider& time_provider)
    : targets_(targets),
      pairs_(pairs),
      router_(router),
      brokerages_(brokerages),
      tracker_(tracker),
      order_ids_(order_ids),
      time_provider_(time_provider) {}

void ArbitrageExecutionModel::halt() {
  if (!halted_.exchange(true)) {
    std::cout << "[ArbitrageExecutionModel] HALTED: order placement stopped\n";
  }
}

void ArbitrageExecutionModel::resume() {
  if (halted_.exchange(false)) {
    std::cout << "[ArbitrageExecutionModel] resumed order placement\n";
  }
}

// -----------------------------------------------------------------------------
// execute
// -----------------------------------------------------------------------------
std::size_t ArbitrageExecutionModel::execute(
    const std::vector<ArbitragePortfolioTarget>& targets) {
  targets_.addRange(targets);
  if (targets_.empty()) {
    return 0;
  }
  if (halted_.load()) {
    return 0;
  }

  std::size_t placed = 0;
  for (const auto& target : targets_.targets()) {
    auto decoded = tryDecodeGridTag(target.tag);
    if (!decoded) {
      continue;
    }
    auto pair = pairs_.find(decoded->leg1, decoded->leg2);
    auto current = pairs_.gridQuantities(target.tag);
    if (!pair || !current) {
      continue;
    }

    const double leg1_remaining =
        target.leg1_quantity - current->leg1 -
        tracker_.openQuantity(target.leg1_symbol, target.tag);
    const double leg2_remaining =
        target.leg2_quantity - current->leg2 -
        tracker_.openQuantity(target.leg2_symbol, target.tag);

    placed += placeLeg(target, *pair, pair->leg1(), leg1_remaining);
    placed += placeLeg(target, *pair, pair->leg2(), leg2_remaining);
  }

  targets_.clearFulfilled(pairs_, tracker_.openOrders());
  return placed;
}

std::size_t ArbitrageExecutionModel::placeLeg(
    const ArbitragePortfolioTarget& target, const TradingPair& pair,
    const LegSpec& leg, double remaining) {
  const double quantity = TargetSizer::roundToLot(remaining, leg.lot_size);
  if (std::abs(quantity) < leg.lot_size) {
    return 0;
  }

  domain::Order order;
  order.id = order_ids_.next_id();
  order.symbol = leg.symbol;
  order.market = leg.market;
  order.security_type = leg.security_type;
  order.side = quantity > 0.0 ? domain::Side::Buy : domain::Side::Sell;
  order.type = domain::OrderType::Market;
  order.quantity = std::abs(quantity);
  order.tag = target.tag;
  order.created_ms = time_provider_.now_ms();
  if (auto quote = pair.quoteFor(leg.symbol)) {
    order.price = order.side == domain::Side::Buy ? quote->ask : quote->bid;
  }

  const std::string account = router_.route(order);
  tracker_.track(order);
  if (!brokerages_.placeOrder(account, order)) {
    tracker_.remove(order.id);
    std::cerr << "[ArbitrageExecutionModel] ERROR: order " << order.id << " "
              << domain::toString(order.side) << " " << order.quantity << " "
              << order.symbol << " on '" << account << "' failed\n";
    return 0;
  }

  std::cout << "[ArbitrageExecutionModel] order " << order.id << " "
            << domain::toString(order.side) << " " << order.quantity << " "
            << order.symbol << " -> " << account << " tag=" << target.tag
            << "\n";
  return 1;
}

void ArbitrageExecutionModel::onOrderEvent(const OrderStatusEvent& event) {
  if (!tracker_.onOrderStatus(event)) {
    return;
  }
  if (domain::isTerminal(event.status) ||
      event.status == domain::OrderStatus::PartiallyFilled) {
    targets_.clearFulfilled(pairs_, tracker_.openOrders());
  }
}

void ArbitrageExecutionModel::onTradingPairsChanged(
    const TradingPairChanges& changes) {
  if (changes.removed.empty()) {
    return;
  }
  std::set<std::string> removed;
  for (const auto& pair : changes.removed) {
    removed.insert(pair->key());
  }
  for (const auto& target : targets_.targets()) {
    if (removed.count(target.leg1_symbol + "-" + target.leg2_symbol) > 0) {
      targets_.remove(target.tag);
      std::cout << "[ArbitrageExecutionModel] dropped target " << target.tag
                << " of removed pair\n";
    }
  }
}

}  // namespace arb
