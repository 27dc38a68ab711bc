#pragma once

#include "arb/brokerage/multi_brokerage_manager.hpp"
#include "arb/concurrent/order_id_generator.hpp"
#include "arb/events/brokerage_events.hpp"
#include "arb/execution/order_tracker.hpp"
#include "arb/pairs/trading_pair_manager.hpp"
#include "arb/portfolio/arbitrage_portfolio_target_collection.hpp"
#include "arb/routing/i_order_router.hpp"
#include "arb/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ArbitrageExecutionModel
// -----------------------------------------------------------------------------
//
// @brief  Works outstanding two-leg targets down to orders.
//
// @details
// execute(targets):
//   1. Upserts targets into the ledger (last write per tag wins).
//   2. For every target in the ledger, per leg:
//
//        remaining = target - grid position quantity - open tagged quantity
//
//      where the open quantity comes from the OrderTracker, so orders still
//      in flight count as done. |remaining| is rounded to the leg's lot
//      size; at least one lot places a market order for that leg with the
//      target's tag.
//   3. Each order is routed to an account and placed through the
//      MultiBrokerageManager. The order is tracked before placement and
//      untracked again if placement fails.
//   4. Fulfilled targets are cleared.
//
// While halted, targets are still recorded but no order is placed.
//
// onOrderEvent() must run after TradingPairManager has applied the same
// event, so the tracker never releases a quantity the grid position does
// not show yet.
//
// Thread model:
//   execute() and onOrderEvent() on the evaluation loop. halt()/resume()
//   from any thread.
// -----------------------------------------------------------------------------
class ArbitrageExecutionModel {
 public:
  ArbitrageExecutionModel(ArbitragePortfolioTargetCollection& targets,
                          const TradingPairManager& pairs,
                          const IOrderRouter& router,
                          MultiBrokerageManager& brokerages,
                          OrderTracker& tracker,
                          OrderIdGenerator& order_ids,
                          const ITimeProvider& time_provider);

  // Returns the number of orders placed.
  std::size_t execute(const std::vector<ArbitragePortfolioTarget>& targets);

  void onOrderEvent(const OrderStatusEvent& event);

  // Drops ledger targets that belong to removed pairs.
  void onTradingPairsChanged(const TradingPairChanges& changes);

  void halt();
  void resume();
  bool halted() const { return halted_.load(); }

 private:
  // Returns 1 if an order was placed for this leg, else 0.
  std::size_t placeLeg(const ArbitragePortfolioTarget& target,
                       const TradingPair& pair, const LegSpec& leg,
                       double remaining);

  ArbitragePortfolioTargetCollection& targets_;
  const TradingPairManager& pairs_;
  const IOrderRouter& router_;
  MultiBrokerageManager& brokerages_;
  OrderTracker& tracker_;
  OrderIdGenerator& order_ids_;
  const ITimeProvider& time_provider_;
  std::atomic<bool> halted_{false};
};

}  // namespace arb
