#pragma once

#include "arb/brokerage/i_execution_history_provider.hpp"
#include "arb/concurrent/concurrent_map.hpp"
#include "arb/domain/account.hpp"
#include "arb/domain/order.hpp"
#include "arb/events/brokerage_events.hpp"
#include "arb/events/grid_events.hpp"
#include "arb/pairs/i_grid_position_view.hpp"
#include "arb/pairs/trading_pair.hpp"
#include "arb/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arb {

// Pairs added to or removed from the registry in one call.
struct TradingPairChanges {
  std::vector<std::shared_ptr<TradingPair>> added;
  std::vector<std::shared_ptr<TradingPair>> removed;
};

// Reconciliation window defaults.
constexpr std::int64_t kReconcileLookbackMs = 30 * 60 * 1000;
constexpr std::int64_t kReconcileBufferMs = 5 * 60 * 1000;

// -----------------------------------------------------------------------------
// TradingPairManager
// -----------------------------------------------------------------------------
//
// @brief  Registry of trading pairs and the single entry point for fills.
//
// @details
// Pairs are keyed by (leg1, leg2). addPair() is idempotent: adding the same
// legs again returns the existing instance and clears a pending removal.
//
// removePair() marks the pair pending removal, which stops new entries.
// While any of its positions is invested or has working orders the pair
// stays registered so exits still trade and their fills still land. Once
// it has no open exposure, change listeners are notified (the alpha model
// cancels every live signal on either leg, the execution model drops the
// pair's targets) and the pair is erased. That happens inside removePair()
// for a flat pair, otherwise after the fill that closes the last position.
//
// processGridOrderEvent() is where brokerage order events become grid
// state:
//
//   1. Duplicate execution ids are dropped.
//   2. The tag decodes to (leg1, leg2, level pair); non-grid orders and
//      unknown pairs are ignored.
//   3. The position for the level pair is get-or-created, and the venue
//      order id recorded on it.
//   4. PartiallyFilled / Filled apply the fill. After Filled a position
//      that is no longer invested and has no working orders is removed.
//   5. The execution id and the per-market last fill time are recorded.
//   6. A pair pending removal with no open exposure left is erased.
//
// Reconciliation guards against fills the engine never saw:
//
//   baseline(symbol) = account holding - sum of grid position quantities
//
// is captured at startup. compareBaseline() recomputes it from fresh
// holdings; any change means a fill is missing and triggers reconcile(),
// which replays the execution history since the earliest last fill time
// (minus a buffer) through the same fill path. When nothing changed, the
// processed-execution set is pruned instead.
//
// Thread model:
//   The registry is a ConcurrentMap. Fill processing, baseline and
//   execution bookkeeping share one mutex; it is released around the
//   execution-history query and around listener callbacks. Brokerage
//   threads and the evaluation loop may call in concurrently.
// -----------------------------------------------------------------------------
class TradingPairManager : public IGridPositionView {
 public:
  using ChangeListener = std::function<void(const TradingPairChanges&)>;
  using PairKey = std::pair<std::string, std::string>;

  explicit TradingPairManager(const ITimeProvider& time_provider);

  // -------------------------------------------------------------------------
  // Registry
  // -------------------------------------------------------------------------
  std::shared_ptr<TradingPair> addPair(LegSpec leg1, LegSpec leg2,
                                       std::string pair_type = "spread");

  // Returns false if the pair is not registered. True otherwise, whether the
  // pair was erased now or left pending until its positions are closed.
  bool removePair(const std::string& leg1, const std::string& leg2);

  std::shared_ptr<TradingPair> find(const std::string& leg1,
                                    const std::string& leg2) const;

  std::vector<std::shared_ptr<TradingPair>> pairs() const;
  std::vector<std::shared_ptr<TradingPair>> pairsByState(
      MarketState state) const;

  std::size_t size() const { return pairs_.size(); }

  void addChangeListener(ChangeListener listener);

  // -------------------------------------------------------------------------
  // Market data
  // -------------------------------------------------------------------------

  // Routes a quote to every pair with symbol as a leg. Returns those pairs.
  std::vector<std::shared_ptr<TradingPair>> updateQuote(
      const std::string& symbol, double bid, double ask, std::int64_t time_ms);

  // Lot size of the first registered leg trading symbol.
  std::optional<double> lotSize(const std::string& symbol) const;

  // -------------------------------------------------------------------------
  // Fills
  // -------------------------------------------------------------------------

  // Returns the position change to publish, or std::nullopt when the event
  // was ignored or changed nothing worth reporting.
  std::optional<GridPositionUpdateEvent> processGridOrderEvent(
      const OrderStatusEvent& event);

  std::optional<LegQuantities> gridQuantities(
      const std::string& tag) const override;

  // Restores live tickets on every position from the venues' open orders.
  void rebuildTickets(const std::vector<domain::Order>& open_orders);

  // -------------------------------------------------------------------------
  // Reconciliation
  // -------------------------------------------------------------------------

  // Net grid quantity per symbol across all pairs and positions.
  std::map<std::string, double> aggregateGridPositions() const;

  // Captures the baseline, but only while no fill has been processed yet.
  void initializeBaseline(const std::vector<domain::Holding>& holdings);

  // Returns true if a discrepancy was found (and reconcile() was run).
  bool compareBaseline(const std::vector<domain::Holding>& holdings,
                       IExecutionHistoryProvider* history);

  // Replays missed executions. Returns the number replayed. A null history
  // provider is logged and treated as "nothing to replay".
  std::size_t reconcile(IExecutionHistoryProvider* history);

  // Drops processed execution ids strictly older than their market's last
  // fill time.
  void cleanupProcessedExecutions();

  std::map<std::string, double> baseline() const;
  std::map<std::string, std::int64_t> lastFillTimes() const;
  void restoreLastFillTimes(std::map<std::string, std::int64_t> times);
  std::size_t processedExecutionCount() const;

 private:
  struct ExecutionSnapshot {
    std::int64_t time_ms{0};
    std::string market;
  };

  // Caller holds mutex_.
  std::optional<GridPositionUpdateEvent> processLocked(
      const OrderStatusEvent& event);
  std::map<std::string, double> calculateBaselineLocked(
      const std::vector<domain::Holding>& holdings) const;
  bool shouldReplayLocked(const domain::ExecutionRecord& execution) const;
  void notify(const TradingPairChanges& changes);

  // Notifies and erases pair if it is still registered, pending removal and
  // without open exposure. Caller must not hold mutex_.
  bool finishRemoval(const std::shared_ptr<TradingPair>& pair);
  void completePendingRemovals();

  const ITimeProvider& time_provider_;

  ConcurrentMap<PairKey, std::shared_ptr<TradingPair>> pairs_;

  std::mutex listeners_mutex_;
  std::vector<ChangeListener> listeners_;

  mutable std::mutex mutex_;
  std::map<std::string, ExecutionSnapshot> processed_executions_;
  std::map<std::string, std::int64_t> last_fill_by_market_;
  std::map<std::string, double> baseline_;
  std::vector<std::shared_ptr<TradingPair>> completed_removals_;
};

}  // namespace arb
