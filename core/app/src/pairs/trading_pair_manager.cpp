#include "arb/pairs/trading_pair_manager.hpp"

#include "arb/tag/grid_tag.hpp"
#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <set>

namespace arb {

namespace {

bool isFill(domain::OrderStatus status) {
  return status == domain::OrderStatus::PartiallyFilled ||
         status == domain::OrderStatus::Filled;
}

GridPositionUpdateEvent makeUpdate(const std::string& pair_key,
                                   const std::string& tag,
                                   const GridPosition& position,
                                   bool removed, std::int64_t time_ms) {
  GridPositionUpdateEvent update;
  update.pair_key = pair_key;
  update.tag = tag;
  update.leg1_quantity = position.leg1Quantity();
  update.leg1_average_cost = position.leg1AverageCost();
  update.leg2_quantity = position.leg2Quantity();
  update.leg2_average_cost = position.leg2AverageCost();
  update.invested = position.invested();
  update.removed = removed;
  update.timestamp_ms = time_ms;
  return update;
}

}  // namespace

TradingPairManager::TradingPairManager(const ITimeProvider& time_provider)
    : time_provider_(time_provider) {}

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------

std::shared_ptr<TradingPair> TradingPairManager::addPair(LegSpec leg1,
                                                         LegSpec leg2,
                                                         std::string pair_type) {
  PairKey key{leg1.symbol, leg2.symbol};
  if (auto existing = pairs_.find(key)) {
    if ((*existing)->isPendingRemoval()) {
      (*existing)->clearPendingRemoval();
      std::cout << "[TradingPairManager] pair " << (*existing)->key()
                << " re-added, pending removal cleared\n";
    }
    return *existing;
  }

  // Constructed outside the map lock; validation may throw.
  auto pair = std::make_shared<TradingPair>(std::move(leg1), std::move(leg2),
                                            std::move(pair_type));
  if (!pairs_.tryInsert(key, pair)) {
    // Lost a race with a concurrent addPair for the same legs.
    return *pairs_.find(key);
  }

  std::cout << "[TradingPairManager] added pair " << pair->key() << " ("
            << pair->pairType() << ")\n";

  TradingPairChanges changes;
  changes.added.push_back(pair);
  notify(changes);
  return pair;
}

bool TradingPairManager::removePair(const std::string& leg1,
                                    const std::string& leg2) {
  PairKey key{leg1, leg2};
  auto pair = pairs_.find(key);
  if (!pair) {
    return false;
  }

  (*pair)->markPendingRemoval();
  if (!finishRemoval(*pair)) {
    std::cout << "[TradingPairManager] pair " << (*pair)->key()
              << " pending removal, " << (*pair)->activePositionCount()
              << " invested position(s) left to exit\n";
  }
  return true;
}

bool TradingPairManager::finishRemoval(
    const std::shared_ptr<TradingPair>& pair) {
  const PairKey key{pair->leg1().symbol, pair->leg2().symbol};
  auto removable = [&](const std::shared_ptr<TradingPair>& candidate) {
    return candidate == pair && candidate->isPendingRemoval() &&
           !candidate->hasOpenExposure();
  };

  auto current = pairs_.find(key);
  if (!current || !removable(*current)) {
    return false;
  }

  TradingPairChanges changes;
  changes.removed.push_back(pair);
  notify(changes);

  auto erased = pairs_.eraseIf(
      [&](const PairKey& k, const std::shared_ptr<TradingPair>& candidate) {
        return k == key && removable(candidate);
      });
  if (erased.empty()) {
    return false;
  }
  std::cout << "[TradingPairManager] removed pair " << pair->key() << "\n";
  return true;
}

void TradingPairManager::completePendingRemovals() {
  std::vector<std::shared_ptr<TradingPair>> candidates;
  {
    std::lock_guard lock(mutex_);
    candidates.swap(completed_removals_);
  }
  for (const auto& pair : candidates) {
    finishRemoval(pair);
  }
}

std::shared_ptr<TradingPair> TradingPairManager::find(
    const std::string& leg1, const std::string& leg2) const {
  auto pair = pairs_.find(PairKey{leg1, leg2});
  return pair ? *pair : nullptr;
}

std::vector<std::shared_ptr<TradingPair>> TradingPairManager::pairs() const {
  return pairs_.values();
}

std::vector<std::shared_ptr<TradingPair>> TradingPairManager::pairsByState(
    MarketState state) const {
  std::vector<std::shared_ptr<TradingPair>> out;
  for (auto& pair : pairs_.values()) {
    if (pair->marketState() == state) {
      out.push_back(pair);
    }
  }
  return out;
}

void TradingPairManager::addChangeListener(ChangeListener listener) {
  std::lock_guard lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

void TradingPairManager::notify(const TradingPairChanges& changes) {
  std::vector<ChangeListener> listeners;
  {
    std::lock_guard lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (auto& listener : listeners) {
    listener(changes);
  }
}

// -----------------------------------------------------------------------------
// Market data
// -----------------------------------------------------------------------------

std::vector<std::shared_ptr<TradingPair>> TradingPairManager::updateQuote(
    const std::string& symbol, double bid, double ask, std::int64_t time_ms) {
  std::vector<std::shared_ptr<TradingPair>> touched;
  for (auto& pair : pairs_.values()) {
    if (pair->updateQuote(symbol, bid, ask, time_ms)) {
      touched.push_back(pair);
    }
  }
  return touched;
}

std::optional<double> TradingPairManager::lotSize(
    const std::string& symbol) const {
  for (const auto& pair : pairs_.values()) {
    if (pair->leg1().symbol == symbol) {
      return pair->leg1().lot_size;
    }
    if (pair->leg2().symbol == symbol) {
      return pair->leg2().lot_size;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Fills
// -----------------------------------------------------------------------------

std::optional<GridPositionUpdateEvent> TradingPairManager::processGridOrderEvent(
    const OrderStatusEvent& event) {
  std::optional<GridPositionUpdateEvent> update;
  {
    std::lock_guard lock(mutex_);
    update = processLocked(event);
  }
  completePendingRemovals();
  return update;
}

std::optional<GridPositionUpdateEvent> TradingPairManager::processLocked(
    const OrderStatusEvent& event) {
  if (!event.execution_id.empty() &&
      processed_executions_.count(event.execution_id) > 0) {
    return std::nullopt;
  }

  if (event.tag.empty()) {
    return std::nullopt;
  }
  auto decoded = tryDecodeGridTag(event.tag);
  if (!decoded) {
    return std::nullopt;
  }
  auto pair = pairs_.find(PairKey{decoded->leg1, decoded->leg2});
  if (!pair) {
    return std::nullopt;
  }

  const std::string natural_key =
      decoded->level_pair.entry().naturalKey();
  const bool fill = isFill(event.status) && event.fill_quantity != 0.0;
  bool applied = false;

  GridPosition position = (*pair)->withPosition(
      decoded->level_pair, event.timestamp_ms, [&](GridPosition& p) {
        p.onOrderStatus(event.broker_order_id, event.status);
        if (fill) {
          applied = p.processFill(event.symbol, event.fill_quantity,
                                  event.fill_price, event.timestamp_ms);
        }
      });

  std::optional<GridPositionUpdateEvent> update;
  if (applied) {
    update = makeUpdate((*pair)->key(), event.tag, position, false,
                        event.timestamp_ms);
  }

  if (event.status == domain::OrderStatus::Filled &&
      (*pair)->removePositionIfFlat(natural_key)) {
    update = makeUpdate((*pair)->key(), event.tag, position, true,
                        event.timestamp_ms);
  }

  if (fill) {
    if (!event.execution_id.empty()) {
      processed_executions_[event.execution_id] =
          ExecutionSnapshot{event.timestamp_ms, event.market};
    }
    auto it = last_fill_by_market_.find(event.market);
    if (it == last_fill_by_market_.end() || it->second < event.timestamp_ms) {
      last_fill_by_market_[event.market] = event.timestamp_ms;
    }
  }

  // Erased after the lock is released; listeners must not run under it.
  if ((*pair)->isPendingRemoval() && !(*pair)->hasOpenExposure()) {
    completed_removals_.push_back(*pair);
  }

  return update;
}

std::optional<LegQuantities> TradingPairManager::gridQuantities(
    const std::string& tag) const {
  auto decoded = tryDecodeGridTag(tag);
  if (!decoded) {
    return std::nullopt;
  }
  auto pair = pairs_.find(PairKey{decoded->leg1, decoded->leg2});
  if (!pair) {
    return std::nullopt;
  }
  auto position =
      (*pair)->tryGetPosition(decoded->level_pair.entry().naturalKey());
  if (!position) {
    return LegQuantities{};
  }
  return LegQuantities{position->leg1Quantity(), position->leg2Quantity()};
}

void TradingPairManager::rebuildTickets(
    const std::vector<domain::Order>& open_orders) {
  for (auto& pair : pairs_.values()) {
    for (const auto& position : pair->positions()) {
      pair->updatePosition(position.levelPair().entry().naturalKey(),
                           [&](GridPosition& p) { p.rebuildTickets(open_orders); });
    }
  }
}

// -----------------------------------------------------------------------------
// Reconciliation
// -----------------------------------------------------------------------------

std::map<std::string, double> TradingPairManager::aggregateGridPositions()
    const {
  std::map<std::string, double> result;
  for (const auto& pair : pairs_.values()) {
    for (const auto& position : pair->positions()) {
      result[position.leg1Symbol()] += position.leg1Quantity();
      result[position.leg2Symbol()] += position.leg2Quantity();
    }
  }
  return result;
}

std::map<std::string, double> TradingPairManager::calculateBaselineLocked(
    const std::vector<domain::Holding>& holdings) const {
  std::map<std::string, double> held;
  for (const auto& holding : holdings) {
    held[holding.symbol] += holding.quantity;
  }
  auto grid = aggregateGridPositions();

  std::set<std::string> symbols;
  for (const auto& [symbol, qty] : held) symbols.insert(symbol);
  for (const auto& [symbol, qty] : grid) symbols.insert(symbol);

  std::map<std::string, double> diff;
  for (const auto& symbol : symbols) {
    double d = held[symbol] - grid[symbol];
    if (d != 0.0) {
      diff[symbol] = d;
    }
  }
  return diff;
}

void TradingPairManager::initializeBaseline(
    const std::vector<domain::Holding>& holdings) {
  std::lock_guard lock(mutex_);
  if (!last_fill_by_market_.empty()) {
    return;
  }
  baseline_ = calculateBaselineLocked(holdings);
  std::cout << "[TradingPairManager] baseline initialized ("
            << baseline_.size() << " symbols)\n";
}

bool TradingPairManager::compareBaseline(
    const std::vector<domain::Holding>& holdings,
    IExecutionHistoryProvider* history) {
  bool discrepancy = false;
  {
    std::lock_guard lock(mutex_);
    auto current = calculateBaselineLocked(holdings);

    std::set<std::string> symbols;
    for (const auto& [symbol, qty] : baseline_) symbols.insert(symbol);
    for (const auto& [symbol, qty] : current) symbols.insert(symbol);

    for (const auto& symbol : symbols) {
      auto b = baseline_.find(symbol);
      auto c = current.find(symbol);
      double baseline_value = b == baseline_.end() ? 0.0 : b->second;
      double current_value = c == current.end() ? 0.0 : c->second;
      if (baseline_value != current_value) {
        std::cout << "[TradingPairManager] baseline discrepancy: " << symbol
                  << " baseline=" << baseline_value
                  << " current=" << current_value << "\n";
        discrepancy = true;
      }
    }
  }

  if (discrepancy) {
    reconcile(history);
  } else {
    cleanupProcessedExecutions();
  }
  return discrepancy;
}

bool TradingPairManager::shouldReplayLocked(
    const domain::ExecutionRecord& execution) const {
  if (processed_executions_.count(execution.execution_id) > 0) {
    return false;
  }
  auto it = last_fill_by_market_.find(execution.market);
  // Equal timestamps are kept; execution id dedup decides those.
  return it == last_fill_by_market_.end() || execution.time_ms >= it->second;
}

std::size_t TradingPairManager::reconcile(IExecutionHistoryProvider* history) {
  const std::int64_t end_ms = time_provider_.now_ms();
  std::int64_t start_ms = end_ms - kReconcileLookbackMs;
  {
    std::lock_guard lock(mutex_);
    if (!last_fill_by_market_.empty()) {
      auto earliest = std::min_element(
          last_fill_by_market_.begin(), last_fill_by_market_.end(),
          [](const auto& a, const auto& b) { return a.second < b.second; });
      start_ms = earliest->second - kReconcileBufferMs;
    }
  }

  std::cout << "[TradingPairManager] reconcile: querying executions from "
            << formatIsoUtc(start_ms) << " to " << formatIsoUtc(end_ms)
            << "\n";

  if (history == nullptr) {
    std::cout << "[TradingPairManager] reconcile: no execution history "
                 "provider available\n";
    return 0;
  }

  std::vector<domain::ExecutionRecord> executions;
  try {
    executions = history->getExecutionHistory(start_ms, end_ms);
  } catch (const std::exception& e) {
    std::cerr << "[TradingPairManager] ERROR: execution history query "
                 "failed: " << e.what() << "\n";
    return 0;
  }
  if (executions.empty()) {
    std::cout << "[TradingPairManager] reconcile: no executions found\n";
    return 0;
  }

  std::stable_sort(executions.begin(), executions.end(),
                   [](const auto& a, const auto& b) {
                     return a.time_ms < b.time_ms;
                   });

  std::size_t replayed = 0;
  {
    std::lock_guard lock(mutex_);
    std::vector<const domain::ExecutionRecord*> selected;
    for (const auto& execution : executions) {
      if (shouldReplayLocked(execution)) {
        selected.push_back(&execution);
      }
    }

    for (const auto* execution : selected) {
      OrderStatusEvent event;
      event.account = execution->account;
      event.broker_order_id = execution->broker_order_id;
      event.symbol = execution->symbol;
      event.market = execution->market;
      event.status = domain::OrderStatus::Filled;
      event.fill_quantity = execution->quantity;
      event.fill_price = execution->price;
      event.execution_id = execution->execution_id;
      event.tag = execution->tag;
      event.message = "Replayed from brokerage history";
      event.timestamp_ms = execution->time_ms;
      processLocked(event);
      ++replayed;
    }
  }
  completePendingRemovals();

  std::cout << "[TradingPairManager] reconcile: replayed " << replayed << "/"
            << executions.size() << " executions\n";
  return replayed;
}

void TradingPairManager::cleanupProcessedExecutions() {
  std::lock_guard lock(mutex_);
  std::size_t removed = 0;
  for (auto it = processed_executions_.begin();
       it != processed_executions_.end();) {
    auto last = last_fill_by_market_.find(it->second.market);
    if (last != last_fill_by_market_.end() &&
        it->second.time_ms < last->second) {
      it = processed_executions_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  if (removed > 0) {
    std::cout << "[TradingPairManager] pruned " << removed
              << " processed executions, remaining "
              << processed_executions_.size() << "\n";
  }
}

std::map<std::string, double> TradingPairManager::baseline() const {
  std::lock_guard lock(mutex_);
  return baseline_;
}

std::map<std::string, std::int64_t> TradingPairManager::lastFillTimes() const {
  std::lock_guard lock(mutex_);
  return last_fill_by_market_;
}

void TradingPairManager::restoreLastFillTimes(
    std::map<std::string, std::int64_t> times) {
  std::lock_guard lock(mutex_);
  last_fill_by_market_ = std::move(times);
}

std::size_t TradingPairManager::processedExecutionCount() const {
  std::lock_guard lock(mutex_);
  return processed_executions_.size();
}

}  // namespace arb
