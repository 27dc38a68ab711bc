#pragma once

#include "arb/alpha/arbitrage_alpha_model.hpp"
#include "arb/alpha/signal_collection.hpp"
#include "arb/brokerage/multi_brokerage_manager.hpp"
#include "arb/concurrent/event_loop_thread.hpp"
#include "arb/concurrent/order_id_generator.hpp"
#include "arb/config/engine_config.hpp"
#include "arb/execution/arbitrage_execution_model.hpp"
#include "arb/execution/order_tracker.hpp"
#include "arb/network/ipc_server.hpp"
#include "arb/network/market_data_thread.hpp"
#include "arb/pairs/trading_pair_manager.hpp"
#include "arb/portfolio/arbitrage_portfolio_construction_model.hpp"
#include "arb/portfolio/arbitrage_portfolio_target_collection.hpp"
#include "arb/portfolio/target_sizer.hpp"
#include "arb/routing/i_order_router.hpp"
#include "arb/storage/tiered_backup_manager.hpp"
#include "arb/time/i_time_provider.hpp"
#include "arb/time/simulation_time_provider.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ArbitrageEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every thread and component of the arbitrage core and wires
//         them into one pipeline.
//
// @details
// Per quote, on the evaluation loop:
//
//   QuoteEvent
//     -> TradingPairManager::updateQuote         (pairs touched by the quote)
//     -> ArbitrageAlphaModel::update             (new single-leg signals)
//     -> SignalCollection::add                   (+ GridSignalEvent telemetry)
//     -> ArbitragePortfolioConstructionModel     (percent targets per leg)
//     -> TargetSizer                             (two-leg quantity targets)
//     -> ArbitrageExecutionModel::execute        (orders via router + accounts)
//     -> TieredBackupManager::saveBackup         (grid state, tier-gated)
//
// Per brokerage OrderStatusEvent, on the evaluation loop:
//
//   -> TradingPairManager::processGridOrderEvent (+ GridPositionUpdateEvent)
//   -> ArbitrageExecutionModel::onOrderEvent     (tracker, fulfilled targets)
//   -> compareBaseline every reconcile_interval_ms
//
// Thread layout:
//
//   evaluation loop   everything above, single-threaded
//   market_data       MarketDataGateway recv loop -> pushEvent()
//   ipc_server        STATUS / HALT / ... commands, telemetry PUB
//   brokerage threads each account publishes on its own thread; the
//                     MultiBrokerageManager bus is bridged into the
//                     evaluation loop's queue
//
// Startup (start()):
//   1. Build and validate the router (std::invalid_argument on bad routing).
//   2. Create components, register change listeners, add configured pairs.
//   3. Restore the newest grid-state backup, if backups are enabled.
//   4. Connect every account. Any failure disconnects the ones that did
//      connect and throws std::runtime_error naming the failed accounts.
//   5. Rebuild live tickets and hydrate the OrderTracker from open orders.
//   6. Initialize the reconciliation baseline and run one comparison.
//   7. Start the evaluation loop and bridge brokerage events into it.
//   8. Start IpcServer, then MarketDataThread last.
//
// An empty endpoint disables the matching network thread; tests push
// events with pushEvent() instead.
//
// Ownership:
//   ArbitrageEngine
//    ├── brokerages_         (MultiBrokerageManager, accounts from config)
//    ├── evaluation_loop_    (EventLoopThread, value member)
//    ├── market_data_thread_, ipc_server_   (unique_ptr, created in start)
//    └── router_, pairs_, signals_, alpha_, portfolio_, sizer_, targets_,
//        tracker_, execution_, backup_      (unique_ptr, created in start)
//
// Component accessors return nullptr before start() and after stop().
// -----------------------------------------------------------------------------
class ArbitrageEngine {
 public:
  // replay_clock, when non-null, is advanced to each quote's timestamp by
  // the market data thread. It is normally the same object as clock.
  ArbitrageEngine(config::EngineConfig config, const ITimeProvider& clock,
                  SimulationTimeProvider* replay_clock = nullptr);

  ~ArbitrageEngine();

  ArbitrageEngine(const ArbitrageEngine&) = delete;
  ArbitrageEngine& operator=(const ArbitrageEngine&) = delete;
  ArbitrageEngine(ArbitrageEngine&&) = delete;
  ArbitrageEngine& operator=(ArbitrageEngine&&) = delete;

  void start();

  void stop();

  bool running() const { return running_; }

  // Enqueues onto the evaluation loop. Safe from any thread.
  void pushEvent(Event event);

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //   "PING"      {"status":"ok","response":"PONG"}
  //   "STATUS"    {"status":"ok","halted":..,"connected":..,"pairs":[..],
  //                "targets":[..],"open_orders":..,"backups":{..}}
  //   "HALT"      stops order placement
  //   "RESUME"    re-enables order placement
  //   "BACKUP"    forces a backup attempt (still tier-gated)
  //   "RECONCILE" compares holdings with the baseline now
  //   other       {"status":"error","response":"Unknown command: .."}
  //
  // Runs on the IPC server thread. Everything it touches is internally
  // synchronized.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // Saves grid state through the backup manager. False when backups are
  // disabled, no tier is due, or a storage failed.
  bool saveBackup();

  EventBus& evaluationEventBus() { return evaluation_loop_.eventBus(); }
  std::uint64_t dispatchedCount() const {
    return evaluation_loop_.dispatchedCount();
  }

  MultiBrokerageManager& brokerages() { return brokerages_; }
  const config::EngineConfig& config() const { return config_; }

  TradingPairManager* pairManager() { return pairs_.get(); }
  SignalCollection* signals() { return signals_.get(); }
  ArbitragePortfolioTargetCollection* targets() { return targets_.get(); }
  OrderTracker* orderTracker() { return tracker_.get(); }
  ArbitrageExecutionModel* execution() { return execution_.get(); }
  TieredBackupManager* backupManager() { return backup_.get(); }

 private:
  void createComponents();
  void restoreFromBackup();
  void synchronizeWithBrokerages();
  void wireEvaluationLoop();

  void onQuote(const QuoteEvent& quote);
  void onOrderStatus(const OrderStatusEvent& event);
  void onBrokerageMessage(const BrokerageMessageEvent& event);
  void maybeReconcile(std::int64_t now_ms);

  void publish(const Event& event);

  config::EngineConfig config_;
  const ITimeProvider& clock_;
  SimulationTimeProvider* replay_clock_;

  OrderIdGenerator order_id_gen_;
  MultiBrokerageManager brokerages_;

  EventLoopThread evaluation_loop_{"evaluation_loop"};

  std::unique_ptr<MarketDataThread> market_data_thread_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::unique_ptr<IOrderRouter> router_;
  std::unique_ptr<TradingPairManager> pairs_;
  std::unique_ptr<SignalCollection> signals_;
  std::unique_ptr<ArbitrageAlphaModel> alpha_;
  std::unique_ptr<ArbitragePortfolioConstructionModel> portfolio_;
  std::unique_ptr<TargetSizer> sizer_;
  std::unique_ptr<ArbitragePortfolioTargetCollection> targets_;
  std::unique_ptr<OrderTracker> tracker_;
  std::unique_ptr<ArbitrageExecutionModel> execution_;
  std::unique_ptr<TieredBackupManager> backup_;

  std::vector<EventBus::SubscriptionId> loop_subscriptions_;
  EventBus::SubscriptionId brokerage_bridge_{0};
  bool brokerage_bridged_{false};

  std::int64_t last_reconcile_ms_{0};
  bool running_{false};
};

}  // namespace arb
