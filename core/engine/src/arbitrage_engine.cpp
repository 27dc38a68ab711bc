#include "arb/engine/arbitrage_engine.hpp"

#include "arb/config/config_loader.hpp"
#include "arb/pairs/grid_state_serializer.hpp"
#include "arb/storage/file_backup_storage.hpp"
#include "arb/tag/grid_tag.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <utility>

namespace arb {

namespace {

// Order ids restart with the process; seeding from the clock keeps new ids
// clear of orders hydrated from the accounts after a restart.
std::uint64_t firstOrderId(const ITimeProvider& clock) {
  auto now = std::max<std::int64_t>(clock.now_ms(), 0);
  return static_cast<std::uint64_t>(now) * 1000 + 1;
}

nlohmann::json pairToJson(const TradingPair& pair) {
  auto snapshot = pair.marketSnapshot();

  nlohmann::json p;
  p["key"] = pair.key();
  p["pair_type"] = pair.pairType();
  p["state"] = toString(snapshot.market_state);
  p["pending_removal"] = pair.isPendingRemoval();
  p["theoretical_spread"] = snapshot.theoretical_spread;
  if (snapshot.executable_spread) {
    p["executable_spread"] = *snapshot.executable_spread;
  } else {
    p["executable_spread"] = nullptr;
  }

  nlohmann::json positions = nlohmann::json::array();
  for (const auto& position : pair.positions()) {
    nlohmann::json g;
    g["level"] = position.levelPair().toString();
    g["leg1_quantity"] = position.leg1Quantity();
    g["leg2_quantity"] = position.leg2Quantity();
    g["invested"] = position.invested();
    g["live_tickets"] = position.liveTickets().size();
    positions.push_back(std::move(g));
  }
  p["positions"] = std::move(positions);
  return p;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
ArbitrageEngine::ArbitrageEngine(config::EngineConfig config,
                                 const ITimeProvider& clock,
                                 SimulationTimeProvider* replay_clock)
    : config_(std::move(config)),
      clock_(clock),
      replay_clock_(replay_clock),
      order_id_gen_(firstOrderId(clock)) {
  for (const auto& account : config_.accounts) {
    brokerages_.addBrokerage(config::makeBrokerage(account, clock_));
  }
}

ArbitrageEngine::~ArbitrageEngine() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void ArbitrageEngine::start() {
  if (running_) {
    return;
  }

  // ---  1-2) Router, components, pairs --------------------------------------
  createComponents();

  // ---  3) Grid state from the newest backup --------------------------------
  restoreFromBackup();

  // ---  4-6) Accounts: connect, hydrate, baseline ---------------------------
  synchronizeWithBrokerages();

  // ---  7) Evaluation loop and the brokerage bridge -------------------------
  evaluation_loop_.start();
  wireEvaluationLoop();

  brokerage_bridge_ = brokerages_.events().subscribe(
      [this](const Event& event) {
        if (std::holds_alternative<OrderStatusEvent>(event) ||
            std::holds_alternative<BrokerageMessageEvent>(event) ||
            std::holds_alternative<AccountChangedEvent>(event) ||
            std::holds_alternative<OptionAssignmentEvent>(event)) {
          evaluation_loop_.push(event);
        }
      });
  brokerage_bridged_ = true;

  // ---  8) IpcServer, then market data LAST ---------------------------------
  if (!config_.endpoints.command.empty() &&
      !config_.endpoints.telemetry.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.endpoints.command, config_.endpoints.telemetry);
    ipc_server_->start();
  }

  if (!config_.endpoints.market_data.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        [this](Event event) { pushEvent(std::move(event)); },
        config_.endpoints.market_data, replay_clock_);
    market_data_thread_->start();
  }

  running_ = true;

  std::cout << "[ArbitrageEngine] started. " << pairs_->size() << " pair(s), "
            << brokerages_.size() << " account(s), router="
            << router_->kind()
            << (market_data_thread_ ? ", market_data" : "")
            << (ipc_server_ ? ", ipc" : "") << ".\n";
}

void ArbitrageEngine::createComponents() {
  router_ = config::makeRouter(config_.routing);
  router_->validate();

  pairs_ = std::make_unique<TradingPairManager>(clock_);
  signals_ = std::make_unique<SignalCollection>();
  alpha_ = std::make_unique<ArbitrageAlphaModel>(*signals_, config_.alpha);

  ArbitragePortfolioConstructionModel::RebalanceFunc rebalance;
  if (config_.rebalance_interval_ms > 0) {
    auto interval = config_.rebalance_interval_ms;
    rebalance = [interval](std::int64_t now_ms) -> std::optional<std::int64_t> {
      return now_ms + interval;
    };
  }
  portfolio_ = std::make_unique<ArbitragePortfolioConstructionModel>(
      *signals_, std::move(rebalance));
  sizer_ = std::make_unique<TargetSizer>(*pairs_, config_.portfolio_value);

  targets_ = std::make_unique<ArbitragePortfolioTargetCollection>();
  tracker_ = std::make_unique<OrderTracker>();
  execution_ = std::make_unique<ArbitrageExecutionModel>(
      *targets_, *pairs_, *router_, brokerages_, *tracker_, order_id_gen_,
      clock_);

  pairs_->addChangeListener([this](const TradingPairChanges& changes) {
    alpha_->onTradingPairsChanged(changes, clock_.now_ms());
    execution_->onTradingPairsChanged(changes);
  });

  for (const auto& pair_config : config_.pairs) {
    auto pair =
        pairs_->addPair(pair_config.leg1, pair_config.leg2,
                        pair_config.pair_type);
    for (const auto& level : pair_config.levels) {
      pair->addLevelPair(level);
    }
  }

  if (config_.backup.enabled) {
    std::vector<std::shared_ptr<IBackupStorage>> storages{
        std::make_shared<FileBackupStorage>(config_.backup.directory)};
    backup_ = std::make_unique<TieredBackupManager>(
        config_.backup.owner, std::move(storages), clock_,
        config_.backup.tiers);
  }
}

void ArbitrageEngine::restoreFromBackup() {
  if (!backup_) {
    return;
  }

  auto content = backup_->restoreLatest();
  if (!content) {
    std::cout << "[ArbitrageEngine] no grid-state backup for '"
              << backup_->owner() << "', starting flat\n";
    return;
  }

  auto doc = nlohmann::json::parse(*content, nullptr, false);
  if (doc.is_discarded()) {
    std::cerr << "[ArbitrageEngine] WARNING: newest backup is not valid JSON, "
                 "starting flat\n";
    return;
  }
  if (!restoreGridState(*pairs_, doc)) {
    std::cerr << "[ArbitrageEngine] WARNING: grid state restore failed\n";
  }
}

void ArbitrageEngine::synchronizeWithBrokerages() {
  brokerages_.connectAll();

  auto open_orders = brokerages_.getAllOpenOrders();
  pairs_->rebuildTickets(open_orders);
  for (const auto& order : open_orders) {
    tracker_->hydrateOrder(order);
  }

  auto holdings = brokerages_.getAllHoldings();
  pairs_->initializeBaseline(holdings);
  pairs_->compareBaseline(holdings, &brokerages_);
  last_reconcile_ms_ = clock_.now_ms();

  std::cout << "[ArbitrageEngine] synchronized: " << open_orders.size()
            << " open order(s), " << holdings.size() << " holding(s).\n";
}

// -----------------------------------------------------------------------------
// wireEvaluationLoop(): handlers and telemetry bridges on the loop bus
// -----------------------------------------------------------------------------
void ArbitrageEngine::wireEvaluationLoop() {
  auto& bus = evaluation_loop_.eventBus();

  loop_subscriptions_.push_back(bus.subscribe<QuoteEvent>(
      [this](const QuoteEvent& e) { onQuote(e); }));
  loop_subscriptions_.push_back(bus.subscribe<OrderStatusEvent>(
      [this](const OrderStatusEvent& e) { onOrderStatus(e); }));
  loop_subscriptions_.push_back(bus.subscribe<BrokerageMessageEvent>(
      [this](const BrokerageMessageEvent& e) { onBrokerageMessage(e); }));
  loop_subscriptions_.push_back(bus.subscribe<OptionAssignmentEvent>(
      [](const OptionAssignmentEvent& e) {
        std::cout << "[ArbitrageEngine] option assignment on '" << e.account
                  << "': " << e.symbol << " qty=" << e.quantity << "\n";
      }));
}

void ArbitrageEngine::publish(const Event& event) {
  evaluation_loop_.eventBus().publish(event);
  if (ipc_server_) {
    ipc_server_->pushTelemetry(event);
  }
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void ArbitrageEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) No new quotes, no new commands ----------------------------------
  market_data_thread_.reset();
  ipc_server_.reset();

  // ---  2) Detach brokerage events, drain and join the loop ----------------
  if (brokerage_bridged_) {
    brokerages_.events().unsubscribe(brokerage_bridge_);
    brokerage_bridged_ = false;
  }
  evaluation_loop_.stop();
  for (auto id : loop_subscriptions_) {
    evaluation_loop_.eventBus().unsubscribe(id);
  }
  loop_subscriptions_.clear();

  // ---  3) Last backup attempt, then disconnect ----------------------------
  saveBackup();
  brokerages_.disconnectAll();

  // ---  4) Destroy components ---------------------------------------------
  backup_.reset();
  execution_.reset();
  tracker_.reset();
  targets_.reset();
  sizer_.reset();
  portfolio_.reset();
  alpha_.reset();
  signals_.reset();
  pairs_.reset();
  router_.reset();

  running_ = false;

  std::cout << "[ArbitrageEngine] stopped. All threads joined.\n";
}

void ArbitrageEngine::pushEvent(Event event) {
  evaluation_loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// onQuote(): one evaluation cycle
// -----------------------------------------------------------------------------
void ArbitrageEngine::onQuote(const QuoteEvent& quote) {
  auto now = clock_.now_ms();

  auto touched =
      pairs_->updateQuote(quote.symbol, quote.bid, quote.ask,
                          quote.timestamp_ms);

  auto new_signals = alpha_->update(touched, now);
  if (!new_signals.empty()) {
    signals_->add(new_signals);
    for (const auto& signal : new_signals) {
      publish(GridSignalEvent{signal});
    }
  }

  auto percent_targets = portfolio_->createTargets(now, new_signals);
  if (!percent_targets.empty()) {
    auto sized = sizer_->size(percent_targets, now);
    execution_->execute(sized);
  } else if (!targets_->empty()) {
    // Keep working targets left open by partial fills or rejected legs.
    execution_->execute({});
  }

  saveBackup();
  maybeReconcile(now);
}

// -----------------------------------------------------------------------------
// onOrderStatus(): grid position first, then the execution model
// -----------------------------------------------------------------------------
void ArbitrageEngine::onOrderStatus(const OrderStatusEvent& event) {
  auto update = pairs_->processGridOrderEvent(event);
  if (update) {
    publish(*update);
  }
  if (ipc_server_) {
    ipc_server_->pushTelemetry(event);
  }

  execution_->onOrderEvent(event);

  if (event.status == domain::OrderStatus::Rejected) {
    std::cerr << "[ArbitrageEngine] order " << event.order_id << " on '"
              << event.account << "' rejected: " << event.message << "\n";
  }
}

void ArbitrageEngine::onBrokerageMessage(const BrokerageMessageEvent& event) {
  auto& out = (event.type == BrokerageMessageType::Information ||
               event.type == BrokerageMessageType::Reconnect)
                  ? std::cout
                  : std::cerr;
  out << "[ArbitrageEngine] brokerage '" << event.account << "' "
      << toString(event.type) << " " << event.code << ": " << event.message
      << "\n";
  if (ipc_server_) {
    ipc_server_->pushTelemetry(event);
  }
}

void ArbitrageEngine::maybeReconcile(std::int64_t now_ms) {
  if (now_ms - last_reconcile_ms_ < config_.reconcile_interval_ms) {
    return;
  }
  last_reconcile_ms_ = now_ms;
  pairs_->compareBaseline(brokerages_.getAllHoldings(), &brokerages_);
}

bool ArbitrageEngine::saveBackup() {
  if (!backup_ || !pairs_) {
    return false;
  }
  auto doc = gridStateToJson(*pairs_, clock_.now_ms());
  return backup_->saveBackup(doc.dump());
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string ArbitrageEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["halted"] = execution_ ? execution_->halted() : false;
    response["connected"] = brokerages_.isConnected();
    response["accounts"] = brokerages_.accountNames();
    response["router"] = router_ ? router_->kind() : "";

    nlohmann::json pairs_json = nlohmann::json::array();
    if (pairs_) {
      for (const auto& pair : pairs_->pairs()) {
        pairs_json.push_back(pairToJson(*pair));
      }
    }
    response["pairs"] = std::move(pairs_json);

    nlohmann::json targets_json = nlohmann::json::array();
    if (targets_) {
      for (const auto& target : targets_->targets()) {
        nlohmann::json t;
        t["tag"] = target.tag;
        t["leg1_symbol"] = target.leg1_symbol;
        t["leg1_quantity"] = target.leg1_quantity;
        t["leg2_symbol"] = target.leg2_symbol;
        t["leg2_quantity"] = target.leg2_quantity;
        targets_json.push_back(std::move(t));
      }
    }
    response["targets"] = std::move(targets_json);
    response["open_orders"] = tracker_ ? tracker_->size() : 0;

    if (backup_) {
      auto stats = backup_->statistics();
      nlohmann::json b;
      for (const auto& [tier, count] : stats.counts) {
        b[tier] = count;
      }
      response["backups"] = std::move(b);
    }
  } else if (cmd == "HALT") {
    if (execution_) {
      execution_->halt();
    }
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (cmd == "RESUME") {
    if (execution_) {
      execution_->resume();
    }
    response["status"] = "ok";
    response["response"] = "Trading resumed";
  } else if (cmd == "BACKUP") {
    bool saved = saveBackup();
    response["status"] = "ok";
    response["response"] = saved ? "Backup saved" : "No backup due";
  } else if (cmd == "RECONCILE") {
    if (pairs_) {
      bool changed =
          pairs_->compareBaseline(brokerages_.getAllHoldings(), &brokerages_);
      response["status"] = "ok";
      response["response"] =
          changed ? "Discrepancy found, reconciled" : "Baseline unchanged";
    } else {
      response["status"] = "error";
      response["response"] = "Engine not running";
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace arb
