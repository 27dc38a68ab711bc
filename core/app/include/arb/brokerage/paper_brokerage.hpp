#pragma once

#include "arb/brokerage/i_brokerage.hpp"
#include "arb/concurrent/order_id_generator.hpp"
#include "arb/eventbus/event_bus.hpp"
#include "arb/time/i_time_provider.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace arb {

struct PaperBrokerageOptions {
  // Fill market orders as soon as they are placed. When false, orders stay
  // working until fillOrder() or cancelOrder().
  bool auto_fill{true};
  std::string base_currency{"USDT"};
  double initial_cash{100000.0};
  // Fee charged on notional, in base currency.
  double fee_rate{0.0};
  // connect() throws; for exercising startup rollback.
  bool fail_connect{false};
};

// -----------------------------------------------------------------------------
// PaperBrokerage
// -----------------------------------------------------------------------------
//
// @brief  Simulated account: fills against the last quote it was given.
//
// @details
// Fill price for a market order is the last ask for buys and the last bid
// for sells. With no quote on record the order's reference price is used.
// An order with neither is rejected.
//
// Per placed order the brokerage publishes, in order:
//   OrderStatusEvent Submitted
//   OrderStatusEvent Filled (auto_fill) with a fresh execution id
//   AccountChangedEvent for the base currency
//
// Every fill is appended to the execution history, which makes this class
// its own IExecutionHistoryProvider.
//
// Thread model:
//   All state sits behind one mutex. Events are published after the mutex
//   is released, on the calling thread.
// -----------------------------------------------------------------------------
class PaperBrokerage : public IBrokerage, public IExecutionHistoryProvider {
 public:
  PaperBrokerage(std::string name, const ITimeProvider& time_provider,
                 PaperBrokerageOptions options = {});

  const std::string& name() const override { return name_; }

  void connect() override;
  void disconnect() override;
  bool isConnected() const override;

  bool placeOrder(domain::Order& order) override;
  bool updateOrder(const domain::Order& order) override;
  bool cancelOrder(const domain::Order& order) override;

  std::vector<domain::Order> getOpenOrders() override;
  std::vector<domain::CashAmount> getCashBalance() override;
  std::vector<domain::Holding> getAccountHoldings() override;

  EventBus& events() override { return bus_; }

  IExecutionHistoryProvider* executionHistory() override { return this; }

  std::vector<domain::ExecutionRecord> getExecutionHistory(
      std::int64_t start_ms, std::int64_t end_ms) override;

  // -------------------------------------------------------------------------
  // Simulation controls
  // -------------------------------------------------------------------------
  void updateQuote(const std::string& symbol, double bid, double ask);

  // Fills quantity (unsigned, capped at the remainder) of a working order.
  // Returns false for an unknown or finished order.
  bool fillOrder(const std::string& broker_order_id, double quantity,
                 double price);

  // Sets a holding directly, as if it had been transferred in.
  void setHolding(const std::string& symbol, double quantity,
                  double average_price);

 private:
  struct Fill {
    domain::ExecutionRecord record;
    OrderStatusEvent status;
    AccountChangedEvent account;
  };

  // Caller holds mutex_.
  Fill applyFillLocked(domain::Order& order, double quantity, double price);

  std::string name_;
  const ITimeProvider& time_provider_;
  PaperBrokerageOptions options_;
  EventBus bus_;

  OrderIdGenerator order_ids_;
  OrderIdGenerator execution_ids_;

  mutable std::mutex mutex_;
  bool connected_{false};
  std::map<std::string, domain::Order> open_orders_;  // by broker order id
  std::map<std::string, std::pair<double, double>> quotes_;  // bid, ask
  std::map<std::string, domain::Holding> holdings_;
  std::map<std::string, double> cash_;
  std::vector<domain::ExecutionRecord> history_;
};

}  // namespace arb
