#pragma once

#include "arb/brokerage/i_brokerage.hpp"
#include "arb/brokerage/i_execution_history_provider.hpp"
#include "arb/concurrent/concurrent_map.hpp"
#include "arb/eventbus/event_bus.hpp"

#include <memory>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// MultiBrokerageManager
// -----------------------------------------------------------------------------
//
// @brief  Fans orders out to N named brokerage connections and fans their
//         events back in on one bus.
//
// @details
// Registry:
//   Each connection is registered under an account name (the brokerage's
//   name()). Names are unique and non-empty. The history capability is
//   resolved once at registration and kept beside the connection.
//
// Connection lifecycle:
//   connectAll() connects every registered brokerage. If any throws or is
//   not connected afterwards, ALL brokerages are disconnected and
//   std::runtime_error is thrown listing the failed accounts. A partially
//   connected set is never left behind.
//
// Orders:
//   placeOrder / updateOrder / cancelOrder / getOpenOrders take the account
//   name. Any exception from the brokerage, or an unknown account, is
//   logged and reported as false (or an empty list); it never reaches the
//   caller and never touches other accounts. The overloads without an
//   account name throw std::logic_error: there is no default account.
//
// Events:
//   Every event from every connection is re-published on events() with
//   `account` set. Publishing happens on the connection's own thread; the
//   aggregate bus copies its subscriber list before dispatch, so one
//   connection's events never wait on another's.
//
// Thread model:
//   The registry is a ConcurrentMap; no lock is held while a brokerage is
//   called.
// -----------------------------------------------------------------------------
class MultiBrokerageManager : public IExecutionHistoryProvider {
 public:
  MultiBrokerageManager() = default;
  ~MultiBrokerageManager() override;

  MultiBrokerageManager(const MultiBrokerageManager&) = delete;
  MultiBrokerageManager& operator=(const MultiBrokerageManager&) = delete;

  // @throws std::invalid_argument for a null brokerage, an empty name or a
  //         name that is already registered.
  void addBrokerage(std::shared_ptr<IBrokerage> brokerage);

  bool removeBrokerage(const std::string& account);

  // @throws std::out_of_range if account is not registered.
  std::shared_ptr<IBrokerage> getBrokerage(const std::string& account) const;

  std::vector<std::string> accountNames() const;
  std::size_t size() const { return entries_.size(); }

  void connectAll();
  void disconnectAll();

  // True when at least one brokerage is registered and all are connected.
  bool isConnected() const;

  // -------------------------------------------------------------------------
  // Per-account operations
  // -------------------------------------------------------------------------
  bool placeOrder(const std::string& account, domain::Order& order);
  bool updateOrder(const std::string& account, const domain::Order& order);
  bool cancelOrder(const std::string& account, const domain::Order& order);
  std::vector<domain::Order> getOpenOrders(const std::string& account);

  // Rejected: multi-account mode has no implicit account.
  bool placeOrder(domain::Order& order);
  bool updateOrder(const domain::Order& order);
  bool cancelOrder(const domain::Order& order);
  std::vector<domain::Order> getOpenOrders();

  // -------------------------------------------------------------------------
  // Aggregated queries
  // -------------------------------------------------------------------------
  std::vector<domain::Order> getAllOpenOrders();
  std::vector<domain::CashAmount> getAllCashBalances();
  std::vector<domain::Holding> getAllHoldings();

  // Concatenates every connection that supports history. Connections
  // without the capability are skipped with a log line.
  std::vector<domain::ExecutionRecord> getExecutionHistory(
      std::int64_t start_ms, std::int64_t end_ms) override;

  EventBus& events() { return bus_; }

 private:
  struct Entry {
    std::shared_ptr<IBrokerage> brokerage;
    IExecutionHistoryProvider* history{nullptr};
    EventBus::SubscriptionId subscription{0};
  };

  void forward(const std::string& account, const Event& event);

  ConcurrentMap<std::string, Entry> entries_;
  EventBus bus_;
};

}  // namespace arb
