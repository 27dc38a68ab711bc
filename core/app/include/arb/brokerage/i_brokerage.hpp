#pragma once

#include "arb/brokerage/i_execution_history_provider.hpp"
#include "arb/domain/account.hpp"
#include "arb/domain/order.hpp"
#include "arb/eventbus/event_bus.hpp"

#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// IBrokerage
// -----------------------------------------------------------------------------
//
// @brief  One connection to one trading account.
//
// @details
// Implementations own their transport and publish OrderStatusEvent,
// AccountChangedEvent, BrokerageMessageEvent and OptionAssignmentEvent on
// events(), from whatever thread their I/O runs on. They leave the
// `account` field of those events empty; MultiBrokerageManager stamps it.
//
// connect() may block and may throw. After it returns, isConnected() tells
// whether the connection actually came up.
//
// placeOrder() takes the order by reference so the venue id can be written
// back into broker_order_id. It returns false when the venue refused the
// request synchronously; asynchronous rejections arrive as events.
//
// executionHistory() exposes the optional history capability. The default
// returns nullptr ("not supported"); an implementation that can list past
// executions returns itself or a helper it owns.
// -----------------------------------------------------------------------------
class IBrokerage {
 public:
  virtual ~IBrokerage() = default;

  virtual const std::string& name() const = 0;

  virtual void connect() = 0;
  virtual void disconnect() = 0;
  virtual bool isConnected() const = 0;

  virtual bool placeOrder(domain::Order& order) = 0;
  virtual bool updateOrder(const domain::Order& order) = 0;
  virtual bool cancelOrder(const domain::Order& order) = 0;

  virtual std::vector<domain::Order> getOpenOrders() = 0;
  virtual std::vector<domain::CashAmount> getCashBalance() = 0;
  virtual std::vector<domain::Holding> getAccountHoldings() = 0;

  virtual EventBus& events() = 0;

  virtual IExecutionHistoryProvider* executionHistory() { return nullptr; }
};

}  // namespace arb
