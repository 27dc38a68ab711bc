#include "arb/brokerage/paper_brokerage.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace arb {

PaperBrokerage::PaperBrokerage(std::string name,
                               const ITimeProvider& time_provider,
                               PaperBrokerageOptions options)
    : name_(std::move(name)),
      time_provider_(time_provider),
      options_(std::move(options)) {
  cash_[options_.base_currency] = options_.initial_cash;
}

void PaperBrokerage::connect() {
  if (options_.fail_connect) {
    throw std::runtime_error("PaperBrokerage '" + name_ +
                             "': simulated connect failure");
  }
  std::lock_guard lock(mutex_);
  connected_ = true;
}

void PaperBrokerage::disconnect() {
  std::lock_guard lock(mutex_);
  connected_ = false;
}

bool PaperBrokerage::isConnected() const {
  std::lock_guard lock(mutex_);
  return connected_;
}

// -----------------------------------------------------------------------------
// placeOrder
// -----------------------------------------------------------------------------
bool PaperBrokerage::placeOrder(domain::Order& order) {
  const std::int64_t now = time_provider_.now_ms();
  std::vector<Event> events;
  bool accepted = false;

  {
    std::lock_guard lock(mutex_);
    if (!connected_) {
      std::cerr << "[PaperBrokerage:" << name_
                << "] ERROR: placeOrder while disconnected\n";
      return false;
    }
    if (!(order.quantity > 0.0)) {
      std::cerr << "[PaperBrokerage:" << name_
                << "] ERROR: non-positive quantity for order " << order.id
                << "\n";
      return false;
    }

    order.broker_order_id = order_ids_.next_string(name_ + "-o-");
    order.status = domain::OrderStatus::Submitted;

    OrderStatusEvent submitted;
    submitted.order_id = order.id;
    submitted.broker_order_id = order.broker_order_id;
    submitted.symbol = order.symbol;
    submitted.market = order.market;
    submitted.status = domain::OrderStatus::Submitted;
    submitted.tag = order.tag;
    submitted.timestamp_ms = now;

    double price = order.price;
    auto quote = quotes_.find(order.symbol);
    if (order.type == domain::OrderType::Market && quote != quotes_.end()) {
      price = order.side == domain::Side::Buy ? quote->second.second
                                              : quote->second.first;
    }

    if (!(price > 0.0)) {
      submitted.status = domain::OrderStatus::Rejected;
      submitted.message = "no price available";
      events.push_back(submitted);
    } else {
      events.push_back(submitted);
      auto& stored = open_orders_[order.broker_order_id];
      stored = order;
      accepted = true;

      if (options_.auto_fill) {
        Fill fill = applyFillLocked(stored, stored.quantity, price);
        order.status = stored.status;
        order.filled_quantity = stored.filled_quantity;
        events.push_back(fill.status);
        events.push_back(fill.account);
        open_orders_.erase(order.broker_order_id);
      }
    }
  }

  for (const auto& event : events) {
    bus_.publish(event);
  }
  return accepted;
}

bool PaperBrokerage::updateOrder(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  auto it = open_orders_.find(order.broker_order_id);
  if (it == open_orders_.end()) {
    return false;
  }
  if (order.quantity < it->second.filled_quantity) {
    return false;
  }
  it->second.quantity = order.quantity;
  it->second.price = order.price;
  return true;
}

bool PaperBrokerage::cancelOrder(const domain::Order& order) {
  OrderStatusEvent canceled;
  {
    std::lock_guard lock(mutex_);
    auto it = open_orders_.find(order.broker_order_id);
    if (it == open_orders_.end()) {
      return false;
    }
    canceled.order_id = it->second.id;
    canceled.broker_order_id = it->first;
    canceled.symbol = it->second.symbol;
    canceled.market = it->second.market;
    canceled.status = domain::OrderStatus::Canceled;
    canceled.tag = it->second.tag;
    canceled.timestamp_ms = time_provider_.now_ms();
    open_orders_.erase(it);
  }
  bus_.publish(canceled);
  return true;
}

bool PaperBrokerage::fillOrder(const std::string& broker_order_id,
                               double quantity, double price) {
  std::vector<Event> events;
  {
    std::lock_guard lock(mutex_);
    auto it = open_orders_.find(broker_order_id);
    if (it == open_orders_.end()) {
      return false;
    }
    double remaining = it->second.quantity - it->second.filled_quantity;
    Fill fill = applyFillLocked(it->second, std::min(quantity, remaining),
                                price);
    events.push_back(fill.status);
    events.push_back(fill.account);
    if (domain::isTerminal(it->second.status)) {
      open_orders_.erase(it);
    }
  }
  for (const auto& event : events) {
    bus_.publish(event);
  }
  return true;
}

PaperBrokerage::Fill PaperBrokerage::applyFillLocked(domain::Order& order,
                                                     double quantity,
                                                     double price) {
  const std::int64_t now = time_provider_.now_ms();
  const double signed_qty =
      order.side == domain::Side::Buy ? quantity : -quantity;
  const double fee = std::abs(quantity * price) * options_.fee_rate;

  order.filled_quantity += quantity;
  order.status = order.filled_quantity + 1e-12 >= order.quantity
                     ? domain::OrderStatus::Filled
                     : domain::OrderStatus::PartiallyFilled;

  auto& holding = holdings_[order.symbol];
  holding.symbol = order.symbol;
  double new_qty = holding.quantity + signed_qty;
  if (new_qty == 0.0) {
    holding.average_price = 0.0;
  } else if ((holding.quantity >= 0.0) == (signed_qty >= 0.0)) {
    holding.average_price =
        (holding.average_price * holding.quantity + price * signed_qty) /
        new_qty;
  } else if ((new_qty > 0.0) != (holding.quantity > 0.0)) {
    // Flipped through zero: the remainder was opened at this price.
    holding.average_price = price;
  }
  holding.quantity = new_qty;

  double& cash = cash_[options_.base_currency];
  cash -= signed_qty * price + fee;

  Fill fill;
  fill.record.execution_id = execution_ids_.next_string(name_ + "-x-");
  fill.record.symbol = order.symbol;
  fill.record.market = order.market;
  fill.record.quantity = signed_qty;
  fill.record.price = price;
  fill.record.time_ms = now;
  fill.record.tag = order.tag;
  fill.record.fee = fee;
  fill.record.fee_currency = options_.base_currency;
  fill.record.broker_order_id = order.broker_order_id;
  history_.push_back(fill.record);

  fill.status.order_id = order.id;
  fill.status.broker_order_id = order.broker_order_id;
  fill.status.symbol = order.symbol;
  fill.status.market = order.market;
  fill.status.status = order.status;
  fill.status.fill_quantity = signed_qty;
  fill.status.fill_price = price;
  fill.status.execution_id = fill.record.execution_id;
  fill.status.tag = order.tag;
  fill.status.timestamp_ms = now;

  fill.account.currency = options_.base_currency;
  fill.account.cash_balance = cash;
  fill.account.timestamp_ms = now;
  return fill;
}

std::vector<domain::Order> PaperBrokerage::getOpenOrders() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> out;
  for (const auto& [id, order] : open_orders_) {
    out.push_back(order);
  }
  return out;
}

std::vector<domain::CashAmount> PaperBrokerage::getCashBalance() {
  std::lock_guard lock(mutex_);
  std::vector<domain::CashAmount> out;
  for (const auto& [currency, amount] : cash_) {
    out.push_back(domain::CashAmount{currency, amount, name_});
  }
  return out;
}

std::vector<domain::Holding> PaperBrokerage::getAccountHoldings() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Holding> out;
  for (const auto& [symbol, holding] : holdings_) {
    if (holding.quantity != 0.0) {
      out.push_back(holding);
      out.back().account = name_;
    }
  }
  return out;
}

std::vector<domain::ExecutionRecord> PaperBrokerage::getExecutionHistory(
    std::int64_t start_ms, std::int64_t end_ms) {
  std::lock_guard lock(mutex_);
  std::vector<domain::ExecutionRecord> out;
  for (const auto& record : history_) {
    if (record.time_ms >= start_ms && record.time_ms <= end_ms) {
      out.push_back(record);
    }
  }
  return out;
}

void PaperBrokerage::updateQuote(const std::string& symbol, double bid,
                                 double ask) {
  std::lock_guard lock(mutex_);
  quotes_[symbol] = {bid, ask};
}

void PaperBrokerage::setHolding(const std::string& symbol, double quantity,
                                double average_price) {
  std::lock_guard lock(mutex_);
  auto& holding = holdings_[symbol];
  holding.symbol = symbol;
  holding.quantity = quantity;
  holding.average_price = average_price;
}

}  // namespace arb
