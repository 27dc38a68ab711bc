#include "arb/execution/order_tracker.hpp"

#include <cmath>
#include <iostream>

namespace arb {

bool OrderTracker::transitionStatus(domain::OrderStatus current,
                                    domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::New:
      return next != S::New;

    case S::Submitted:
      return next == S::Accepted ||
             next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Rejected;

    case S::Accepted:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Rejected;

    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled;

    case S::Filled:
    case S::Canceled:
    case S::Rejected:
      return false;
  }

  return false;
}

void OrderTracker::track(const domain::Order& order) {
  domain::Order tracked = order;
  tracked.status = domain::OrderStatus::New;
  tracked.filled_quantity = 0.0;
  std::lock_guard lock(mutex_);
  orders_[tracked.id] = tracked;
}

void OrderTracker::hydrateOrder(const domain::Order& order) {
  std::lock_guard lock(mutex_);
  orders_[order.id] = order;
}

bool OrderTracker::remove(domain::OrderId id) {
  std::lock_guard lock(mutex_);
  return orders_.erase(id) > 0;
}

bool OrderTracker::onOrderStatus(const OrderStatusEvent& event) {
  std::lock_guard lock(mutex_);

  auto it = orders_.find(event.order_id);
  if (it == orders_.end() && !event.broker_order_id.empty()) {
    for (auto candidate = orders_.begin(); candidate != orders_.end();
         ++candidate) {
      if (candidate->second.broker_order_id == event.broker_order_id) {
        it = candidate;
        break;
      }
    }
  }
  if (it == orders_.end()) {
    std::cout << "[OrderTracker] status " << domain::toString(event.status)
              << " for untracked order " << event.order_id << " ("
              << event.broker_order_id << "), ignored\n";
    return false;
  }

  domain::Order& order = it->second;
  const domain::OrderStatus previous = order.status;

  if (previous == event.status &&
      event.status != domain::OrderStatus::PartiallyFilled) {
    return false;
  }
  if (!transitionStatus(previous, event.status)) {
    std::cerr << "[OrderTracker] WARNING: illegal transition for order "
              << order.id << " from " << domain::toString(previous) << " to "
              << domain::toString(event.status) << ", skipped\n";
    return false;
  }

  order.status = event.status;
  if (!event.broker_order_id.empty()) {
    order.broker_order_id = event.broker_order_id;
  }
  if (event.status == domain::OrderStatus::PartiallyFilled ||
      event.status == domain::OrderStatus::Filled) {
    order.filled_quantity += std::abs(event.fill_quantity);
  }

  if (domain::isTerminal(order.status)) {
    orders_.erase(it);
  }
  return true;
}

std::vector<domain::Order> OrderTracker::openOrders() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Order> out;
  out.reserve(orders_.size());
  for (const auto& [id, order] : orders_) {
    out.push_back(order);
  }
  return out;
}

double OrderTracker::openQuantity(const std::string& symbol,
                                  const std::string& tag) const {
  std::lock_guard lock(mutex_);
  double total = 0.0;
  for (const auto& [id, order] : orders_) {
    if (order.symbol == symbol && order.tag == tag) {
      total += order.signedRemaining();
    }
  }
  return total;
}

std::size_t OrderTracker::size() const {
  std::lock_guard lock(mutex_);
  return orders_.size();
}

}  // namespace arb
