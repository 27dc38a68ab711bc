#pragma once

#include "arb/domain/order.hpp"
#include "arb/domain/order_status.hpp"
#include "arb/events/brokerage_events.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// OrderTracker: lifecycle state machine and in-flight order book
// -----------------------------------------------------------------------------
//
// @brief  Holds every order the execution model has sent until its status
//         reaches a terminal state.
//
// @details
// Brokerage events reach the evaluation loop through a queue, so an order
// can be placed (and even filled on the venue) well before the engine sees
// its fill. Until then the grid position does not show the quantity, and
// only the tracker knows it is in flight. The execution model subtracts the
// tracker's open quantity per (symbol, tag) from what it still has to
// trade, which is what prevents a second order for the same target.
//
// Orders are registered with track() before they are handed to the
// brokerage, in status New. onOrderStatus() then advances them:
//
//   New             -> Submitted, Accepted, PartiallyFilled, Filled,
//                      Canceled, Rejected
//   Submitted       -> Accepted, PartiallyFilled, Filled, Canceled, Rejected
//   Accepted        -> PartiallyFilled, Filled, Canceled, Rejected
//   PartiallyFilled -> PartiallyFilled, Filled, Canceled
//   Filled / Canceled / Rejected -> (none)
//
// Illegal transitions are logged and ignored. A repeated status (other than
// PartiallyFilled) is ignored silently. Terminal orders are erased.
//
// Orders are matched by engine order id, falling back to the venue order
// id for orders restored with hydrateOrder() after a restart.
//
// Thread model:
//   Mutated on the evaluation loop; read by the IPC thread for STATUS.
//   One mutex; readers get copies.
// -----------------------------------------------------------------------------
class OrderTracker {
 public:
  OrderTracker() = default;

  OrderTracker(const OrderTracker&) = delete;
  OrderTracker& operator=(const OrderTracker&) = delete;

  // Registers an order about to be placed. Status is forced to New and the
  // filled quantity to 0.
  void track(const domain::Order& order);

  // Injects an order that was already working on a venue (startup only).
  // The venue's status is taken as is.
  void hydrateOrder(const domain::Order& order);

  // Drops an order whose placement failed. Returns false if unknown.
  bool remove(domain::OrderId id);

  // Returns true if the event changed a tracked order.
  bool onOrderStatus(const OrderStatusEvent& event);

  std::vector<domain::Order> openOrders() const;

  // Signed remaining quantity of tracked orders on symbol carrying tag.
  double openQuantity(const std::string& symbol, const std::string& tag) const;

  std::size_t size() const;

  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

 private:
  mutable std::mutex mutex_;
  std::map<domain::OrderId, domain::Order> orders_;
};

}  // namespace arb
