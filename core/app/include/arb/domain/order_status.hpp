#pragma once

namespace arb {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus
// -----------------------------------------------------------------------------
//
// @brief  Lifecycle of an order as reported by a brokerage connection.
//
// @details
//   New              built by the execution model, not yet submitted
//   Submitted        handed to a brokerage, awaiting acknowledgment
//   Accepted         acknowledged and working on the venue
//   PartiallyFilled  some quantity filled, remainder still working
//   Filled           terminal
//   Canceled         terminal
//   Rejected         terminal
//
// Only PartiallyFilled and Filled change grid position quantities. Every
// other status only affects the set of live order tickets.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  New,
  Submitted,
  Accepted,
  PartiallyFilled,
  Filled,
  Canceled,
  Rejected,
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled || status == OrderStatus::Canceled ||
         status == OrderStatus::Rejected;
}

inline bool isOpen(OrderStatus status) { return !isTerminal(status); }

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::New:             return "New";
    case OrderStatus::Submitted:       return "Submitted";
    case OrderStatus::Accepted:        return "Accepted";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Canceled:        return "Canceled";
    case OrderStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace arb
