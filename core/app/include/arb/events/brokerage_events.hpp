#pragma once

#include "arb/domain/order.hpp"
#include "arb/domain/order_status.hpp"

#include <cstdint>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// Brokerage events
// -----------------------------------------------------------------------------
//
// @brief  The four event kinds a brokerage connection raises.
//
// @details
// Each connection publishes these on its own EventBus, from its own I/O
// thread. MultiBrokerageManager re-publishes every one of them on its
// aggregate bus with `account` set to the name the connection was
// registered under, so downstream subscribers see a single stream and can
// still tell accounts apart.
//
// All four are plain data with value semantics; copying them across
// threads through Event is safe.
// -----------------------------------------------------------------------------

// Order lifecycle change. For fills, fill_quantity is the signed quantity
// of this execution only (not cumulative) and execution_id is the venue's
// unique id for it, used to drop duplicates.
struct OrderStatusEvent {
  std::string account;
  domain::OrderId order_id{};
  std::string broker_order_id;
  std::string symbol;
  std::string market;
  domain::OrderStatus status{domain::OrderStatus::New};
  double fill_quantity{0.0};
  double fill_price{0.0};
  std::string execution_id;
  std::string tag;
  std::string message;
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

struct AccountChangedEvent {
  std::string account;
  std::string currency;
  double cash_balance{0.0};
  std::int64_t timestamp_ms{0};
};

enum class BrokerageMessageType {
  Information,
  Warning,
  Error,
  Disconnect,
  Reconnect,
};

struct BrokerageMessageEvent {
  std::string account;
  BrokerageMessageType type{BrokerageMessageType::Information};
  std::string code;
  std::string message;
  std::int64_t timestamp_ms{0};
};

struct OptionAssignmentEvent {
  std::string account;
  std::string symbol;
  double quantity{0.0};
  std::int64_t timestamp_ms{0};
};

inline const char* toString(BrokerageMessageType type) {
  switch (type) {
    case BrokerageMessageType::Information: return "Information";
    case BrokerageMessageType::Warning:     return "Warning";
    case BrokerageMessageType::Error:       return "Error";
    case BrokerageMessageType::Disconnect:  return "Disconnect";
    case BrokerageMessageType::Reconnect:   return "Reconnect";
  }
  return "Unknown";
}

}  // namespace arb
