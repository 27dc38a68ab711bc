#pragma once

#include "arb/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace arb {
namespace domain {

using OrderId = std::uint64_t;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Market,
  Limit,
};

// Asset class of an instrument; used by SecurityTypeRouter.
enum class SecurityType {
  Crypto,
  CryptoFuture,
  Equity,
  Future,
  Option,
  Forex,
};

const char* toString(Side side);
const char* toString(OrderType type);
const char* toString(SecurityType type);

// Case-insensitive ("crypto_future" and "CryptoFuture" both parse).
std::optional<SecurityType> parseSecurityType(const std::string& text);

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  One single-leg order instruction.
//
// @details
// quantity is always positive; side carries the sign. signedQuantity() and
// signedRemaining() give the Lean-style signed view that position math
// works with.
//
// tag is the encoded grid tag of the spread decision the order belongs to.
// It is how fills find their way back to the owning GridPosition, and how
// open-order quantity is attributed to one grid level and not another level
// trading the same instrument.
//
// market and security_type exist for routing; account is filled in by the
// router before the order reaches MultiBrokerageManager.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id{};                 // Engine-assigned id
  std::string broker_order_id;  // Venue-assigned id, set on acceptance
  std::string symbol;
  std::string market;
  SecurityType security_type{SecurityType::Crypto};
  Side side{Side::Buy};
  OrderType type{OrderType::Market};
  double quantity{0.0};
  double price{0.0};            // Limit price, or reference price for market
  OrderStatus status{OrderStatus::New};
  double filled_quantity{0.0};  // Cumulative, unsigned
  std::string tag;
  std::string account;
  std::int64_t created_ms{0};

  double signedQuantity() const {
    return side == Side::Buy ? quantity : -quantity;
  }

  double signedRemaining() const {
    double remaining = quantity - filled_quantity;
    if (remaining < 0.0) {
      remaining = 0.0;
    }
    return side == Side::Buy ? remaining : -remaining;
  }
};

}  // namespace domain
}  // namespace arb
