#pragma once

#include "arb/domain/order.hpp"

#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// IOrderRouter
// -----------------------------------------------------------------------------
//
// @brief  Policy mapping an order to the name of the account that trades it.
//
// @details
// route() is a pure function of the order: no state changes, no I/O, same
// answer every time for the same order. Every policy has a default account
// it falls back to when nothing more specific matches.
//
// validate() must be called once before the first route(); ArbitrageEngine
// does so in start(). It throws std::invalid_argument naming the problem
// (empty mapping table, empty default account).
//
// Thread model: route() may be called from any thread once validated.
// -----------------------------------------------------------------------------
class IOrderRouter {
 public:
  virtual ~IOrderRouter() = default;

  virtual std::string route(const domain::Order& order) const = 0;

  virtual void validate() const = 0;

  // Short policy name for logs and STATUS ("market", "symbol", ...).
  virtual const char* kind() const = 0;
};

}  // namespace arb
