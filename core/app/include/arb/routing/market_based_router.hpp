#pragma once

#include "arb/routing/i_order_router.hpp"

#include <map>
#include <string>

namespace arb {

// Routes by Order::market. Market names compare case-insensitively
// ("Gate" and "gate" are the same market).
class MarketBasedRouter : public IOrderRouter {
 public:
  MarketBasedRouter(const std::map<std::string, std::string>& market_to_account,
                    std::string default_account);

  std::string route(const domain::Order& order) const override;
  void validate() const override;
  const char* kind() const override { return "market"; }

 private:
  std::map<std::string, std::string> market_to_account_;  // lower-cased keys
  std::string default_account_;
};

}  // namespace arb
