#pragma once

#include "arb/routing/i_order_router.hpp"

#include <map>
#include <string>

namespace arb {

// Routes by asset class, e.g. spot crypto to one venue, equities to another.
class SecurityTypeRouter : public IOrderRouter {
 public:
  SecurityTypeRouter(std::map<domain::SecurityType, std::string> type_to_account,
                     std::string default_account);

  std::string route(const domain::Order& order) const override;
  void validate() const override;
  const char* kind() const override { return "security_type"; }

 private:
  std::map<domain::SecurityType, std::string> type_to_account_;
  std::string default_account_;
};

}  // namespace arb
