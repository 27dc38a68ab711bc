#pragma once

#include "arb/routing/i_order_router.hpp"

#include <map>
#include <string>

namespace arb {

// Routes by exact instrument symbol.
class SymbolBasedRouter : public IOrderRouter {
 public:
  SymbolBasedRouter(std::map<std::string, std::string> symbol_to_account,
                    std::string default_account);

  std::string route(const domain::Order& order) const override;
  void validate() const override;
  const char* kind() const override { return "symbol"; }

 private:
  std::map<std::string, std::string> symbol_to_account_;
  std::string default_account_;
};

}  // namespace arb
