#pragma once

#include "arb/routing/i_order_router.hpp"

#include <string>

namespace arb {

// Sends everything to one account. The single-venue setup.
class SimpleOrderRouter : public IOrderRouter {
 public:
  explicit SimpleOrderRouter(std::string account);

  std::string route(const domain::Order& order) const override;
  void validate() const override;
  const char* kind() const override { return "simple"; }

 private:
  std::string account_;
};

}  // namespace arb
