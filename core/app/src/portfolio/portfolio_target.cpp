#include "arb/portfolio/portfolio_target.hpp"

#include <cstdio>

namespace arb {

std::string ArbitragePortfolioTarget::toString() const {
  char quantities[96];
  std::snprintf(quantities, sizeof(quantities), "%.2f, leg2 ", leg1_quantity);
  std::string out = "[" + tag + "] leg1 " + leg1_symbol + " " + quantities +
                    leg2_symbol + " ";
  std::snprintf(quantities, sizeof(quantities), "%.2f", leg2_quantity);
  return out + quantities;
}

}  // namespace arb
