#pragma once

#include "arb/domain/grid_level.hpp"

#include <cstdint>
#include <string>

namespace arb {

// Single-leg allocation: signed fraction of portfolio value for one symbol.
// Both targets built from one signal carry the same tag.
struct PortfolioTarget {
  std::string symbol;
  double percent{0.0};
  std::string tag;
};

// -----------------------------------------------------------------------------
// ArbitragePortfolioTarget
// -----------------------------------------------------------------------------
//
// @brief  Both legs of one grid level, in absolute grid-position quantities.
//
// @details
// leg*_quantity is where the grid position for tag should end up (not a
// delta). leg*_initial_quantity is what the position held when the target
// was sized; fulfillment compares the traded amount (current - initial)
// against the target delta (target - initial).
//
// level is the level the target came from: the entry level when opening,
// the exit level when flattening.
// -----------------------------------------------------------------------------
struct ArbitragePortfolioTarget {
  std::string tag;
  std::string leg1_symbol;
  std::string leg2_symbol;
  double leg1_quantity{0.0};
  double leg2_quantity{0.0};
  double leg1_initial_quantity{0.0};
  double leg2_initial_quantity{0.0};
  double leg1_lot_size{0.0};
  double leg2_lot_size{0.0};
  domain::GridLevel level;
  std::int64_t created_ms{0};

  bool operator==(const ArbitragePortfolioTarget& other) const {
    return tag == other.tag && leg1_symbol == other.leg1_symbol &&
           leg2_symbol == other.leg2_symbol &&
           leg1_quantity == other.leg1_quantity &&
           leg2_quantity == other.leg2_quantity &&
           leg1_initial_quantity == other.leg1_initial_quantity &&
           leg2_initial_quantity == other.leg2_initial_quantity &&
           leg1_lot_size == other.leg1_lot_size &&
           leg2_lot_size == other.leg2_lot_size && level == other.level &&
           created_ms == other.created_ms;
  }
  bool operator!=(const ArbitragePortfolioTarget& other) const {
    return !(*this == other);
  }

  // "[tag] leg1 BTCUSDT 0.50, leg2 BTC-PERP -0.50"
  std::string toString() const;
};

}  // namespace arb
