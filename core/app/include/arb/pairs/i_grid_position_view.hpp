#pragma once

#include <optional>
#include <string>

namespace arb {

struct LegQuantities {
  double leg1{0.0};
  double leg2{0.0};
};

// Read-only access to grid position quantities by tag, for components that
// must not reach into TradingPairManager (the target ledger and the
// execution model). Returns std::nullopt when the tag does not decode or
// names an unknown pair. A known pair without a position for the tag's
// level reports zero on both legs.
class IGridPositionView {
 public:
  virtual ~IGridPositionView() = default;

  virtual std::optional<LegQuantities> gridQuantities(
      const std::string& tag) const = 0;
};

}  // namespace arb
