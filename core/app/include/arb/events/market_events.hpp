#pragma once

#include <cstdint>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// QuoteEvent
// -----------------------------------------------------------------------------
// Top-of-book update for one instrument. Produced by MarketDataGateway (or
// pushed directly by tests) and consumed on the evaluation loop, where it
// refreshes every TradingPair that trades the symbol.
// -----------------------------------------------------------------------------
struct QuoteEvent {
  std::string symbol;
  double bid{0.0};
  double ask{0.0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence_id{0};
};

}  // namespace arb
