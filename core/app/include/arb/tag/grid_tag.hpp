#pragma once

#include "arb/domain/grid_level.hpp"

#include <optional>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// Grid tag codec
// -----------------------------------------------------------------------------
//
// @brief  Encodes a two-leg spread decision into one portable string.
//
// @details
// A signal, an allocation target and an order each concern one instrument.
// The tag is what lets any of them recover the full two-leg context without
// access to the TradingPair that produced it:
//
//     v1|{leg1}|{leg2}|{entry:F4}|{exit:F4}|{direction}|{size:F4}
//
//     v1|BTCUSDT|BTC-PERP|-0.0200|0.0100|LONG_SPREAD|0.5000
//
// Numbers use four fixed decimals in the "C" locale. Legs keep their order;
// swapping legs yields a different tag. Thresholds and sizes with at most
// four decimals round-trip exactly, and for every well-formed tag
// encode(decode(tag)) == tag.
//
// Thread model: stateless free functions, safe from any thread.
// -----------------------------------------------------------------------------

inline constexpr const char* kGridTagVersion = "v1";

struct DecodedGridTag {
  std::string leg1;
  std::string leg2;
  domain::GridLevelPair level_pair;
};

// -----------------------------------------------------------------------------
// encodeGridTag(leg1, leg2, level_pair)
// -----------------------------------------------------------------------------
// @throws std::invalid_argument if a leg id is empty or contains '|'.
// -----------------------------------------------------------------------------
std::string encodeGridTag(const std::string& leg1, const std::string& leg2,
                          const domain::GridLevelPair& level_pair);

// -----------------------------------------------------------------------------
// tryDecodeGridTag(tag)
// -----------------------------------------------------------------------------
// Returns std::nullopt for anything that is not a well-formed v1 tag:
// wrong field count or version, empty legs, unparsable numbers, unknown
// direction, or thresholds that GridLevelPair would reject. Never throws.
// -----------------------------------------------------------------------------
std::optional<DecodedGridTag> tryDecodeGridTag(const std::string& tag) noexcept;

}  // namespace arb
