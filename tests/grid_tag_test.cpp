// =============================================================================
// grid_tag_test.cpp
// =============================================================================
// Unit tests for GridLevel / GridLevelPair and the grid tag codec.
//
// Validates:
//   - GridLevelPair threshold validation per direction
//   - Exit level derivation (opposite direction, negated size)
//   - Level values are exact at four decimals
//   - Natural key format
//   - Tag encoding format and leg validation
//   - Decode of well-formed tags and rejection of malformed ones
// =============================================================================

#include "arb/domain/grid_level.hpp"
#include "arb/tag/grid_tag.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using arb::domain::GridLevelPair;
using arb::domain::LevelKind;
using arb::domain::SpreadDirection;

// -----------------------------------------------------------------------------
// 1. A LONG_SPREAD pair needs a negative entry and an exit above it.
// -----------------------------------------------------------------------------
TEST(GridLevelPairTest, LongSpreadValidation) {
  EXPECT_NO_THROW(GridLevelPair(-0.02, 0.01, SpreadDirection::LongSpread, 0.5));
  EXPECT_THROW(GridLevelPair(0.01, 0.02, SpreadDirection::LongSpread, 0.5),
               std::invalid_argument);
  EXPECT_THROW(GridLevelPair(-0.02, -0.03, SpreadDirection::LongSpread, 0.5),
               std::invalid_argument);
  EXPECT_THROW(GridLevelPair(-0.02, -0.02, SpreadDirection::LongSpread, 0.5),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 2. A SHORT_SPREAD pair needs a positive entry and an exit below it.
// -----------------------------------------------------------------------------
TEST(GridLevelPairTest, ShortSpreadValidation) {
  EXPECT_NO_THROW(
      GridLevelPair(0.03, -0.005, SpreadDirection::ShortSpread, 0.5));
  EXPECT_THROW(GridLevelPair(-0.01, -0.02, SpreadDirection::ShortSpread, 0.5),
               std::invalid_argument);
  EXPECT_THROW(GridLevelPair(0.03, 0.04, SpreadDirection::ShortSpread, 0.5),
               std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 3. The exit level flips direction and negates the size.
// -----------------------------------------------------------------------------
TEST(GridLevelPairTest, ExitLevelIsDerived) {
  GridLevelPair pair(-0.02, 0.01, SpreadDirection::LongSpread, 0.5);

  EXPECT_EQ(pair.entry().kind, LevelKind::Entry);
  EXPECT_EQ(pair.entry().direction, SpreadDirection::LongSpread);
  EXPECT_DOUBLE_EQ(pair.entry().position_size_pct, 0.5);

  EXPECT_EQ(pair.exit().kind, LevelKind::Exit);
  EXPECT_EQ(pair.exit().direction, SpreadDirection::ShortSpread);
  EXPECT_DOUBLE_EQ(pair.exit().spread_pct, 0.01);
  EXPECT_DOUBLE_EQ(pair.exit().position_size_pct, -0.5);
}

// -----------------------------------------------------------------------------
// 4. Values finer than four decimals are rejected; every accepted pair
//    decodes back to itself.
// Why: "-0.00004" would encode as "-0.0000" (not a long entry) and exit
//      "-0.01996" as "-0.0200" (equal to the entry), so the level could
//      never trade.
// -----------------------------------------------------------------------------
TEST(GridLevelPairTest, RejectsValuesFinerThanFourDecimals) {
  EXPECT_THROW(GridLevelPair(-0.00004, 0.01, SpreadDirection::LongSpread, 0.5),
               std::invalid_argument);
  EXPECT_THROW(GridLevelPair(-0.02, -0.01996, SpreadDirection::LongSpread, 0.5),
               std::invalid_argument);
  EXPECT_THROW(GridLevelPair(-0.02, 0.01, SpreadDirection::LongSpread, 0.12345),
               std::invalid_argument);

  try {
    GridLevelPair(-0.02, 0.01, SpreadDirection::LongSpread, 0.12345);
    FAIL() << "expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("position_size_pct"),
              std::string::npos);
  }

  const GridLevelPair accepted[] = {
      GridLevelPair(-0.0001, 0.0001, SpreadDirection::LongSpread, 0.0001),
      GridLevelPair(-0.0199, 0.0073, SpreadDirection::LongSpread, 0.1235),
      GridLevelPair(0.0315, -0.0085, SpreadDirection::ShortSpread, 1.25),
  };
  for (const auto& pair : accepted) {
    auto decoded =
        arb::tryDecodeGridTag(arb::encodeGridTag("BTC", "ETH", pair));
    ASSERT_TRUE(decoded.has_value()) << pair.toString();
    EXPECT_EQ(decoded->level_pair, pair) << pair.toString();
  }
}

TEST(GridLevelPairTest, NaturalKeyFormat) {
  GridLevelPair pair(-0.02, 0.01, SpreadDirection::LongSpread, 0.5);
  EXPECT_EQ(pair.entry().naturalKey(), "-0.0200|LONG_SPREAD|ENTRY");
  EXPECT_EQ(pair.exit().naturalKey(), "0.0100|SHORT_SPREAD|EXIT");
}

TEST(GridLevelPairTest, DirectionStringsParse) {
  EXPECT_TRUE(arb::domain::parseSpreadDirection("LONG_SPREAD") ==
              SpreadDirection::LongSpread);
  EXPECT_TRUE(arb::domain::parseSpreadDirection("SHORT_SPREAD") ==
              SpreadDirection::ShortSpread);
  EXPECT_FALSE(arb::domain::parseSpreadDirection("long_spread").has_value());
  EXPECT_TRUE(arb::domain::parseLevelKind("EXIT") == LevelKind::Exit);
  EXPECT_FALSE(arb::domain::parseLevelKind("").has_value());
}

// -----------------------------------------------------------------------------
// 5. Encoding: fixed field order, four decimals.
// -----------------------------------------------------------------------------
TEST(GridTagTest, EncodeFormat) {
  GridLevelPair pair(-0.02, 0.01, SpreadDirection::LongSpread, 0.5);
  EXPECT_EQ(arb::encodeGridTag("BTCUSDT", "BTC-PERP", pair),
            "v1|BTCUSDT|BTC-PERP|-0.0200|0.0100|LONG_SPREAD|0.5000");
}

TEST(GridTagTest, EncodeRejectsBadLegs) {
  GridLevelPair pair(-0.02, 0.01, SpreadDirection::LongSpread, 0.5);
  EXPECT_THROW(arb::encodeGridTag("", "B", pair), std::invalid_argument);
  EXPECT_THROW(arb::encodeGridTag("A", "", pair), std::invalid_argument);
  EXPECT_THROW(arb::encodeGridTag("A|X", "B", pair), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 6. Decode restores legs and an equal level pair; re-encoding is stable.
//    Why: every downstream stage recovers the pair from the tag alone.
// -----------------------------------------------------------------------------
TEST(GridTagTest, DecodeRestoresLegsAndLevels) {
  GridLevelPair pair(0.03, -0.005, SpreadDirection::ShortSpread, 0.25);
  auto tag = arb::encodeGridTag("TSLAX", "TSLA", pair);

  auto decoded = arb::tryDecodeGridTag(tag);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->leg1, "TSLAX");
  EXPECT_EQ(decoded->leg2, "TSLA");
  EXPECT_EQ(decoded->level_pair, pair);
  EXPECT_EQ(arb::encodeGridTag(decoded->leg1, decoded->leg2,
                               decoded->level_pair),
            tag);
}

TEST(GridTagTest, LegOrderMatters) {
  GridLevelPair pair(-0.02, 0.01, SpreadDirection::LongSpread, 0.5);
  EXPECT_NE(arb::encodeGridTag("A", "B", pair),
            arb::encodeGridTag("B", "A", pair));
}

// -----------------------------------------------------------------------------
// 7. Malformed tags decode to nullopt and never throw.
// -----------------------------------------------------------------------------
TEST(GridTagTest, MalformedTagsFailDecode) {
  const char* bad[] = {
      "",
      "manual-order",
      "v2|A|B|-0.0200|0.0100|LONG_SPREAD|0.5000",   // version
      "v1|A|B|-0.0200|0.0100|LONG_SPREAD",          // 6 fields
      "v1|A|B|-0.0200|0.0100|LONG_SPREAD|0.5|x",    // 8 fields
      "v1||B|-0.0200|0.0100|LONG_SPREAD|0.5000",    // empty leg
      "v1|A|B|abc|0.0100|LONG_SPREAD|0.5000",       // number
      "v1|A|B|-0.0200|0.0100|SIDEWAYS|0.5000",      // direction
      "v1|A|B|0.0200|0.0100|LONG_SPREAD|0.5000",    // invalid level pair
      "v1|A|B|-0.0200|0.0100|LONG_SPREAD|0.5000 ",  // trailing space
      "v1|A|B|-0.0200|0.0100|LONG_SPREAD|0.12345",  // five decimals
  };
  for (const char* tag : bad) {
    EXPECT_FALSE(arb::tryDecodeGridTag(tag).has_value()) << tag;
  }
}
