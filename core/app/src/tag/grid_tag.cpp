#include "arb/tag/grid_tag.hpp"

#include <cctype>
#include <cmath>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace arb {

namespace {

constexpr char kSeparator = '|';
constexpr std::size_t kFieldCount = 7;

std::vector<std::string> split(const std::string& text, char separator) {
  std::vector<std::string> parts;
  std::string::size_type start = 0;
  while (true) {
    auto pos = text.find(separator, start);
    if (pos == std::string::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

// Whole-string, locale-independent, finite.
std::optional<double> parseNumber(const std::string& text) {
  if (text.empty() || std::isspace(static_cast<unsigned char>(text[0]))) {
    return std::nullopt;
  }
  std::istringstream in(text);
  in.imbue(std::locale::classic());
  double value = 0.0;
  in >> value;
  if (in.fail() || !in.eof() || !std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

void checkLeg(const std::string& leg, const char* name) {
  if (leg.empty()) {
    throw std::invalid_argument(std::string("encodeGridTag: ") + name +
                                " must not be empty");
  }
  if (leg.find(kSeparator) != std::string::npos) {
    throw std::invalid_argument(std::string("encodeGridTag: ") + name +
                                " must not contain '|': " + leg);
  }
}

}  // namespace

std::string encodeGridTag(const std::string& leg1, const std::string& leg2,
                          const domain::GridLevelPair& level_pair) {
  checkLeg(leg1, "leg1");
  checkLeg(leg2, "leg2");

  std::string tag;
  tag.reserve(64);
  tag += kGridTagVersion;
  tag += kSeparator;
  tag += leg1;
  tag += kSeparator;
  tag += leg2;
  tag += kSeparator;
  tag += domain::formatFixed4(level_pair.entry().spread_pct);
  tag += kSeparator;
  tag += domain::formatFixed4(level_pair.exit().spread_pct);
  tag += kSeparator;
  tag += domain::toString(level_pair.direction());
  tag += kSeparator;
  tag += domain::formatFixed4(level_pair.entry().position_size_pct);
  return tag;
}

std::optional<DecodedGridTag> tryDecodeGridTag(const std::string& tag) noexcept {
  try {
    if (tag.empty()) {
      return std::nullopt;
    }

    auto parts = split(tag, kSeparator);
    if (parts.size() != kFieldCount || parts[0] != kGridTagVersion) {
      return std::nullopt;
    }
    if (parts[1].empty() || parts[2].empty()) {
      return std::nullopt;
    }

    auto entry = parseNumber(parts[3]);
    auto exit = parseNumber(parts[4]);
    auto direction = domain::parseSpreadDirection(parts[5]);
    auto size = parseNumber(parts[6]);
    if (!entry || !exit || !direction || !size) {
      return std::nullopt;
    }

    // The constructor re-applies the threshold rules; a tag describing an
    // impossible level pair is malformed, not a configuration error.
    domain::GridLevelPair level_pair(*entry, *exit, *direction, *size);
    return DecodedGridTag{parts[1], parts[2], level_pair};
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace arb
