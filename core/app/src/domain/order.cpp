#include "arb/domain/order.hpp"

#include <algorithm>
#include <cctype>

namespace arb {
namespace domain {

const char* toString(Side side) {
  switch (side) {
    case Side::Buy:  return "Buy";
    case Side::Sell: return "Sell";
  }
  return "Unknown";
}

const char* toString(OrderType type) {
  switch (type) {
    case OrderType::Market: return "Market";
    case OrderType::Limit:  return "Limit";
  }
  return "Unknown";
}

const char* toString(SecurityType type) {
  switch (type) {
    case SecurityType::Crypto:       return "Crypto";
    case SecurityType::CryptoFuture: return "CryptoFuture";
    case SecurityType::Equity:       return "Equity";
    case SecurityType::Future:       return "Future";
    case SecurityType::Option:       return "Option";
    case SecurityType::Forex:        return "Forex";
  }
  return "Unknown";
}

std::optional<SecurityType> parseSecurityType(const std::string& text) {
  // Normalize: lower-case, drop '_' so snake_case and CamelCase both match.
  std::string key;
  key.reserve(text.size());
  for (char c : text) {
    if (c == '_') {
      continue;
    }
    key.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (key == "crypto")       return SecurityType::Crypto;
  if (key == "cryptofuture") return SecurityType::CryptoFuture;
  if (key == "equity")       return SecurityType::Equity;
  if (key == "future")       return SecurityType::Future;
  if (key == "option")       return SecurityType::Option;
  if (key == "forex")        return SecurityType::Forex;
  return std::nullopt;
}

}  // namespace domain
}  // namespace arb
