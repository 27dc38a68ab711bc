#include "arb/routing/market_based_router.hpp"
#include "arb/routing/security_type_router.hpp"
#include "arb/routing/simple_order_router.hpp"
#include "arb/routing/symbol_based_router.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace arb {

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

void requireDefault(const std::string& account, const char* router) {
  if (account.empty()) {
    throw std::invalid_argument(std::string(router) +
                                ": default_account must not be empty");
  }
}

template <typename Map>
void requireMappings(const Map& mappings, const char* router) {
  if (mappings.empty()) {
    throw std::invalid_argument(std::string(router) +
                                ": mapping table must not be empty");
  }
  for (const auto& [key, account] : mappings) {
    if (account.empty()) {
      throw std::invalid_argument(std::string(router) +
                                  ": mapping has an empty account name");
    }
  }
}

void logFallback(const char* router, const domain::Order& order,
                 const std::string& account) {
  std::cout << "[" << router << "] no route for " << order.symbol << " ("
            << order.market << "), using default account '" << account
            << "'\n";
}

}  // namespace

// -----------------------------------------------------------------------------
// MarketBasedRouter
// -----------------------------------------------------------------------------

MarketBasedRouter::MarketBasedRouter(
    const std::map<std::string, std::string>& market_to_account,
    std::string default_account)
    : default_account_(std::move(default_account)) {
  for (const auto& [market, account] : market_to_account) {
    market_to_account_[toLower(market)] = account;
  }
}

std::string MarketBasedRouter::route(const domain::Order& order) const {
  auto it = market_to_account_.find(toLower(order.market));
  if (it != market_to_account_.end()) {
    return it->second;
  }
  logFallback("MarketBasedRouter", order, default_account_);
  return default_account_;
}

void MarketBasedRouter::validate() const {
  requireMappings(market_to_account_, "MarketBasedRouter");
  requireDefault(default_account_, "MarketBasedRouter");
}

// -----------------------------------------------------------------------------
// SymbolBasedRouter
// -----------------------------------------------------------------------------

SymbolBasedRouter::SymbolBasedRouter(
    std::map<std::string, std::string> symbol_to_account,
    std::string default_account)
    : symbol_to_account_(std::move(symbol_to_account)),
      default_account_(std::move(default_account)) {}

std::string SymbolBasedRouter::route(const domain::Order& order) const {
  auto it = symbol_to_account_.find(order.symbol);
  if (it != symbol_to_account_.end()) {
    return it->second;
  }
  logFallback("SymbolBasedRouter", order, default_account_);
  return default_account_;
}

void SymbolBasedRouter::validate() const {
  requireMappings(symbol_to_account_, "SymbolBasedRouter");
  requireDefault(default_account_, "SymbolBasedRouter");
}

// -----------------------------------------------------------------------------
// SecurityTypeRouter
// -----------------------------------------------------------------------------

SecurityTypeRouter::SecurityTypeRouter(
    std::map<domain::SecurityType, std::string> type_to_account,
    std::string default_account)
    : type_to_account_(std::move(type_to_account)),
      default_account_(std::move(default_account)) {}

std::string SecurityTypeRouter::route(const domain::Order& order) const {
  auto it = type_to_account_.find(order.security_type);
  if (it != type_to_account_.end()) {
    return it->second;
  }
  logFallback("SecurityTypeRouter", order, default_account_);
  return default_account_;
}

void SecurityTypeRouter::validate() const {
  requireMappings(type_to_account_, "SecurityTypeRouter");
  requireDefault(default_account_, "SecurityTypeRouter");
}

// -----------------------------------------------------------------------------
// SimpleOrderRouter
// -----------------------------------------------------------------------------

SimpleOrderRouter::SimpleOrderRouter(std::string account)
    : account_(std::move(account)) {}

std::string SimpleOrderRouter::route(const domain::Order&) const {
  return account_;
}

void SimpleOrderRouter::validate() const {
  if (account_.empty()) {
    throw std::invalid_argument("SimpleOrderRouter: account must not be empty");
  }
}

}  // namespace arb
