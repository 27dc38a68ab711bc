#include "arb/config/config_loader.hpp"

#include "arb/brokerage/paper_brokerage.hpp"
#include "arb/routing/market_based_router.hpp"
#include "arb/routing/security_type_router.hpp"
#include "arb/routing/simple_order_router.hpp"
#include "arb/routing/symbol_based_router.hpp"

#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>

namespace arb {
namespace config {

namespace {

using nlohmann::json;

[[noreturn]] void fail(const std::string& key, const std::string& what) {
  throw std::invalid_argument("config: '" + key + "' " + what);
}

// j.value() with the key path in the error message instead of nlohmann's
// generic type_error text.
template <typename T>
T optionalField(const json& j, const std::string& key, const T& fallback,
                const std::string& path) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    fail(path + "." + key, std::string("has the wrong type: ") + e.what());
  }
}

template <typename T>
T requiredField(const json& j, const std::string& key,
                const std::string& path) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    fail(path + "." + key, "is required");
  }
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    fail(path + "." + key, std::string("has the wrong type: ") + e.what());
  }
}

const json& requireObject(const json& j, const std::string& path) {
  if (!j.is_object()) {
    fail(path, "must be an object");
  }
  return j;
}

const json& requireArray(const json& j, const std::string& path) {
  if (!j.is_array()) {
    fail(path, "must be an array");
  }
  return j;
}

domain::GridLevelPair parseLevel(const json& j, const std::string& path) {
  requireObject(j, path);
  auto direction_text = requiredField<std::string>(j, "direction", path);
  auto direction = domain::parseSpreadDirection(direction_text);
  if (!direction) {
    fail(path + ".direction", "must be LONG_SPREAD or SHORT_SPREAD, got '" +
                                  direction_text + "'");
  }
  auto entry = requiredField<double>(j, "entry", path);
  auto exit = requiredField<double>(j, "exit", path);
  auto size = requiredField<double>(j, "size", path);
  try {
    return domain::GridLevelPair(entry, exit, *direction, size);
  } catch (const std::invalid_argument& e) {
    fail(path, e.what());
  }
}

std::vector<domain::GridLevelPair> parseLevels(const json& j,
                                               const std::string& path) {
  requireArray(j, path);
  std::vector<domain::GridLevelPair> levels;
  for (std::size_t i = 0; i < j.size(); ++i) {
    levels.push_back(parseLevel(j[i], path + "[" + std::to_string(i) + "]"));
  }
  return levels;
}

LegSpec parseLeg(const json& j, const std::string& path) {
  requireObject(j, path);
  LegSpec leg;
  leg.symbol = requiredField<std::string>(j, "symbol", path);
  if (leg.symbol.empty()) {
    fail(path + ".symbol", "must not be empty");
  }
  leg.market = optionalField<std::string>(j, "market", "", path);
  auto type_text =
      optionalField<std::string>(j, "security_type", "crypto", path);
  auto type = domain::parseSecurityType(type_text);
  if (!type) {
    fail(path + ".security_type", "unknown security type '" + type_text + "'");
  }
  leg.security_type = *type;
  leg.lot_size = optionalField<double>(j, "lot_size", leg.lot_size, path);
  if (!(leg.lot_size > 0.0)) {
    fail(path + ".lot_size", "must be positive");
  }
  return leg;
}

AlphaSettings parseAlpha(const json& j) {
  requireObject(j, "alpha");
  AlphaSettings alpha;
  alpha.signal_period_ms = optionalField<std::int64_t>(
      j, "signal_period_ms", alpha.signal_period_ms, "alpha");
  if (alpha.signal_period_ms <= 0) {
    fail("alpha.signal_period_ms", "must be positive");
  }
  alpha.confidence =
      optionalField<double>(j, "confidence", alpha.confidence, "alpha");
  if (alpha.confidence < 0.0 || alpha.confidence > 1.0) {
    fail("alpha.confidence", "must be within [0, 1]");
  }
  alpha.require_valid_prices = optionalField<bool>(
      j, "require_valid_prices", alpha.require_valid_prices, "alpha");

  auto it = j.find("grid_templates");
  if (it != j.end() && !it->is_null()) {
    requireObject(*it, "alpha.grid_templates");
    for (const auto& item : it->items()) {
      alpha.grid_templates[item.key()] =
          parseLevels(item.value(), "alpha.grid_templates." + item.key());
    }
  }
  return alpha;
}

PairConfig parsePair(const json& j, const std::string& path) {
  requireObject(j, path);
  auto leg1_it = j.find("leg1");
  auto leg2_it = j.find("leg2");
  if (leg1_it == j.end()) {
    fail(path + ".leg1", "is required");
  }
  if (leg2_it == j.end()) {
    fail(path + ".leg2", "is required");
  }

  PairConfig pair{parseLeg(*leg1_it, path + ".leg1"),
                  parseLeg(*leg2_it, path + ".leg2"),
                  optionalField<std::string>(j, "pair_type", "spread", path),
                  {}};
  if (pair.leg1.symbol == pair.leg2.symbol) {
    fail(path, "legs must be different symbols");
  }
  auto levels = j.find("levels");
  if (levels != j.end() && !levels->is_null()) {
    pair.levels = parseLevels(*levels, path + ".levels");
  }
  return pair;
}

AccountConfig parseAccount(const json& j, const std::string& path) {
  requireObject(j, path);
  AccountConfig account;
  account.name = requiredField<std::string>(j, "name", path);
  if (account.name.empty()) {
    fail(path + ".name", "must not be empty");
  }
  account.type = optionalField<std::string>(j, "type", account.type, path);

  auto& paper = account.paper;
  paper.auto_fill = optionalField<bool>(j, "auto_fill", paper.auto_fill, path);
  paper.base_currency = optionalField<std::string>(j, "base_currency",
                                                   paper.base_currency, path);
  paper.initial_cash =
      optionalField<double>(j, "initial_cash", paper.initial_cash, path);
  paper.fee_rate = optionalField<double>(j, "fee_rate", paper.fee_rate, path);
  if (paper.fee_rate < 0.0) {
    fail(path + ".fee_rate", "must not be negative");
  }
  return account;
}

RoutingConfig parseRouting(const json& j) {
  requireObject(j, "routing");
  RoutingConfig routing;
  routing.kind = optionalField<std::string>(j, "kind", routing.kind, "routing");
  routing.mapping = optionalField<std::map<std::string, std::string>>(
      j, "mapping", {}, "routing");
  routing.default_account = optionalField<std::string>(
      j, "default_account", routing.default_account, "routing");
  return routing;
}

BackupConfig parseBackup(const json& j) {
  requireObject(j, "backup");
  BackupConfig backup;
  backup.enabled = optionalField<bool>(j, "enabled", backup.enabled, "backup");
  backup.owner =
      optionalField<std::string>(j, "owner", backup.owner, "backup");
  backup.directory =
      optionalField<std::string>(j, "directory", backup.directory, "backup");

  auto it = j.find("tiers");
  if (it != j.end() && !it->is_null()) {
    requireArray(*it, "backup.tiers");
    backup.tiers.clear();
    for (std::size_t i = 0; i < it->size(); ++i) {
      std::string path = "backup.tiers[" + std::to_string(i) + "]";
      const auto& t = requireObject((*it)[i], path);
      auto name = requiredField<std::string>(t, "name", path);
      auto interval_ms = requiredField<std::int64_t>(t, "interval_ms", path);
      auto max_count = requiredField<int>(t, "max_count", path);
      try {
        backup.tiers.emplace_back(std::move(name), interval_ms, max_count);
      } catch (const std::invalid_argument& e) {
        fail(path, e.what());
      }
    }
  }
  return backup;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& doc) {
  requireObject(doc, "<root>");
  EngineConfig cfg;

  cfg.portfolio_value = optionalField<double>(doc, "portfolio_value",
                                              cfg.portfolio_value, "<root>");
  if (!(cfg.portfolio_value > 0.0)) {
    fail("portfolio_value", "must be positive");
  }
  cfg.replay_clock =
      optionalField<bool>(doc, "replay_clock", cfg.replay_clock, "<root>");
  cfg.reconcile_interval_ms = optionalField<std::int64_t>(
      doc, "reconcile_interval_ms", cfg.reconcile_interval_ms, "<root>");
  cfg.rebalance_interval_ms = optionalField<std::int64_t>(
      doc, "rebalance_interval_ms", cfg.rebalance_interval_ms, "<root>");
  if (cfg.reconcile_interval_ms < 0) {
    fail("reconcile_interval_ms", "must not be negative");
  }
  if (cfg.rebalance_interval_ms < 0) {
    fail("rebalance_interval_ms", "must not be negative");
  }

  if (auto it = doc.find("alpha"); it != doc.end()) {
    cfg.alpha = parseAlpha(*it);
  }

  auto pairs = doc.find("pairs");
  if (pairs == doc.end()) {
    fail("pairs", "is required");
  }
  requireArray(*pairs, "pairs");
  for (std::size_t i = 0; i < pairs->size(); ++i) {
    cfg.pairs.push_back(
        parsePair((*pairs)[i], "pairs[" + std::to_string(i) + "]"));
  }

  auto accounts = doc.find("accounts");
  if (accounts == doc.end()) {
    fail("accounts", "is required");
  }
  requireArray(*accounts, "accounts");
  if (accounts->empty()) {
    fail("accounts", "must name at least one account");
  }
  std::set<std::string> names;
  for (std::size_t i = 0; i < accounts->size(); ++i) {
    auto account =
        parseAccount((*accounts)[i], "accounts[" + std::to_string(i) + "]");
    if (!names.insert(account.name).second) {
      fail("accounts", "has a duplicate account name '" + account.name + "'");
    }
    cfg.accounts.push_back(std::move(account));
  }

  if (auto it = doc.find("routing"); it != doc.end()) {
    cfg.routing = parseRouting(*it);
  }
  if (cfg.routing.default_account.empty()) {
    cfg.routing.default_account = cfg.accounts.front().name;
  }
  if (names.count(cfg.routing.default_account) == 0) {
    fail("routing.default_account", "names unknown account '" +
                                        cfg.routing.default_account + "'");
  }
  for (const auto& [key, account] : cfg.routing.mapping) {
    if (names.count(account) == 0) {
      fail("routing.mapping." + key, "names unknown account '" + account + "'");
    }
  }

  if (auto it = doc.find("backup"); it != doc.end()) {
    cfg.backup = parseBackup(*it);
  }

  if (auto it = doc.find("endpoints"); it != doc.end()) {
    requireObject(*it, "endpoints");
    auto& ep = cfg.endpoints;
    ep.market_data = optionalField<std::string>(*it, "market_data",
                                                ep.market_data, "endpoints");
    ep.command =
        optionalField<std::string>(*it, "command", ep.command, "endpoints");
    ep.telemetry =
        optionalField<std::string>(*it, "telemetry", ep.telemetry, "endpoints");
  }

  return cfg;
}

EngineConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("config: cannot open '" + path + "'");
  }

  nlohmann::json doc;
  try {
    in >> doc;
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("config: malformed JSON in '" + path +
                                "': " + e.what());
  }
  return parseConfig(doc);
}

// -----------------------------------------------------------------------------
// Factories
// -----------------------------------------------------------------------------
std::unique_ptr<IOrderRouter> makeRouter(const RoutingConfig& routing) {
  if (routing.kind == "market") {
    return std::make_unique<MarketBasedRouter>(routing.mapping,
                                               routing.default_account);
  }
  if (routing.kind == "symbol") {
    return std::make_unique<SymbolBasedRouter>(routing.mapping,
                                               routing.default_account);
  }
  if (routing.kind == "security_type") {
    std::map<domain::SecurityType, std::string> by_type;
    for (const auto& [key, account] : routing.mapping) {
      auto type = domain::parseSecurityType(key);
      if (!type) {
        fail("routing.mapping." + key, "is not a security type");
      }
      by_type[*type] = account;
    }
    return std::make_unique<SecurityTypeRouter>(std::move(by_type),
                                                routing.default_account);
  }
  if (routing.kind == "simple") {
    return std::make_unique<SimpleOrderRouter>(routing.default_account);
  }
  fail("routing.kind", "unknown router kind '" + routing.kind + "'");
}

std::shared_ptr<IBrokerage> makeBrokerage(const AccountConfig& account,
                                          const ITimeProvider& time_provider) {
  if (account.type == "paper") {
    return std::make_shared<PaperBrokerage>(account.name, time_provider,
                                            account.paper);
  }
  fail("accounts." + account.name + ".type",
       "unknown account type '" + account.type + "'");
}

}  // namespace config
}  // namespace arb
