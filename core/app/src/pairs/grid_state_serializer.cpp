#include "arb/pairs/grid_state_serializer.hpp"

#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>

namespace arb {

namespace {

constexpr int kGridStateVersion = 1;

nlohmann::json legToJson(const LegSpec& leg) {
  nlohmann::json j;
  j["symbol"] = leg.symbol;
  j["market"] = leg.market;
  j["security_type"] = domain::toString(leg.security_type);
  j["lot_size"] = leg.lot_size;
  return j;
}

LegSpec legFromJson(const nlohmann::json& j) {
  LegSpec leg;
  leg.symbol = j.at("symbol").get<std::string>();
  leg.market = j.value("market", std::string());
  auto type = domain::parseSecurityType(
      j.value("security_type", std::string("Crypto")));
  if (!type) {
    throw std::invalid_argument("unknown security_type for " + leg.symbol);
  }
  leg.security_type = *type;
  leg.lot_size = j.at("lot_size").get<double>();
  return leg;
}

nlohmann::json levelPairToJson(const domain::GridLevelPair& lp) {
  nlohmann::json j;
  j["entry"] = lp.entry().spread_pct;
  j["exit"] = lp.exit().spread_pct;
  j["direction"] = domain::toString(lp.direction());
  j["size"] = lp.entry().position_size_pct;
  return j;
}

domain::GridLevelPair levelPairFromJson(const nlohmann::json& j) {
  auto text = j.at("direction").get<std::string>();
  auto direction = domain::parseSpreadDirection(text);
  if (!direction) {
    throw std::invalid_argument("unknown direction '" + text + "'");
  }
  return domain::GridLevelPair(j.at("entry").get<double>(),
                               j.at("exit").get<double>(), *direction,
                               j.at("size").get<double>());
}

nlohmann::json positionToJson(const GridPosition& position) {
  nlohmann::json j;
  j["level_pair"] = levelPairToJson(position.levelPair());
  j["open_time_ms"] = position.openTimeMs();
  if (auto first = position.firstFillTimeMs()) {
    j["first_fill_time_ms"] = *first;
  } else {
    j["first_fill_time_ms"] = nullptr;
  }
  j["leg1_quantity"] = position.leg1Quantity();
  j["leg1_average_cost"] = position.leg1AverageCost();
  j["leg2_quantity"] = position.leg2Quantity();
  j["leg2_average_cost"] = position.leg2AverageCost();
  j["broker_order_ids"] = position.brokerOrderIds();
  return j;
}

}  // namespace

nlohmann::json gridStateToJson(const TradingPairManager& manager,
                               std::int64_t saved_ms) {
  nlohmann::json doc;
  doc["version"] = kGridStateVersion;
  doc["saved_ms"] = saved_ms;

  nlohmann::json pairs = nlohmann::json::array();
  for (const auto& pair : manager.pairs()) {
    nlohmann::json p;
    p["leg1"] = legToJson(pair->leg1());
    p["leg2"] = legToJson(pair->leg2());
    p["pair_type"] = pair->pairType();

    nlohmann::json levels = nlohmann::json::array();
    for (const auto& lp : pair->levelPairs()) {
      levels.push_back(levelPairToJson(lp));
    }
    p["level_pairs"] = std::move(levels);

    nlohmann::json positions = nlohmann::json::array();
    for (const auto& position : pair->positions()) {
      positions.push_back(positionToJson(position));
    }
    p["positions"] = std::move(positions);

    pairs.push_back(std::move(p));
  }
  doc["pairs"] = std::move(pairs);
  doc["last_fill_by_market"] = manager.lastFillTimes();
  return doc;
}

bool restoreGridState(TradingPairManager& manager, const nlohmann::json& doc) {
  try {
    int version = doc.at("version").get<int>();
    if (version != kGridStateVersion) {
      std::cerr << "[GridState] unsupported version " << version << "\n";
      return false;
    }

    std::size_t restored_positions = 0;
    for (const auto& p : doc.at("pairs")) {
      auto pair = manager.addPair(legFromJson(p.at("leg1")),
                                  legFromJson(p.at("leg2")),
                                  p.value("pair_type", std::string("spread")));

      std::vector<domain::GridLevelPair> levels;
      for (const auto& lp : p.at("level_pairs")) {
        levels.push_back(levelPairFromJson(lp));
      }
      pair->setLevelPairs(std::move(levels));

      for (const auto& pos : p.at("positions")) {
        GridPosition position(pair->leg1().symbol, pair->leg2().symbol,
                              levelPairFromJson(pos.at("level_pair")),
                              pair->leg1().lot_size, pair->leg2().lot_size,
                              pos.at("open_time_ms").get<std::int64_t>());

        std::optional<std::int64_t> first_fill;
        const auto& ff = pos.at("first_fill_time_ms");
        if (!ff.is_null()) {
          first_fill = ff.get<std::int64_t>();
        }
        position.restore(pos.at("leg1_quantity").get<double>(),
                         pos.at("leg1_average_cost").get<double>(),
                         pos.at("leg2_quantity").get<double>(),
                         pos.at("leg2_average_cost").get<double>(),
                         first_fill,
                         pos.at("broker_order_ids").get<std::set<std::string>>());
        pair->restorePosition(std::move(position));
        ++restored_positions;
      }
    }

    manager.restoreLastFillTimes(
        doc.at("last_fill_by_market").get<std::map<std::string, std::int64_t>>());

    std::cout << "[GridState] restored " << manager.size() << " pairs, "
              << restored_positions << " positions\n";
    return true;
  } catch (const std::exception& e) {
    // nlohmann::json::exception for shape errors, std::invalid_argument for
    // values GridLevelPair or TradingPair reject.
    std::cerr << "[GridState] ERROR: restore failed: " << e.what() << "\n";
    return false;
  }
}

}  // namespace arb
