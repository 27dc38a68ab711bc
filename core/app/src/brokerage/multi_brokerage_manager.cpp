#include "arb/brokerage/multi_brokerage_manager.hpp"

#include <iostream>
#include <stdexcept>
#include <type_traits>
#include <variant>

namespace arb {

namespace {

template <typename T>
constexpr bool kIsBrokerageEvent =
    std::is_same_v<T, OrderStatusEvent> ||
    std::is_same_v<T, AccountChangedEvent> ||
    std::is_same_v<T, BrokerageMessageEvent> ||
    std::is_same_v<T, OptionAssignmentEvent>;

std::string join(const std::vector<std::string>& names) {
  std::string out;
  for (const auto& name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

}  // namespace

MultiBrokerageManager::~MultiBrokerageManager() {
  for (auto& [account, entry] : entries_.snapshot()) {
    entry.brokerage->events().unsubscribe(entry.subscription);
  }
}

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------

void MultiBrokerageManager::addBrokerage(std::shared_ptr<IBrokerage> brokerage) {
  if (!brokerage) {
    throw std::invalid_argument("MultiBrokerageManager: brokerage is null");
  }
  const std::string account = brokerage->name();
  if (account.empty()) {
    throw std::invalid_argument(
        "MultiBrokerageManager: account name must not be empty");
  }

  Entry entry;
  entry.brokerage = brokerage;
  entry.history = brokerage->executionHistory();
  if (!entries_.tryInsert(account, entry)) {
    throw std::invalid_argument("MultiBrokerageManager: account '" + account +
                                "' is already registered");
  }

  // Subscribe after the entry exists so the id can be stored on it.
  auto id = brokerage->events().subscribe(
      [this, account](const Event& event) { forward(account, event); });
  entries_.update(account, [id](Entry& e) { e.subscription = id; });

  std::cout << "[MultiBrokerageManager] registered account '" << account
            << "'" << (entry.history ? " (execution history)" : "") << "\n";
}

bool MultiBrokerageManager::removeBrokerage(const std::string& account) {
  auto entry = entries_.find(account);
  if (!entry) {
    return false;
  }
  entry->brokerage->events().unsubscribe(entry->subscription);
  entries_.erase(account);
  std::cout << "[MultiBrokerageManager] removed account '" << account << "'\n";
  return true;
}

std::shared_ptr<IBrokerage> MultiBrokerageManager::getBrokerage(
    const std::string& account) const {
  auto entry = entries_.find(account);
  if (!entry) {
    throw std::out_of_range("MultiBrokerageManager: no brokerage for account '" +
                            account + "'");
  }
  return entry->brokerage;
}

std::vector<std::string> MultiBrokerageManager::accountNames() const {
  return entries_.keys();
}

// -----------------------------------------------------------------------------
// Connection lifecycle
// -----------------------------------------------------------------------------

void MultiBrokerageManager::connectAll() {
  auto entries = entries_.snapshot();
  std::cout << "[MultiBrokerageManager] connecting " << entries.size()
            << " brokerage(s)\n";

  std::vector<std::string> failed;
  for (auto& [account, entry] : entries) {
    try {
      entry.brokerage->connect();
      if (!entry.brokerage->isConnected()) {
        std::cerr << "[MultiBrokerageManager] ERROR: '" << account
                  << "' failed to connect\n";
        failed.push_back(account);
      } else {
        std::cout << "[MultiBrokerageManager] '" << account
                  << "' connected\n";
      }
    } catch (const std::exception& e) {
      std::cerr << "[MultiBrokerageManager] ERROR: exception connecting '"
                << account << "': " << e.what() << "\n";
      failed.push_back(account);
    } catch (...) {
      std::cerr << "[MultiBrokerageManager] ERROR: unknown exception "
                   "connecting '" << account << "'\n";
      failed.push_back(account);
    }
  }

  if (!failed.empty()) {
    disconnectAll();
    throw std::runtime_error("Failed to connect brokerages: " + join(failed) +
                             ". All brokerages must connect successfully.");
  }
}

void MultiBrokerageManager::disconnectAll() {
  for (auto& [account, entry] : entries_.snapshot()) {
    try {
      entry.brokerage->disconnect();
    } catch (const std::exception& e) {
      std::cerr << "[MultiBrokerageManager] ERROR: disconnecting '" << account
                << "': " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[MultiBrokerageManager] ERROR: disconnecting '" << account
                << "': unknown exception\n";
    }
  }
  std::cout << "[MultiBrokerageManager] all brokerages disconnected\n";
}

bool MultiBrokerageManager::isConnected() const {
  auto entries = entries_.values();
  if (entries.empty()) {
    return false;
  }
  for (const auto& entry : entries) {
    if (!entry.brokerage->isConnected()) {
      return false;
    }
  }
  return true;
}

// -----------------------------------------------------------------------------
// Per-account operations
// -----------------------------------------------------------------------------

bool MultiBrokerageManager::placeOrder(const std::string& account,
                                       domain::Order& order) {
  try {
    order.account = account;
    return getBrokerage(account)->placeOrder(order);
  } catch (const std::exception& e) {
    std::cerr << "[MultiBrokerageManager] ERROR: placeOrder " << order.id
              << " on '" << account << "': " << e.what() << "\n";
    return false;
  } catch (...) {
    std::cerr << "[MultiBrokerageManager] ERROR: placeOrder " << order.id
              << " on '" << account << "': unknown exception\n";
    return false;
  }
}

bool MultiBrokerageManager::updateOrder(const std::string& account,
                                        const domain::Order& order) {
  try {
    return getBrokerage(account)->updateOrder(order);
  } catch (const std::exception& e) {
    std::cerr << "[MultiBrokerageManager] ERROR: updateOrder " << order.id
              << " on '" << account << "': " << e.what() << "\n";
    return false;
  } catch (...) {
    std::cerr << "[MultiBrokerageManager] ERROR: updateOrder " << order.id
              << " on '" << account << "': unknown exception\n";
    return false;
  }
}

bool MultiBrokerageManager::cancelOrder(const std::string& account,
                                        const domain::Order& order) {
  try {
    return getBrokerage(account)->cancelOrder(order);
  } catch (const std::exception& e) {
    std::cerr << "[MultiBrokerageManager] ERROR: cancelOrder " << order.id
              << " on '" << account << "': " << e.what() << "\n";
    return false;
  } catch (...) {
    std::cerr << "[MultiBrokerageManager] ERROR: cancelOrder " << order.id
              << " on '" << account << "': unknown exception\n";
    return false;
  }
}

std::vector<domain::Order> MultiBrokerageManager::getOpenOrders(
    const std::string& account) {
  try {
    return getBrokerage(account)->getOpenOrders();
  } catch (const std::exception& e) {
    std::cerr << "[MultiBrokerageManager] ERROR: getOpenOrders on '" << account
              << "': " << e.what() << "\n";
    return {};
  } catch (...) {
    std::cerr << "[MultiBrokerageManager] ERROR: getOpenOrders on '" << account
              << "': unknown exception\n";
    return {};
  }
}

bool MultiBrokerageManager::placeOrder(domain::Order&) {
  throw std::logic_error(
      "MultiBrokerageManager: placeOrder requires an account name");
}

bool MultiBrokerageManager::updateOrder(const domain::Order&) {
  throw std::logic_error(
      "MultiBrokerageManager: updateOrder requires an account name");
}

bool MultiBrokerageManager::cancelOrder(const domain::Order&) {
  throw std::logic_error(
      "MultiBrokerageManager: cancelOrder requires an account name");
}

std::vector<domain::Order> MultiBrokerageManager::getOpenOrders() {
  throw std::logic_error(
      "MultiBrokerageManager: getOpenOrders requires an account name; "
      "use getAllOpenOrders()");
}

// -----------------------------------------------------------------------------
// Aggregated queries
// -----------------------------------------------------------------------------

std::vector<domain::Order> MultiBrokerageManager::getAllOpenOrders() {
  std::vector<domain::Order> all;
  for (auto& [account, entry] : entries_.snapshot()) {
    try {
      for (auto& order : entry.brokerage->getOpenOrders()) {
        order.account = account;
        all.push_back(std::move(order));
      }
    } catch (const std::exception& e) {
      std::cerr << "[MultiBrokerageManager] ERROR: open orders from '"
                << account << "': " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[MultiBrokerageManager] ERROR: open orders from '"
                << account << "': unknown exception\n";
    }
  }
  return all;
}

std::vector<domain::CashAmount> MultiBrokerageManager::getAllCashBalances() {
  std::vector<domain::CashAmount> all;
  for (auto& [account, entry] : entries_.snapshot()) {
    try {
      for (auto& cash : entry.brokerage->getCashBalance()) {
        cash.account = account;
        all.push_back(std::move(cash));
      }
    } catch (const std::exception& e) {
      std::cerr << "[MultiBrokerageManager] ERROR: cash from '" << account
                << "': " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[MultiBrokerageManager] ERROR: cash from '" << account
                << "': unknown exception\n";
    }
  }
  return all;
}

std::vector<domain::Holding> MultiBrokerageManager::getAllHoldings() {
  std::vector<domain::Holding> all;
  for (auto& [account, entry] : entries_.snapshot()) {
    try {
      for (auto& holding : entry.brokerage->getAccountHoldings()) {
        holding.account = account;
        all.push_back(std::move(holding));
      }
    } catch (const std::exception& e) {
      std::cerr << "[MultiBrokerageManager] ERROR: holdings from '" << account
                << "': " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[MultiBrokerageManager] ERROR: holdings from '" << account
                << "': unknown exception\n";
    }
  }
  return all;
}

std::vector<domain::ExecutionRecord> MultiBrokerageManager::getExecutionHistory(
    std::int64_t start_ms, std::int64_t end_ms) {
  std::vector<domain::ExecutionRecord> all;
  for (auto& [account, entry] : entries_.snapshot()) {
    if (entry.history == nullptr) {
      std::cout << "[MultiBrokerageManager] '" << account
                << "' has no execution history, skipped\n";
      continue;
    }
    try {
      auto records = entry.history->getExecutionHistory(start_ms, end_ms);
      for (auto& record : records) {
        record.account = account;
        all.push_back(std::move(record));
      }
    } catch (const std::exception& e) {
      std::cerr << "[MultiBrokerageManager] ERROR: execution history from '"
                << account << "': " << e.what() << "\n";
    } catch (...) {
      std::cerr << "[MultiBrokerageManager] ERROR: execution history from '"
                << account << "': unknown exception\n";
    }
  }
  return all;
}

// -----------------------------------------------------------------------------
// Event fan-in
// -----------------------------------------------------------------------------

void MultiBrokerageManager::forward(const std::string& account,
                                    const Event& event) {
  Event stamped = event;
  std::visit(
      [&account](auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (kIsBrokerageEvent<T>) {
          e.account = account;
        }
      },
      stamped);
  bus_.publish(stamped);
}

}  // namespace arb
