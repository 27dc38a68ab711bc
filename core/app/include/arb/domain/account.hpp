#pragma once

#include <cstdint>
#include <string>

namespace arb {
namespace domain {

// Net holding of one instrument in one account.
struct Holding {
  std::string symbol;
  double quantity{0.0};
  double average_price{0.0};
  std::string account;
};

struct CashAmount {
  std::string currency;
  double amount{0.0};
  std::string account;
};

// -----------------------------------------------------------------------------
// ExecutionRecord
// -----------------------------------------------------------------------------
// One fill as reported by a brokerage's execution history. quantity is
// signed (negative for sells). The tag is whatever the order carried when
// it was placed, so a replayed execution can be attributed to its grid
// position exactly like a live fill.
// -----------------------------------------------------------------------------
struct ExecutionRecord {
  std::string execution_id;
  std::string symbol;
  std::string market;
  double quantity{0.0};
  double price{0.0};
  std::int64_t time_ms{0};
  std::string tag;
  double fee{0.0};
  std::string fee_currency;
  std::string broker_order_id;
  std::string account;
};

}  // namespace domain
}  // namespace arb
