#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// OrderIdGenerator
// -----------------------------------------------------------------------------
//
// @brief  Lock-free source of unique, increasing ids.
//
// @details
// The execution model draws engine order ids from one instance owned by
// ArbitrageEngine. Each PaperBrokerage owns its own instances for
// venue-side order ids and execution ids, rendered with a prefix
// ("paper-o-17", "paper-x-42") so ids from different accounts never
// collide once events are merged on the aggregate bus.
//
// Id 0 is never produced; Order::id == 0 means "not assigned yet".
//
// Thread model: next_id() / next_string() are safe from any thread.
// Relaxed ordering is enough because only uniqueness is required.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::uint64_t first = 1) : next_id_(first) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  std::string next_string(const std::string& prefix) {
    return prefix + std::to_string(next_id());
  }

 private:
  std::atomic<std::uint64_t> next_id_;
};

}  // namespace arb
