#include "arb/alpha/signal_collection.hpp"

#include <algorithm>

namespace arb {

void SignalCollection::add(const domain::GridSignal& signal) {
  std::lock_guard lock(mutex_);
  signals_.push_back(signal);
}

void SignalCollection::add(const std::vector<domain::GridSignal>& signals) {
  std::lock_guard lock(mutex_);
  signals_.insert(signals_.end(), signals.begin(), signals.end());
}

std::vector<domain::GridSignal> SignalCollection::getActiveSignals(
    std::int64_t now_ms) const {
  std::vector<domain::GridSignal> active;
  {
    std::lock_guard lock(mutex_);
    for (const auto& signal : signals_) {
      if (signal.isActive(now_ms)) {
        active.push_back(signal);
      }
    }
  }
  std::stable_sort(active.begin(), active.end(),
                   [](const auto& a, const auto& b) {
                     return a.generated_ms > b.generated_ms;
                   });
  return active;
}

void SignalCollection::cancel(const std::vector<domain::GridSignal>& signals,
                              std::int64_t now_ms) {
  std::lock_guard lock(mutex_);
  for (const auto& target : signals) {
    for (auto& signal : signals_) {
      if (signal.id == target.id && signal.close_ms > now_ms) {
        signal.close_ms = now_ms;
      }
    }
  }
}

std::vector<domain::GridSignal> SignalCollection::removeExpired(
    std::int64_t now_ms) {
  std::vector<domain::GridSignal> expired;
  std::lock_guard lock(mutex_);
  auto it = std::stable_partition(
      signals_.begin(), signals_.end(),
      [now_ms](const auto& signal) { return !signal.isExpired(now_ms); });
  expired.assign(it, signals_.end());
  signals_.erase(it, signals_.end());
  return expired;
}

bool SignalCollection::hasActiveSignals(const std::string& symbol,
                                        std::int64_t now_ms) const {
  std::lock_guard lock(mutex_);
  return std::any_of(signals_.begin(), signals_.end(), [&](const auto& s) {
    return s.symbol == symbol && s.isActive(now_ms);
  });
}

bool SignalCollection::hasExpiredSignals(std::int64_t now_ms) const {
  std::lock_guard lock(mutex_);
  return std::any_of(signals_.begin(), signals_.end(),
                     [now_ms](const auto& s) { return s.isExpired(now_ms); });
}

std::vector<domain::GridSignal> SignalCollection::all() const {
  std::lock_guard lock(mutex_);
  return signals_;
}

std::size_t SignalCollection::size() const {
  std::lock_guard lock(mutex_);
  return signals_.size();
}

void SignalCollection::clear() {
  std::lock_guard lock(mutex_);
  signals_.clear();
}

}  // namespace arb
