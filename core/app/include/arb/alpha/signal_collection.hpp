#pragma once

#include "arb/alpha/i_signal_collection.hpp"

#include <mutex>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// SignalCollection
// -----------------------------------------------------------------------------
//
// @brief  In-memory ISignalCollection, the live-signal store of the engine.
//
// @details
// Holds every signal from generation until removeExpired() sweeps it. The
// portfolio construction model uses the sweep result to flatten positions
// whose signals lapsed.
//
// getActiveSignals() returns signals active at now_ms (generated_ms <= now
// < close_ms), newest first by generated time.
//
// Thread model: one mutex around the vector; every call copies out.
// -----------------------------------------------------------------------------
class SignalCollection : public ISignalCollection {
 public:
  void add(const domain::GridSignal& signal);
  void add(const std::vector<domain::GridSignal>& signals);

  std::vector<domain::GridSignal> getActiveSignals(
      std::int64_t now_ms) const override;

  void cancel(const std::vector<domain::GridSignal>& signals,
              std::int64_t now_ms) override;

  // Removes and returns every signal expired at now_ms.
  std::vector<domain::GridSignal> removeExpired(std::int64_t now_ms);

  bool hasActiveSignals(const std::string& symbol, std::int64_t now_ms) const;

  // True if removeExpired(now_ms) would remove anything.
  bool hasExpiredSignals(std::int64_t now_ms) const;

  std::vector<domain::GridSignal> all() const;
  std::size_t size() const;
  void clear();

 private:
  mutable std::mutex mutex_;
  std::vector<domain::GridSignal> signals_;
};

}  // namespace arb
