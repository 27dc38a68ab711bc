#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// ConcurrentMap<K, V>
// -----------------------------------------------------------------------------
//
// @brief  Ordered map whose every operation is one critical section.
//
// @details
// The shared registries of the engine (target ledger by tag, grid positions
// by entry natural key, brokerage connections by account) are all touched
// from the evaluation loop and from brokerage I/O threads. Rather than each
// owner pairing a std::map with a mutex by convention, they hold one of
// these, and the only way in is through a member that takes the lock for
// exactly one map operation.
//
// Rules the interface enforces:
//   - Readers get copies (find(), snapshot(), values()). No reference or
//     iterator into the map ever escapes the lock.
//   - Mutation in place goes through update()/getOrCreate(), whose functor
//     runs under the lock. Those functors must be short, pure bookkeeping:
//     no I/O, no EventBus publish, no call into another ConcurrentMap.
//
// Thread model: every member is safe from any thread.
// -----------------------------------------------------------------------------
template <typename K, typename V>
class ConcurrentMap {
 public:
  ConcurrentMap() = default;

  ConcurrentMap(const ConcurrentMap&) = delete;
  ConcurrentMap& operator=(const ConcurrentMap&) = delete;

  // Last write wins. Returns true if the key was new.
  bool insertOrAssign(const K& key, V value) {
    std::lock_guard lock(mutex_);
    return map_.insert_or_assign(key, std::move(value)).second;
  }

  // Inserts only if absent. Returns false (and leaves the map untouched) if
  // the key already exists.
  bool tryInsert(const K& key, V value) {
    std::lock_guard lock(mutex_);
    return map_.try_emplace(key, std::move(value)).second;
  }

  std::optional<V> find(const K& key) const {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  bool contains(const K& key) const {
    std::lock_guard lock(mutex_);
    return map_.find(key) != map_.end();
  }

  bool erase(const K& key) {
    std::lock_guard lock(mutex_);
    return map_.erase(key) > 0;
  }

  // Applies fn(V&) to an existing value. Returns false if key is absent.
  template <typename Fn>
  bool update(const K& key, Fn&& fn) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      return false;
    }
    fn(it->second);
    return true;
  }

  // Inserts make() if absent, applies fn(V&), and returns a copy of the
  // resulting value.
  template <typename Make, typename Fn>
  V getOrCreate(const K& key, Make&& make, Fn&& fn) {
    std::lock_guard lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      it = map_.emplace(key, make()).first;
    }
    fn(it->second);
    return it->second;
  }

  // Removes every entry for which pred(key, value) holds. Returns the
  // removed keys.
  template <typename Pred>
  std::vector<K> eraseIf(Pred&& pred) {
    std::vector<K> removed;
    std::lock_guard lock(mutex_);
    for (auto it = map_.begin(); it != map_.end();) {
      if (pred(it->first, it->second)) {
        removed.push_back(it->first);
        it = map_.erase(it);
      } else {
        ++it;
      }
    }
    return removed;
  }

  std::vector<std::pair<K, V>> snapshot() const {
    std::lock_guard lock(mutex_);
    return std::vector<std::pair<K, V>>(map_.begin(), map_.end());
  }

  std::vector<V> values() const {
    std::lock_guard lock(mutex_);
    std::vector<V> out;
    out.reserve(map_.size());
    for (const auto& [key, value] : map_) {
      out.push_back(value);
    }
    return out;
  }

  std::vector<K> keys() const {
    std::lock_guard lock(mutex_);
    std::vector<K> out;
    out.reserve(map_.size());
    for (const auto& [key, value] : map_) {
      out.push_back(key);
    }
    return out;
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return map_.size();
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return map_.empty();
  }

  void clear() {
    std::lock_guard lock(mutex_);
    map_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::map<K, V> map_;
};

}  // namespace arb
