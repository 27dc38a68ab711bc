#include "arb/storage/in_memory_backup_storage.hpp"

namespace arb {

bool InMemoryBackupStorage::save(const std::string& key,
                                 const std::string& content) {
  if (key.empty()) {
    return false;
  }
  std::lock_guard lock(mutex_);
  entries_[key] = content;
  return true;
}

std::optional<std::string> InMemoryBackupStorage::read(
    const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryBackupStorage::remove(const std::string& key) {
  std::lock_guard lock(mutex_);
  return entries_.erase(key) > 0;
}

bool InMemoryBackupStorage::exists(const std::string& key) const {
  std::lock_guard lock(mutex_);
  return entries_.count(key) > 0;
}

std::vector<std::string> InMemoryBackupStorage::listKeys(
    const std::string& prefix) const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> keys;
  for (auto it = entries_.lower_bound(prefix);
       it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it) {
    keys.push_back(it->first);
  }
  return keys;
}

std::size_t InMemoryBackupStorage::size() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

}  // namespace arb
