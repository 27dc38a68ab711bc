#include "arb/storage/tiered_backup_manager.hpp"

#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <stdexcept>
#include <utility>

namespace arb {

TieredBackupManager::TieredBackupManager(
    std::string owner, std::vector<std::shared_ptr<IBackupStorage>> storages,
    const ITimeProvider& time_provider, std::vector<TierSettings> tiers)
    : owner_(std::move(owner)),
      storages_(std::move(storages)),
      time_provider_(time_provider),
      tiers_(std::move(tiers)) {
  if (owner_.empty() || owner_.find('/') != std::string::npos) {
    throw std::invalid_argument(
        "TieredBackupManager: owner must be non-empty and contain no '/'");
  }
  if (tiers_.empty()) {
    throw std::invalid_argument("TieredBackupManager: at least one tier");
  }
  std::set<std::string> names;
  for (const auto& tier : tiers_) {
    if (!names.insert(tier.name).second) {
      throw std::invalid_argument("TieredBackupManager: duplicate tier '" +
                                  tier.name + "'");
    }
  }
  for (const auto& storage : storages_) {
    if (!storage) {
      throw std::invalid_argument("TieredBackupManager: storage is null");
    }
  }
}

// -----------------------------------------------------------------------------
// saveBackup
// -----------------------------------------------------------------------------
bool TieredBackupManager::saveBackup(const std::string& content) {
  std::lock_guard lock(mutex_);
  if (storages_.empty()) {
    return false;
  }

  const std::int64_t now = time_provider_.now_ms();
  const TierSettings* tier = selectTierLocked(now);
  if (tier == nullptr) {
    return false;
  }

  BackupRecord record(owner_, tier->name, now);
  const std::string key = record.storageKey();

  bool success = true;
  for (const auto& storage : storages_) {
    try {
      if (!storage->save(key, content)) {
        std::cerr << "[TieredBackupManager] ERROR: save to '"
                  << storage->name() << "' failed: " << key << "\n";
        success = false;
      }
    } catch (const std::exception& e) {
      std::cerr << "[TieredBackupManager] ERROR: save to '" << storage->name()
                << "' threw: " << e.what() << "\n";
      success = false;
    }
  }
  if (!success) {
    return false;
  }

  last_save_ms_[tier->name] = now;
  auto& records = tierRecordsLocked(tier->name);
  records.erase(std::remove_if(records.begin(), records.end(),
                               [&](const BackupRecord& r) {
                                 return r.timestamp_ms == record.timestamp_ms;
                               }),
                records.end());
  records.push_back(record);
  cleanupTierLocked(*tier);

  std::cout << "[TieredBackupManager] saved " << key << " ("
            << content.size() << " bytes)\n";
  return true;
}

const TierSettings* TieredBackupManager::selectTierLocked(
    std::int64_t now_ms) const {
  const TierSettings& primary = tiers_.front();
  auto primary_last = last_save_ms_.find(primary.name);
  if (primary_last == last_save_ms_.end()) {
    return &primary;
  }
  if (now_ms - primary_last->second < primary.interval_ms) {
    return nullptr;
  }

  for (const auto& tier : tiers_) {
    auto last = last_save_ms_.find(tier.name);
    if (last == last_save_ms_.end() ||
        now_ms - last->second >= tier.interval_ms) {
      return &tier;
    }
  }
  return &primary;
}

std::vector<BackupRecord>& TieredBackupManager::tierRecordsLocked(
    const std::string& tier) {
  auto it = records_.find(tier);
  if (it != records_.end()) {
    return it->second;
  }

  std::vector<BackupRecord> records;
  if (!storages_.empty()) {
    try {
      for (const auto& key :
           storages_.front()->listKeys(backupKeyPrefix(owner_, tier))) {
        auto record = BackupRecord::tryParse(key);
        if (record && record->tier == tier && record->owner == owner_) {
          records.push_back(*record);
        }
      }
    } catch (const std::exception& e) {
      std::cerr << "[TieredBackupManager] ERROR: listing tier '" << tier
                << "' failed: " << e.what() << "\n";
    }
  }
  return records_.emplace(tier, std::move(records)).first->second;
}

void TieredBackupManager::cleanupTierLocked(const TierSettings& tier) {
  auto& records = tierRecordsLocked(tier.name);
  if (static_cast<int>(records.size()) <= tier.max_count) {
    return;
  }

  std::sort(records.begin(), records.end(),
            [](const BackupRecord& a, const BackupRecord& b) {
              return a.timestamp_ms > b.timestamp_ms;
            });
  std::cout << "[TieredBackupManager] removing "
            << records.size() - static_cast<std::size_t>(tier.max_count)
            << " old backup(s) from tier '" << tier.name << "'\n";

  for (std::size_t i = static_cast<std::size_t>(tier.max_count);
       i < records.size(); ++i) {
    const std::string key = records[i].storageKey();
    for (const auto& storage : storages_) {
      try {
        storage->remove(key);
      } catch (const std::exception& e) {
        std::cerr << "[TieredBackupManager] ERROR: delete " << key
                  << " from '" << storage->name() << "': " << e.what()
                  << "\n";
      }
    }
  }
  records.erase(records.begin() + tier.max_count, records.end());
}

// -----------------------------------------------------------------------------
// restoreLatest / statistics
// -----------------------------------------------------------------------------
std::optional<std::string> TieredBackupManager::restoreLatest() {
  std::lock_guard lock(mutex_);
  if (storages_.empty()) {
    return std::nullopt;
  }

  std::optional<BackupRecord> latest;
  for (const auto& tier : tiers_) {
    for (const auto& record : tierRecordsLocked(tier.name)) {
      if (!latest || record.timestamp_ms > latest->timestamp_ms) {
        latest = record;
      }
    }
  }
  if (!latest) {
    std::cout << "[TieredBackupManager] no backup to restore\n";
    return std::nullopt;
  }

  try {
    auto content = storages_.front()->read(latest->storageKey());
    if (!content) {
      std::cerr << "[TieredBackupManager] ERROR: backup "
                << latest->storageKey() << " is listed but unreadable\n";
      return std::nullopt;
    }
    std::cout << "[TieredBackupManager] restored backup from "
              << formatIsoUtc(latest->timestamp_ms) << " (tier "
              << latest->tier << ")\n";
    return content;
  } catch (const std::exception& e) {
    std::cerr << "[TieredBackupManager] ERROR: restore of "
              << latest->storageKey() << " failed: " << e.what() << "\n";
    return std::nullopt;
  }
}

BackupStatistics TieredBackupManager::statistics() {
  std::lock_guard lock(mutex_);
  BackupStatistics stats;
  for (const auto& tier : tiers_) {
    const auto& records = tierRecordsLocked(tier.name);
    stats.counts.emplace_back(tier.name, static_cast<int>(records.size()));
    for (const auto& record : records) {
      if (!stats.oldest_ms || record.timestamp_ms < *stats.oldest_ms) {
        stats.oldest_ms = record.timestamp_ms;
      }
      if (!stats.newest_ms || record.timestamp_ms > *stats.newest_ms) {
        stats.newest_ms = record.timestamp_ms;
      }
    }
  }
  return stats;
}

}  // namespace arb
