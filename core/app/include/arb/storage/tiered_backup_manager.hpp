#pragma once

#include "arb/storage/backup_types.hpp"
#include "arb/storage/i_backup_storage.hpp"
#include "arb/time/i_time_provider.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// TieredBackupManager
// -----------------------------------------------------------------------------
//
// @brief  Rotating grid-state backups across retention tiers and storages.
//
// @details
// saveBackup(content):
//   - The first tier is the global rate limit: nothing is saved until its
//     interval has passed since its last save.
//   - Once it has, the first tier (in order) that has never been saved or
//     whose own interval has passed receives the backup. Tiers are tried
//     in configured order, so a due first tier always takes the backup.
//   - The content is written to every storage. The save counts only if all
//     of them succeed; only then is the tier's clock advanced and the tier
//     trimmed to max_count (oldest deleted from every storage).
//
// restoreLatest() reads the newest record across all tiers from the first
// storage. statistics() counts records per tier with the oldest and newest
// timestamps.
//
// Records already in the first storage are discovered the first time a
// tier is touched, so retention keeps working across restarts.
//
// With no storages configured every call is a no-op (false / nullopt).
//
// Thread model: one mutex around everything; callable from the evaluation
// loop and from the IPC thread (BACKUP command).
// -----------------------------------------------------------------------------
class TieredBackupManager {
 public:
  // @throws std::invalid_argument for an empty owner, no tiers, duplicate
  //         tier names or a null storage.
  TieredBackupManager(std::string owner,
                      std::vector<std::shared_ptr<IBackupStorage>> storages,
                      const ITimeProvider& time_provider,
                      std::vector<TierSettings> tiers = defaultBackupTiers());

  // Returns true if a backup was written to every storage.
  bool saveBackup(const std::string& content);

  std::optional<std::string> restoreLatest();

  BackupStatistics statistics();

  const std::string& owner() const { return owner_; }
  const std::vector<TierSettings>& tiers() const { return tiers_; }

 private:
  // Caller holds mutex_ for all of these.
  const TierSettings* selectTierLocked(std::int64_t now_ms) const;
  std::vector<BackupRecord>& tierRecordsLocked(const std::string& tier);
  void cleanupTierLocked(const TierSettings& tier);

  std::string owner_;
  std::vector<std::shared_ptr<IBackupStorage>> storages_;
  const ITimeProvider& time_provider_;
  std::vector<TierSettings> tiers_;

  std::mutex mutex_;
  std::map<std::string, std::int64_t> last_save_ms_;
  std::map<std::string, std::vector<BackupRecord>> records_;
};

}  // namespace arb
