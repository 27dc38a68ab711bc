#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arb {

// One retention tier: save at most every interval_ms, keep max_count.
struct TierSettings {
  // @throws std::invalid_argument for a blank name, interval_ms <= 0 or
  //         max_count <= 0.
  TierSettings(std::string name, std::int64_t interval_ms, int max_count);

  std::string name;
  std::int64_t interval_ms;
  int max_count;
};

// min 5m/50, hour 1h/24, daily 1d/7.
std::vector<TierSettings> defaultBackupTiers();

struct BackupStatistics {
  // Backups per tier name, in tier order.
  std::vector<std::pair<std::string, int>> counts;
  std::optional<std::int64_t> oldest_ms;
  std::optional<std::int64_t> newest_ms;

  int count(const std::string& tier) const;
  int total() const;
};

// -----------------------------------------------------------------------------
// BackupRecord
// -----------------------------------------------------------------------------
// A backup's identity. The storage key is derived, never stored:
//
//     trade_data/{owner}/backups/{tier}/{yyyyMMdd_HHmmss}
//
// Timestamps have one-second resolution in the key; timestamp_ms is
// truncated to the second on construction so key and record agree.
// -----------------------------------------------------------------------------
struct BackupRecord {
  BackupRecord(std::string owner, std::string tier, std::int64_t timestamp_ms);

  std::string owner;
  std::string tier;
  std::int64_t timestamp_ms;

  std::string storageKey() const;

  // std::nullopt for anything that is not exactly five '/'-separated parts
  // with "trade_data" first, "backups" third and a valid timestamp last.
  static std::optional<BackupRecord> tryParse(const std::string& key);
};

std::string backupKeyPrefix(const std::string& owner, const std::string& tier);

}  // namespace arb
