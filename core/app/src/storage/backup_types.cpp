#include "arb/storage/backup_types.hpp"

#include "arb/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace arb {

TierSettings::TierSettings(std::string name_, std::int64_t interval_ms_,
                           int max_count_)
    : name(std::move(name_)), interval_ms(interval_ms_), max_count(max_count_) {
  if (std::all_of(name.begin(), name.end(),
                  [](unsigned char c) { return std::isspace(c) != 0; })) {
    throw std::invalid_argument("TierSettings: name must not be empty");
  }
  if (interval_ms <= 0) {
    throw std::invalid_argument("TierSettings '" + name +
                                "': interval_ms must be > 0");
  }
  if (max_count <= 0) {
    throw std::invalid_argument("TierSettings '" + name +
                                "': max_count must be > 0");
  }
}

std::vector<TierSettings> defaultBackupTiers() {
  return {
      TierSettings("min", 5 * kMsPerMinute, 50),
      TierSettings("hour", kMsPerHour, 24),
      TierSettings("daily", kMsPerDay, 7),
  };
}

int BackupStatistics::count(const std::string& tier) const {
  for (const auto& [name, n] : counts) {
    if (name == tier) {
      return n;
    }
  }
  return 0;
}

int BackupStatistics::total() const {
  int sum = 0;
  for (const auto& entry : counts) {
    sum += entry.second;
  }
  return sum;
}

BackupRecord::BackupRecord(std::string owner_, std::string tier_,
                           std::int64_t timestamp_ms_)
    : owner(std::move(owner_)),
      tier(std::move(tier_)),
      timestamp_ms(timestamp_ms_ - ((timestamp_ms_ % kMsPerSecond) +
                                    kMsPerSecond) % kMsPerSecond) {}

std::string backupKeyPrefix(const std::string& owner, const std::string& tier) {
  return "trade_data/" + owner + "/backups/" + tier + "/";
}

std::string BackupRecord::storageKey() const {
  return backupKeyPrefix(owner, tier) + formatCompactUtc(timestamp_ms);
}

std::optional<BackupRecord> BackupRecord::tryParse(const std::string& key) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    std::size_t slash = key.find('/', start);
    parts.push_back(key.substr(start, slash - start));
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  if (parts.size() != 5 || parts[0] != "trade_data" || parts[2] != "backups" ||
      parts[1].empty() || parts[3].empty()) {
    return std::nullopt;
  }
  auto timestamp = parseCompactUtc(parts[4]);
  if (!timestamp) {
    return std::nullopt;
  }
  return BackupRecord(parts[1], parts[3], *timestamp);
}

}  // namespace arb
