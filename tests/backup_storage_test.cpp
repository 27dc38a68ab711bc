// =============================================================================
// backup_storage_test.cpp
// =============================================================================
// Unit tests for grid-state backups:
//   arb::BackupRecord, arb::TierSettings, the storages and
//   arb::TieredBackupManager.
//
// Validates:
//   - Storage key format and strict key parsing
//   - Tier validation
//   - In-memory and file storage contract (save/read/remove/list)
//   - File storage refuses keys escaping its root
//   - First-tier rate limit, rotation to max_count, fan-out to storages
//   - restoreLatest() picks the newest record; records survive a restart
// =============================================================================

#include "arb/storage/backup_types.hpp"
#include "arb/storage/file_backup_storage.hpp"
#include "arb/storage/in_memory_backup_storage.hpp"
#include "arb/storage/tiered_backup_manager.hpp"
#include "arb/time/simulation_time_provider.hpp"
#include "arb/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>

using arb::BackupRecord;
using arb::InMemoryBackupStorage;
using arb::TierSettings;
using arb::TieredBackupManager;

namespace {

// 2023-11-14 22:13:20 UTC
constexpr std::int64_t kT0 = 1700000000000;

// Storage whose saves always fail.
class FailingStorage : public InMemoryBackupStorage {
 public:
  FailingStorage() : InMemoryBackupStorage("failing") {}
  bool save(const std::string&, const std::string&) override { return false; }
};

}  // namespace

// -----------------------------------------------------------------------------
// 1. Keys: trade_data/{owner}/backups/{tier}/{yyyyMMdd_HHmmss}.
// -----------------------------------------------------------------------------
TEST(BackupRecordTest, StorageKeyFormat) {
  BackupRecord record("engine", "min", kT0 + 789);
  EXPECT_EQ(record.timestamp_ms, kT0);
  EXPECT_EQ(record.storageKey(),
            "trade_data/engine/backups/min/20231114_221320");
}

TEST(BackupRecordTest, ParseIsStrict) {
  auto parsed =
      BackupRecord::tryParse("trade_data/engine/backups/hour/20231114_221320");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->owner, "engine");
  EXPECT_EQ(parsed->tier, "hour");
  EXPECT_EQ(parsed->timestamp_ms, kT0);

  EXPECT_FALSE(BackupRecord::tryParse("").has_value());
  EXPECT_FALSE(
      BackupRecord::tryParse("other/engine/backups/hour/20231114_221320")
          .has_value());
  EXPECT_FALSE(
      BackupRecord::tryParse("trade_data/engine/backups/hour/2023-11-14")
          .has_value());
  EXPECT_FALSE(BackupRecord::tryParse(
                   "trade_data/engine/backups/hour/20231114_221320/x")
                   .has_value());
}

TEST(TierSettingsTest, Validation) {
  EXPECT_THROW(TierSettings(" ", 1000, 1), std::invalid_argument);
  EXPECT_THROW(TierSettings("min", 0, 1), std::invalid_argument);
  EXPECT_THROW(TierSettings("min", 1000, -1), std::invalid_argument);

  auto tiers = arb::defaultBackupTiers();
  ASSERT_EQ(tiers.size(), 3u);
  EXPECT_EQ(tiers[0].name, "min");
  EXPECT_EQ(tiers[0].max_count, 50);
  EXPECT_EQ(tiers[2].interval_ms, arb::kMsPerDay);
}

// -----------------------------------------------------------------------------
// 2. Storage contract on the in-memory store.
// -----------------------------------------------------------------------------
TEST(InMemoryBackupStorageTest, Contract) {
  InMemoryBackupStorage storage;
  EXPECT_TRUE(storage.save("a/b/1", "one"));
  EXPECT_TRUE(storage.save("a/c/2", "two"));
  EXPECT_TRUE(storage.exists("a/b/1"));
  EXPECT_EQ(storage.read("a/b/1").value_or(""), "one");
  EXPECT_EQ(storage.listKeys("a/b/").size(), 1u);
  EXPECT_EQ(storage.listKeys("a/").size(), 2u);
  EXPECT_TRUE(storage.remove("a/b/1"));
  EXPECT_FALSE(storage.remove("a/b/1"));
  EXPECT_FALSE(storage.read("a/b/1").has_value());
}

// -----------------------------------------------------------------------------
// 3. File storage: same contract on disk; keys cannot escape the root.
// -----------------------------------------------------------------------------
class FileBackupStorageTest : public ::testing::Test {
 protected:
  std::filesystem::path root;

  void SetUp() override {
    root = std::filesystem::temp_directory_path() /
           ("arb_backup_test_" +
            std::to_string(std::chrono::steady_clock::now()
                               .time_since_epoch()
                               .count()));
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }
};

TEST_F(FileBackupStorageTest, Contract) {
  arb::FileBackupStorage storage(root);
  const std::string key = "trade_data/e/backups/min/20231114_221320";

  EXPECT_TRUE(storage.listKeys("").empty());
  EXPECT_TRUE(storage.save(key, "{\"version\":1}"));
  EXPECT_TRUE(storage.exists(key));
  EXPECT_EQ(storage.read(key).value_or(""), "{\"version\":1}");

  auto keys = storage.listKeys("trade_data/e/backups/min/");
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys[0], key);

  EXPECT_TRUE(storage.remove(key));
  EXPECT_FALSE(storage.exists(key));
}

TEST_F(FileBackupStorageTest, RefusesEscapingKeys) {
  arb::FileBackupStorage storage(root);
  EXPECT_FALSE(storage.save("../outside", "x"));
  EXPECT_FALSE(storage.save("/etc/passwd", "x"));
  EXPECT_FALSE(storage.read("a/../../b").has_value());
  EXPECT_FALSE(storage.remove(""));
}

// =============================================================================
// TieredBackupManager
// =============================================================================

class TieredBackupManagerTest : public ::testing::Test {
 protected:
  arb::SimulationTimeProvider clock{kT0};
  std::shared_ptr<InMemoryBackupStorage> storage =
      std::make_shared<InMemoryBackupStorage>();

  std::vector<TierSettings> smallTiers() {
    return {TierSettings("min", 5 * arb::kMsPerMinute, 3),
            TierSettings("hour", arb::kMsPerHour, 2)};
  }
};

// -----------------------------------------------------------------------------
// 4. The first save goes to the first tier; saves inside its interval are
//    refused.
// -----------------------------------------------------------------------------
TEST_F(TieredBackupManagerTest, FirstTierRateLimits) {
  TieredBackupManager manager("engine", {storage}, clock);

  EXPECT_TRUE(manager.saveBackup("one"));
  auto keys = storage->listKeys("trade_data/engine/backups/min/");
  ASSERT_EQ(keys.size(), 1u);

  clock.advance_by(arb::kMsPerMinute);
  EXPECT_FALSE(manager.saveBackup("two"));
  EXPECT_EQ(storage->size(), 1u);

  clock.advance_by(4 * arb::kMsPerMinute);
  EXPECT_TRUE(manager.saveBackup("three"));
  EXPECT_EQ(storage->size(), 2u);
}

// -----------------------------------------------------------------------------
// 5. A tier holds at most max_count records; the oldest are deleted.
// -----------------------------------------------------------------------------
TEST_F(TieredBackupManagerTest, RotatesToMaxCount) {
  TieredBackupManager manager("engine", {storage}, clock, smallTiers());

  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(manager.saveBackup("backup " + std::to_string(i)));
    clock.advance_by(5 * arb::kMsPerMinute);
  }

  auto stats = manager.statistics();
  EXPECT_EQ(stats.count("min"), 3);
  EXPECT_EQ(stats.count("hour"), 0);
  EXPECT_EQ(stats.total(), 3);
  EXPECT_EQ(storage->size(), 3u);
  ASSERT_TRUE(stats.oldest_ms.has_value());
  EXPECT_EQ(*stats.oldest_ms, kT0 + 2 * 5 * arb::kMsPerMinute);
  EXPECT_EQ(manager.restoreLatest().value_or(""), "backup 4");
}

TEST_F(TieredBackupManagerTest, WritesToEveryStorage) {
  auto second = std::make_shared<InMemoryBackupStorage>("second");
  TieredBackupManager manager("engine", {storage, second}, clock);

  EXPECT_TRUE(manager.saveBackup("content"));
  EXPECT_EQ(storage->size(), 1u);
  EXPECT_EQ(second->size(), 1u);
}

// -----------------------------------------------------------------------------
// 6. A failing storage fails the save and does not consume the interval.
// -----------------------------------------------------------------------------
TEST_F(TieredBackupManagerTest, FailedSaveDoesNotAdvanceTier) {
  auto failing = std::make_shared<FailingStorage>();
  TieredBackupManager manager("engine", {storage, failing}, clock);

  EXPECT_FALSE(manager.saveBackup("content"));

  // Still the first save as far as the tier clock is concerned.
  EXPECT_FALSE(manager.saveBackup("again"));
  EXPECT_EQ(storage->size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. A new manager over the same storage finds earlier records.
//    Why: retention and restore must work across process restarts.
// -----------------------------------------------------------------------------
TEST_F(TieredBackupManagerTest, RecordsSurviveRestart) {
  {
    TieredBackupManager first("engine", {storage}, clock, smallTiers());
    first.saveBackup("old");
    clock.advance_by(5 * arb::kMsPerMinute);
    first.saveBackup("new");
  }

  TieredBackupManager second("engine", {storage}, clock, smallTiers());
  EXPECT_EQ(second.statistics().count("min"), 2);
  EXPECT_EQ(second.restoreLatest().value_or(""), "new");
}

TEST_F(TieredBackupManagerTest, EmptyAndInvalidSetups) {
  TieredBackupManager none("engine", {}, clock);
  EXPECT_FALSE(none.saveBackup("x"));
  EXPECT_FALSE(none.restoreLatest().has_value());

  TieredBackupManager fresh("engine", {storage}, clock);
  EXPECT_FALSE(fresh.restoreLatest().has_value());

  EXPECT_THROW(TieredBackupManager("", {storage}, clock),
               std::invalid_argument);
  EXPECT_THROW(TieredBackupManager("a/b", {storage}, clock),
               std::invalid_argument);
  EXPECT_THROW(TieredBackupManager("engine", {nullptr}, clock),
               std::invalid_argument);
  EXPECT_THROW(TieredBackupManager("engine", {storage}, clock, {}),
               std::invalid_argument);
}
