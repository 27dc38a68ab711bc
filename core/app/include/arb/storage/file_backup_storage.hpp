#pragma once

#include "arb/storage/i_backup_storage.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace arb {

// -----------------------------------------------------------------------------
// FileBackupStorage
// -----------------------------------------------------------------------------
// One file per key under a root directory; '/' in a key becomes a
// directory level. Keys that are absolute or contain a ".." segment are
// refused (save/remove return false, read returns nothing).
//
// Filesystem errors surface as std::filesystem::filesystem_error from
// listKeys(); single-file operations report them as false / nullopt.
// -----------------------------------------------------------------------------
class FileBackupStorage : public IBackupStorage {
 public:
  explicit FileBackupStorage(std::filesystem::path root,
                             std::string name = "file");

  const std::string& name() const override { return name_; }

  bool save(const std::string& key, const std::string& content) override;
  std::optional<std::string> read(const std::string& key) const override;
  bool remove(const std::string& key) override;
  bool exists(const std::string& key) const override;
  std::vector<std::string> listKeys(const std::string& prefix) const override;

  const std::filesystem::path& root() const { return root_; }

 private:
  std::optional<std::filesystem::path> pathFor(const std::string& key) const;

  std::filesystem::path root_;
  std::string name_;
  mutable std::mutex mutex_;
};

}  // namespace arb
