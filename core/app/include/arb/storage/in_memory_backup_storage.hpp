#pragma once

#include "arb/storage/i_backup_storage.hpp"

#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace arb {

// Map-backed IBackupStorage for tests and for runs without a backup
// directory. Contents are lost with the process.
class InMemoryBackupStorage : public IBackupStorage {
 public:
  explicit InMemoryBackupStorage(std::string name = "memory")
      : name_(std::move(name)) {}

  const std::string& name() const override { return name_; }

  bool save(const std::string& key, const std::string& content) override;
  std::optional<std::string> read(const std::string& key) const override;
  bool remove(const std::string& key) override;
  bool exists(const std::string& key) const override;
  std::vector<std::string> listKeys(const std::string& prefix) const override;

  std::size_t size() const;

 private:
  std::string name_;
  mutable std::mutex mutex_;
  std::map<std::string, std::string> entries_;
};

}  // namespace arb
