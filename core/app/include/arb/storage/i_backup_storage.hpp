#pragma once

#include <optional>
#include <string>
#include <vector>

namespace arb {

// -----------------------------------------------------------------------------
// IBackupStorage
// -----------------------------------------------------------------------------
// Key/value store for grid state backups. Keys look like
//
//     trade_data/{owner}/backups/{tier}/{yyyyMMdd_HHmmss}
//
// and are treated as opaque by implementations apart from listKeys(),
// which matches on a plain string prefix.
//
// Implementations may throw on I/O failure; TieredBackupManager catches,
// logs and carries on with the next storage.
// -----------------------------------------------------------------------------
class IBackupStorage {
 public:
  virtual ~IBackupStorage() = default;

  virtual const std::string& name() const = 0;

  virtual bool save(const std::string& key, const std::string& content) = 0;

  virtual std::optional<std::string> read(const std::string& key) const = 0;

  // Returns false if the key did not exist.
  virtual bool remove(const std::string& key) = 0;

  virtual bool exists(const std::string& key) const = 0;

  virtual std::vector<std::string> listKeys(const std::string& prefix) const = 0;
};

}  // namespace arb
