#include "arb/storage/file_backup_storage.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace arb {

FileBackupStorage::FileBackupStorage(fs::path root, std::string name)
    : root_(std::move(root)), name_(std::move(name)) {}

std::optional<fs::path> FileBackupStorage::pathFor(
    const std::string& key) const {
  if (key.empty()) {
    return std::nullopt;
  }
  fs::path relative(key);
  if (relative.is_absolute() || relative.has_root_name()) {
    return std::nullopt;
  }
  for (const auto& part : relative) {
    if (part == "..") {
      return std::nullopt;
    }
  }
  return root_ / relative;
}

bool FileBackupStorage::save(const std::string& key,
                             const std::string& content) {
  auto path = pathFor(key);
  if (!path) {
    return false;
  }
  std::lock_guard lock(mutex_);
  std::error_code ec;
  fs::create_directories(path->parent_path(), ec);
  if (ec) {
    std::cerr << "[FileBackupStorage] ERROR: cannot create "
              << path->parent_path() << ": " << ec.message() << "\n";
    return false;
  }

  // Temp file, then rename into place.
  fs::path temp = *path;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    out << content;
    if (!out) {
      std::cerr << "[FileBackupStorage] ERROR: write failed for " << temp
                << "\n";
      return false;
    }
  }
  fs::rename(temp, *path, ec);
  if (ec) {
    std::cerr << "[FileBackupStorage] ERROR: rename to " << *path
              << " failed: " << ec.message() << "\n";
    fs::remove(temp, ec);
    return false;
  }
  return true;
}

std::optional<std::string> FileBackupStorage::read(
    const std::string& key) const {
  auto path = pathFor(key);
  if (!path) {
    return std::nullopt;
  }
  std::lock_guard lock(mutex_);
  std::ifstream in(*path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

bool FileBackupStorage::remove(const std::string& key) {
  auto path = pathFor(key);
  if (!path) {
    return false;
  }
  std::lock_guard lock(mutex_);
  std::error_code ec;
  return fs::remove(*path, ec);
}

bool FileBackupStorage::exists(const std::string& key) const {
  auto path = pathFor(key);
  if (!path) {
    return false;
  }
  std::lock_guard lock(mutex_);
  std::error_code ec;
  return fs::is_regular_file(*path, ec);
}

std::vector<std::string> FileBackupStorage::listKeys(
    const std::string& prefix) const {
  std::vector<std::string> keys;
  std::lock_guard lock(mutex_);
  if (!fs::exists(root_)) {
    return keys;
  }
  for (const auto& entry : fs::recursive_directory_iterator(root_)) {
    if (!entry.is_regular_file() || entry.path().extension() == ".tmp") {
      continue;
    }
    std::string key = fs::relative(entry.path(), root_).generic_string();
    if (key.compare(0, prefix.size(), prefix) == 0) {
      keys.push_back(std::move(key));
    }
  }
  return keys;
}

}  // namespace arb
