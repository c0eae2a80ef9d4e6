/**
 * @file retention_manager.cpp
 * @brief Retention manager implementation
 */

#include "backup/retention_manager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "utils/constants.h"
#include "utils/structured_log.h"

namespace sqlbackup::backup {

namespace fs = std::filesystem;

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr size_t kDatePartLength = 8;

fs::path DirectoryOf(const fs::path& base) {
  return base.has_parent_path() ? base.parent_path() : fs::path(".");
}

}  // namespace

std::string FormatBackupTimestamp(std::chrono::system_clock::time_point time) {
  std::time_t seconds = std::chrono::system_clock::to_time_t(time);
  std::tm utc{};
  gmtime_r(&seconds, &utc);
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y%m%d_%H%M%S");
  return oss.str();
}

bool IsBackupTimestamp(std::string_view text) {
  if (text.size() != constants::kTimestampPrefixLength) {
    return false;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    if (i == kDatePartLength) {
      if (text[i] != '_') {
        return false;
      }
    } else if (std::isdigit(static_cast<unsigned char>(text[i])) == 0) {
      return false;
    }
  }
  return true;
}

std::string RetentionManager::ResolveIncrementalPath(std::chrono::system_clock::time_point now) const {
  const fs::path base(base_path_);
  const std::string name = FormatBackupTimestamp(now) + "_" + base.filename().string();
  return base.has_parent_path() ? (base.parent_path() / name).string() : name;
}

Expected<std::vector<BackupEntry>, Error> RetentionManager::ListBackups() const {
  const fs::path base(base_path_);
  const fs::path directory = DirectoryOf(base);
  const std::string suffix = "_" + base.filename().string();

  std::vector<BackupEntry> entries;
  std::error_code error_code;
  if (!fs::exists(directory, error_code)) {
    return entries;
  }

  fs::directory_iterator iter(directory, error_code);
  if (error_code) {
    return MakeUnexpected(MakeError(ErrorCode::kRetentionListFailed,
                                    "Failed to list " + directory.string() + ": " + error_code.message()));
  }

  for (const fs::directory_iterator end; iter != end; iter.increment(error_code)) {
    if (error_code) {
      return MakeUnexpected(MakeError(ErrorCode::kRetentionListFailed,
                                      "Failed to list " + directory.string() + ": " + error_code.message()));
    }
    std::error_code type_error;
    if (!iter->is_regular_file(type_error)) {
      continue;
    }
    const std::string filename = iter->path().filename().string();
    if (filename.size() != constants::kTimestampPrefixLength + suffix.size() ||
        filename.compare(constants::kTimestampPrefixLength, suffix.size(), suffix) != 0) {
      continue;
    }
    std::string timestamp = filename.substr(0, constants::kTimestampPrefixLength);
    if (!IsBackupTimestamp(timestamp)) {
      continue;
    }
    entries.push_back({iter->path().string(), std::move(timestamp)});
  }

  std::sort(entries.begin(), entries.end(), [](const BackupEntry& lhs, const BackupEntry& rhs) {
    return lhs.timestamp != rhs.timestamp ? lhs.timestamp < rhs.timestamp : lhs.path < rhs.path;
  });
  return entries;
}

Expected<RetentionReport, Error> RetentionManager::Prune(size_t keep) const {
  RetentionReport report;
  if (keep == 0) {
    return report;
  }

  auto entries = ListBackups();
  if (!entries) {
    return MakeUnexpected(entries.error());
  }

  const size_t excess = entries->size() > keep ? entries->size() - keep : 0;
  for (size_t i = 0; i < entries->size(); ++i) {
    const auto& entry = (*entries)[i];
    if (i >= excess) {
      report.kept.push_back(entry.path);
      continue;
    }

    std::error_code error_code;
    const bool removed = remover_ ? remover_(entry.path, error_code) : fs::remove(entry.path, error_code);
    if (removed && !error_code) {
      spdlog::info("Removed old backup {}", entry.path);
      report.deleted.push_back(entry.path);
      continue;
    }

    std::string reason = error_code ? error_code.message() : "file disappeared";
    utils::StructuredLog()
        .Event("retention_delete_failed")
        .Field("filepath", entry.path)
        .Field("error", reason)
        .Warn();
    report.errors.push_back(
        MakeError(ErrorCode::kRetentionDeleteFailed, "Failed to delete " + entry.path + ": " + reason, entry.path));
  }
  return report;
}

}  // namespace sqlbackup::backup
