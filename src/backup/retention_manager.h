/**
 * @file retention_manager.h
 * @brief Timestamped backup naming and rotation
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::backup {

/**
 * @brief One timestamped backup file
 */
struct BackupEntry {
  std::string path;
  std::string timestamp;  // "YYYYMMDD_HHMMSS"
};

/**
 * @brief Outcome of a pruning pass
 *
 * Deletion failures are collected, never returned as the pass's error.
 */
struct RetentionReport {
  std::vector<std::string> kept;
  std::vector<std::string> deleted;
  std::vector<utils::Error> errors;  // kRetentionDeleteFailed, one per file
};

/**
 * @brief Deletes one backup file; same contract as std::filesystem::remove
 */
using FileRemover = std::function<bool(const std::string& path, std::error_code& error_code)>;

/**
 * @brief Format @p time as "YYYYMMDD_HHMMSS" in UTC
 */
std::string FormatBackupTimestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Check "YYYYMMDD_HHMMSS" shape (8 digits, '_', 6 digits)
 */
bool IsBackupTimestamp(std::string_view text);

/**
 * @brief Retention manager for incremental backups of one base path
 *
 * Incremental backups of "dir/shop.sql" are named
 * "dir/<YYYYMMDD_HHMMSS>_shop.sql"; the fixed-width UTC timestamp makes
 * name order equal creation order.
 */
class RetentionManager {
 public:
  /**
   * @param base_path Base path given on the command line
   * @param remover Deletes pruned files; empty uses std::filesystem::remove
   */
  explicit RetentionManager(std::string base_path, FileRemover remover = {})
      : base_path_(std::move(base_path)), remover_(std::move(remover)) {}

  /**
   * @brief Path of the incremental backup taken at @p now
   */
  [[nodiscard]] std::string ResolveIncrementalPath(std::chrono::system_clock::time_point now) const;

  /**
   * @brief Existing incremental backups, oldest first
   * @return kRetentionListFailed when the directory cannot be read
   */
  [[nodiscard]] utils::Expected<std::vector<BackupEntry>, utils::Error> ListBackups() const;

  /**
   * @brief Delete all but the @p keep newest incremental backups
   *
   * @p keep of 0 deletes nothing. Files not matching the naming scheme are
   * never touched.
   */
  [[nodiscard]] utils::Expected<RetentionReport, utils::Error> Prune(size_t keep) const;

  [[nodiscard]] const std::string& base_path() const { return base_path_; }

 private:
  std::string base_path_;
  FileRemover remover_;
};

}  // namespace sqlbackup::backup
