/**
 * @file backup_runner.h
 * @brief Backup orchestration: introspect, dump every table, rotate
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

#include "backup/retention_manager.h"
#include "dump/data_dumper.h"
#include "mysql/session_interface.h"
#include "schema/ddl_emitter.h"
#include "utils/constants.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::backup {

/**
 * @brief Backup options
 */
struct BackupOptions {
  std::string database;  // empty = session database
  std::string path;      // output file, or base path in incremental mode
  size_t incremental = 0;  // > 0: timestamped file name, keep this many
  bool overwrite = false;
  size_t batch_size = constants::kDefaultBatchSize;
  schema::DdlSource ddl_source = schema::DdlSource::kServer;
  bool add_drop_table = true;
  bool single_transaction = true;  // read all tables from one snapshot
  std::string tool_version;

  std::function<bool()> cancel_requested;  // polled between tables
  std::function<std::chrono::system_clock::time_point()> clock;  // defaults to system_clock::now
  dump::DumpProgressCallback progress_callback;
  FileRemover remove_backup;  // deletes pruned backups; empty = std::filesystem::remove
};

/**
 * @brief Backup summary
 */
struct BackupResult {
  std::string path;
  size_t tables = 0;
  uint64_t rows = 0;
  uint64_t statements = 0;
  uint64_t bytes = 0;
  double elapsed_seconds = 0.0;
  bool fk_cycle = false;
  RetentionReport retention;
};

/**
 * @brief Backup runner
 *
 * Drives one backup over an already connected session:
 * - pins the session time zone to UTC and opens a consistent snapshot
 * - introspects the database (tables come back in dependency order)
 * - writes header, one section per table and the completion marker
 * - prunes old incremental backups once the new file is complete
 *
 * A failed dump leaves the partial file on disk; it has no completion
 * marker, so a restore refuses it by default.
 */
class BackupRunner {
 public:
  BackupRunner(mysql::ISession& session, BackupOptions options);

  /**
   * @brief Run the backup into the file named by the options
   */
  utils::Expected<BackupResult, utils::Error> Run();

  /**
   * @brief Write the whole dump to @p out
   *
   * Does not touch the file system; Run() wraps it with file creation and
   * retention.
   */
  utils::Expected<BackupResult, utils::Error> Dump(std::ostream& out);

  /**
   * @brief Output path for a backup started at @p now
   */
  [[nodiscard]] std::string ResolveOutputPath(std::chrono::system_clock::time_point now) const;

 private:
  mysql::ISession& session_;
  BackupOptions options_;

  std::chrono::system_clock::time_point Now() const;
};

}  // namespace sqlbackup::backup
