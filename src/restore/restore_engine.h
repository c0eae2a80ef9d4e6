/**
 * @file restore_engine.h
 * @brief Replays a parsed dump against a target database
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "dump/dump_statement.h"
#include "mysql/session_interface.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::restore {

/**
 * @brief Restore options
 */
struct RestoreOptions {
  bool allow_truncated = false;             // replay a dump without completion marker
  std::function<bool()> cancel_requested;  // polled between tables
};

/**
 * @brief Restore summary
 */
struct RestoreStats {
  size_t tables = 0;
  uint64_t statements = 0;
  uint64_t rows_affected = 0;
  double elapsed_seconds = 0.0;
};

/**
 * @brief Restore engine
 *
 * Each table section runs its schema statements first (the server commits
 * DDL implicitly), then all its data statements inside one transaction.
 * The first failing statement rolls that transaction back and stops the
 * restore; tables already committed stay restored.
 */
class RestoreEngine {
 public:
  RestoreEngine(mysql::ISession& session, RestoreOptions options)
      : session_(session), options_(std::move(options)) {}

  /**
   * @brief Replay @p dump
   *
   * @return Stats, or an error: kRestoreTruncatedDump (refused),
   *         kRestoreStatementFailed (table and statement index set),
   *         kMySQLTransactionFailed, kCancelled
   */
  utils::Expected<RestoreStats, utils::Error> Restore(const dump::ParsedDump& dump);

  /**
   * @brief Parse the file at @p path and replay it
   * @return kRestoreFileNotFound when the file does not exist
   */
  utils::Expected<RestoreStats, utils::Error> RestoreFromFile(const std::string& path);

 private:
  mysql::ISession& session_;
  RestoreOptions options_;

  utils::Expected<void, utils::Error> ExecuteSessionStatements(const std::vector<dump::DumpStatement>& statements,
                                                               const std::string& phase, RestoreStats& stats);
  utils::Expected<void, utils::Error> RestoreTable(const dump::TableSection& section, RestoreStats& stats);
};

}  // namespace sqlbackup::restore
