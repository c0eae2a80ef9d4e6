/**
 * @file data_dumper.h
 * @brief Streams table rows into batched INSERT statements
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "mysql/session_interface.h"
#include "schema/table_schema.h"
#include "utils/constants.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::dump {

/**
 * @brief Dump progress information
 */
struct DumpProgress {
  std::string table;
  uint64_t rows_emitted = 0;
  uint64_t statements_emitted = 0;
  double elapsed_seconds = 0.0;
  double rows_per_second = 0.0;
};

/**
 * @brief Progress callback, called after every emitted batch
 */
using DumpProgressCallback = std::function<void(const DumpProgress&)>;

/**
 * @brief Receives each INSERT statement and the number of rows it carries
 */
using StatementSink = std::function<utils::Expected<void, utils::Error>(const std::string& statement, size_t rows)>;

/**
 * @brief Data dumper options
 */
struct DataDumpOptions {
  size_t batch_size = constants::kDefaultBatchSize;  // rows per INSERT, 0 = default
};

/**
 * @brief Per-table dump summary
 */
struct TableDumpStats {
  uint64_t rows = 0;
  uint64_t statements = 0;
  double elapsed_seconds = 0.0;
};

/**
 * @brief Data dumper
 *
 * Reads a table through a streaming cursor and hands full batches to the
 * sink as they fill, so at most one batch of rows is held in memory. A
 * table of R rows with batch size B yields ceil(R/B) statements, in cursor
 * order; an empty table yields none.
 */
class DataDumper {
 public:
  DataDumper(mysql::ISession& session, DataDumpOptions options);

  /**
   * @brief Dump every row of @p table
   *
   * @return Stats, or a kDumpStreamFailed / kDumpWriteFailed error carrying
   *         the table name and the rows already emitted
   */
  utils::Expected<TableDumpStats, utils::Error> DumpTable(const schema::TableSchema& table, const StatementSink& sink,
                                                          const DumpProgressCallback& progress_callback = {});

  /**
   * @brief SELECT listing insertable columns in ordinal order
   */
  static std::string BuildSelectQuery(const schema::TableSchema& table);

  [[nodiscard]] size_t batch_size() const { return options_.batch_size; }

 private:
  mysql::ISession& session_;
  DataDumpOptions options_;
};

}  // namespace sqlbackup::dump
