/**
 * @file data_dumper.cpp
 * @brief Data dumper implementation
 */

#include "dump/data_dumper.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <vector>

#include "dump/value_encoder.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace sqlbackup::dump {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

DataDumper::DataDumper(mysql::ISession& session, DataDumpOptions options) : session_(session), options_(options) {
  if (options_.batch_size == 0) {
    options_.batch_size = constants::kDefaultBatchSize;
  }
}

std::string DataDumper::BuildSelectQuery(const schema::TableSchema& table) {
  return "SELECT " + utils::QuoteIdentifierList(table.InsertableColumnNames()) + " FROM " +
         utils::QuoteIdentifier(table.name);
}

Expected<TableDumpStats, Error> DataDumper::DumpTable(const schema::TableSchema& table, const StatementSink& sink,
                                                      const DumpProgressCallback& progress_callback) {
  const std::vector<std::string> columns = table.InsertableColumnNames();
  TableDumpStats stats;
  if (columns.empty()) {
    return stats;
  }

  auto start_time = std::chrono::steady_clock::now();
  auto elapsed = [&start_time]() {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
  };

  const std::string query = BuildSelectQuery(table);
  spdlog::debug("Dumping table {} with query: {}", table.name, query);

  auto cursor = session_.OpenStreamingCursor(query);
  if (!cursor) {
    Error error = MakeError(ErrorCode::kDumpStreamFailed, "Failed to open row stream: " + cursor.error().message(),
                            cursor.error().to_string());
    error.WithTable(table.name).WithRowsEmitted(0);
    return MakeUnexpected(std::move(error));
  }
  if ((*cursor)->ColumnCount() != columns.size()) {
    Error error = MakeError(ErrorCode::kDumpStreamFailed,
                            "Row stream returned " + std::to_string((*cursor)->ColumnCount()) + " columns, expected " +
                                std::to_string(columns.size()));
    error.WithTable(table.name).WithRowsEmitted(0);
    return MakeUnexpected(std::move(error));
  }

  std::vector<mysql::Row> batch;
  batch.reserve(std::min(options_.batch_size, constants::kDefaultBatchSize));
  uint64_t next_progress_log = constants::kProgressLogIntervalRows;

  auto flush = [&]() -> Expected<void, Error> {
    auto written = sink(BuildInsertStatement(table.name, columns, batch), batch.size());
    if (!written) {
      Error error = MakeError(ErrorCode::kDumpWriteFailed, "Failed to write INSERT batch: " + written.error().message(),
                              written.error().to_string());
      error.WithTable(table.name).WithRowsEmitted(stats.rows);
      return MakeUnexpected(std::move(error));
    }
    stats.rows += batch.size();
    stats.statements++;
    batch.clear();

    if (progress_callback) {
      DumpProgress progress;
      progress.table = table.name;
      progress.rows_emitted = stats.rows;
      progress.statements_emitted = stats.statements;
      progress.elapsed_seconds = elapsed();
      progress.rows_per_second =
          progress.elapsed_seconds > 0 ? static_cast<double>(stats.rows) / progress.elapsed_seconds : 0.0;
      progress_callback(progress);
    }
    if (stats.rows >= next_progress_log) {
      double seconds = elapsed();
      spdlog::info("  {}: {} rows ({:.0f} rows/s)", table.name, stats.rows,
                   seconds > 0 ? static_cast<double>(stats.rows) / seconds : 0.0);
      next_progress_log += constants::kProgressLogIntervalRows;
    }
    return {};
  };

  mysql::Row row;
  while (true) {
    auto fetched = (*cursor)->Fetch(row);
    if (!fetched) {
      utils::StructuredLog()
          .Event("dump_stream_error")
          .Field("table", table.name)
          .Field("rows_emitted", stats.rows)
          .Field("error", fetched.error().message())
          .Error();
      // Rows buffered in the unfinished batch were never written
      Error error = MakeError(ErrorCode::kDumpStreamFailed, "Row stream failed: " + fetched.error().message(),
                              fetched.error().to_string());
      error.WithTable(table.name).WithRowsEmitted(stats.rows);
      return MakeUnexpected(std::move(error));
    }
    if (!*fetched) {
      break;
    }

    batch.push_back(std::move(row));
    row = mysql::Row();
    if (batch.size() >= options_.batch_size) {
      if (auto flushed = flush(); !flushed) {
        return MakeUnexpected(flushed.error());
      }
    }
  }

  if (!batch.empty()) {
    if (auto flushed = flush(); !flushed) {
      return MakeUnexpected(flushed.error());
    }
  }

  stats.elapsed_seconds = elapsed();
  spdlog::info("Dumped table {}: {} rows, {} statements in {:.2f}s ({:.0f} rows/s)", table.name, stats.rows,
               stats.statements, stats.elapsed_seconds,
               stats.elapsed_seconds > 0 ? static_cast<double>(stats.rows) / stats.elapsed_seconds : 0.0);
  return stats;
}

}  // namespace sqlbackup::dump
