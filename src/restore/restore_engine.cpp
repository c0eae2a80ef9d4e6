/**
 * @file restore_engine.cpp
 * @brief Restore engine implementation
 */

#include "restore/restore_engine.h"

#include <spdlog/spdlog.h>

#include <chrono>

#include "dump/dump_reader.h"
#include "mysql/transaction.h"
#include "utils/structured_log.h"

namespace sqlbackup::restore {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

Error StatementError(const std::string& table, size_t index, const Error& cause) {
  Error error = MakeError(ErrorCode::kRestoreStatementFailed, "Statement failed: " + cause.message(),
                          cause.to_string());
  error.WithTable(table).WithStatementIndex(index);
  return error;
}

}  // namespace

Expected<void, Error> RestoreEngine::ExecuteSessionStatements(const std::vector<dump::DumpStatement>& statements,
                                                              const std::string& phase, RestoreStats& stats) {
  for (size_t i = 0; i < statements.size(); ++i) {
    auto result = session_.Execute(statements[i].sql);
    if (!result) {
      Error error = MakeError(ErrorCode::kRestoreStatementFailed,
                              phase + " statement failed: " + result.error().message(), result.error().to_string());
      error.WithStatementIndex(i);
      return MakeUnexpected(std::move(error));
    }
    stats.statements++;
  }
  return {};
}

Expected<void, Error> RestoreEngine::RestoreTable(const dump::TableSection& section, RestoreStats& stats) {
  const auto& statements = section.statements;

  // Structure first: DDL commits implicitly and would end an open transaction
  for (size_t i = 0; i < statements.size(); ++i) {
    if (statements[i].kind == dump::StatementKind::kData) {
      continue;
    }
    auto result = session_.Execute(statements[i].sql);
    if (!result) {
      return MakeUnexpected(StatementError(section.table, i, result.error()));
    }
    stats.statements++;
  }

  auto txn = mysql::Transaction::Begin(session_);
  if (!txn) {
    Error error = txn.error();
    error.WithTable(section.table);
    return MakeUnexpected(std::move(error));
  }

  uint64_t rows_affected = 0;
  uint64_t data_statements = 0;
  for (size_t i = 0; i < statements.size(); ++i) {
    if (statements[i].kind != dump::StatementKind::kData) {
      continue;
    }
    auto result = session_.Execute(statements[i].sql);
    if (!result) {
      // Transaction destructor rolls back
      return MakeUnexpected(StatementError(section.table, i, result.error()));
    }
    rows_affected += *result;
    data_statements++;
  }

  auto committed = (*txn)->Commit();
  if (!committed) {
    Error error = committed.error();
    error.WithTable(section.table);
    return MakeUnexpected(std::move(error));
  }

  stats.statements += data_statements;
  stats.rows_affected += rows_affected;
  spdlog::info("Restored table {}: {} statements, {} rows", section.table, statements.size(), rows_affected);
  return {};
}

Expected<RestoreStats, Error> RestoreEngine::Restore(const dump::ParsedDump& dump) {
  if (!dump.complete) {
    if (!options_.allow_truncated) {
      return MakeUnexpected(
          MakeError(ErrorCode::kRestoreTruncatedDump,
                    "Dump has no completion marker; it was cut short (use --allow-truncated to replay it anyway)"));
    }
    utils::StructuredLog()
        .Event("restore_truncated_dump")
        .Field("tables", static_cast<uint64_t>(dump.tables.size()))
        .Field("trailing_fragment", dump.trailing_fragment)
        .Message("Replaying a dump without completion marker")
        .Warn();
  }

  auto start_time = std::chrono::steady_clock::now();
  RestoreStats stats;

  if (auto result = ExecuteSessionStatements(dump.preamble, "Preamble", stats); !result) {
    utils::StructuredLog().Event("restore_error").Field("phase", "preamble").Field("error", result.error().message()).Error();
    return MakeUnexpected(result.error());
  }

  for (const auto& section : dump.tables) {
    if (options_.cancel_requested && options_.cancel_requested()) {
      spdlog::warn("Restore cancelled before table {}", section.table);
      return MakeUnexpected(
          MakeError(ErrorCode::kCancelled, "Restore cancelled after " + std::to_string(stats.tables) + " tables")
              .WithTable(section.table));
    }

    auto result = RestoreTable(section, stats);
    if (!result) {
      const Error& error = result.error();
      utils::StructuredLog()
          .Event("restore_error")
          .Field("table", section.table)
          .Field("statement_index", static_cast<uint64_t>(error.statement_index().value_or(0)))
          .Field("error", error.message())
          .Error();
      return MakeUnexpected(error);
    }
    stats.tables++;
  }

  if (auto result = ExecuteSessionStatements(dump.epilogue, "Epilogue", stats); !result) {
    utils::StructuredLog().Event("restore_error").Field("phase", "epilogue").Field("error", result.error().message()).Error();
    return MakeUnexpected(result.error());
  }

  stats.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
  spdlog::info("Restore completed: {} tables, {} statements, {} rows in {:.2f}s", stats.tables, stats.statements,
               stats.rows_affected, stats.elapsed_seconds);
  return stats;
}

Expected<RestoreStats, Error> RestoreEngine::RestoreFromFile(const std::string& path) {
  auto parsed = dump::DumpReader::ParseFile(path);
  if (!parsed) {
    return MakeUnexpected(parsed.error());
  }
  spdlog::info("Restoring {} ({} tables)", path, parsed->tables.size());
  return Restore(*parsed);
}

}  // namespace sqlbackup::restore
