/**
 * @file backup_runner.cpp
 * @brief Backup runner implementation
 */

#include "backup/backup_runner.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

#include "dump/dump_format.h"
#include "dump/dump_writer.h"
#include "mysql/transaction.h"
#include "schema/schema_introspector.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace sqlbackup::backup {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

BackupRunner::BackupRunner(mysql::ISession& session, BackupOptions options)
    : session_(session), options_(std::move(options)) {
  if (options_.batch_size == 0) {
    options_.batch_size = constants::kDefaultBatchSize;
  }
}

std::chrono::system_clock::time_point BackupRunner::Now() const {
  return options_.clock ? options_.clock() : std::chrono::system_clock::now();
}

std::string BackupRunner::ResolveOutputPath(std::chrono::system_clock::time_point now) const {
  if (options_.incremental == 0) {
    return options_.path;
  }
  return RetentionManager(options_.path).ResolveIncrementalPath(now);
}

Expected<BackupResult, Error> BackupRunner::Dump(std::ostream& out) {
  auto start_time = std::chrono::steady_clock::now();
  BackupResult result;

  const std::string database = options_.database.empty() ? session_.Database() : options_.database;

  // Text is written as utf8mb4 whatever charset the connection was opened with
  if (auto names = session_.Execute(dump::dump_format::kSourceCharsetStatement); !names) {
    return MakeUnexpected(names.error());
  }

  // TIMESTAMP values are rendered in the session time zone
  if (auto tz = session_.Execute(dump::dump_format::kSourceTimeZoneStatement); !tz) {
    return MakeUnexpected(tz.error());
  }

  std::unique_ptr<mysql::Transaction> snapshot;
  if (options_.single_transaction) {
    auto txn = mysql::Transaction::BeginConsistentSnapshot(session_);
    if (!txn) {
      return MakeUnexpected(txn.error());
    }
    snapshot = std::move(*txn);
  }

  schema::SchemaIntrospector introspector(session_);
  auto schema = introspector.Introspect(database);
  if (!schema) {
    return MakeUnexpected(schema.error());
  }
  result.fk_cycle = schema->has_cycle;

  dump::DumpWriterOptions writer_options;
  writer_options.add_drop_table = options_.add_drop_table;
  dump::DumpWriter writer(out, writer_options);

  dump::DumpHeader header;
  header.tool_version = options_.tool_version;
  header.database = database;
  header.server_version = session_.ServerVersion();
  header.generated_at = std::chrono::system_clock::to_time_t(Now());
  if (auto written = writer.WriteHeader(header); !written) {
    return MakeUnexpected(written.error());
  }

  schema::DdlEmitter emitter(options_.ddl_source);
  dump::DataDumpOptions dump_options;
  dump_options.batch_size = options_.batch_size;
  dump::DataDumper dumper(session_, dump_options);

  for (const auto& table : schema->tables) {
    if (options_.cancel_requested && options_.cancel_requested()) {
      spdlog::warn("Backup cancelled before table {}", table.name);
      return MakeUnexpected(
          MakeError(ErrorCode::kCancelled, "Backup cancelled after " + std::to_string(result.tables) + " tables")
              .WithTable(table.name));
    }

    if (auto begun = writer.BeginTable(table.name, emitter.EmitCreateTable(table)); !begun) {
      return MakeUnexpected(begun.error());
    }

    auto sink = [&writer](const std::string& statement, size_t /*rows*/) { return writer.WriteStatement(statement); };
    auto stats = dumper.DumpTable(table, sink, options_.progress_callback);
    if (!stats) {
      return MakeUnexpected(stats.error());
    }

    if (auto ended = writer.EndTable(); !ended) {
      return MakeUnexpected(ended.error());
    }
    result.tables++;
    result.rows += stats->rows;
  }

  if (auto footer = writer.WriteFooter(); !footer) {
    return MakeUnexpected(footer.error());
  }

  if (snapshot) {
    if (auto committed = snapshot->Commit(); !committed) {
      return MakeUnexpected(committed.error());
    }
  }

  result.statements = writer.statements_written();
  result.bytes = writer.bytes_written();
  result.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time).count();
  return result;
}

Expected<BackupResult, Error> BackupRunner::Run() {
  const std::string path = ResolveOutputPath(Now());

  // Incremental names are unique per second; never replace a finished one
  const bool overwrite = options_.incremental == 0 && options_.overwrite;
  auto file = dump::DumpFile::Create(path, overwrite);
  if (!file) {
    return MakeUnexpected(file.error());
  }
  spdlog::info("Backing up database {} to {}", options_.database.empty() ? session_.Database() : options_.database,
               path);

  auto result = Dump((*file)->stream());
  if (!result) {
    utils::StructuredLog()
        .Event("backup_error")
        .Field("filepath", path)
        .Field("table", result.error().table())
        .Field("rows_emitted", result.error().rows_emitted().value_or(0))
        .Field("error", result.error().message())
        .Error();
    return MakeUnexpected(result.error());
  }

  if (auto closed = (*file)->Close(); !closed) {
    return MakeUnexpected(closed.error());
  }
  result->path = path;

  if (options_.incremental > 0) {
    auto report = RetentionManager(options_.path, options_.remove_backup).Prune(options_.incremental);
    if (report) {
      result->retention = std::move(*report);
    } else {
      utils::StructuredLog()
          .Event("retention_error")
          .Field("base_path", options_.path)
          .Field("error", report.error().message())
          .Warn();
      result->retention.errors.push_back(report.error());
    }
  }

  spdlog::info("Backup completed: {} tables, {} rows, {} written to {} in {:.2f}s", result->tables, result->rows,
               utils::FormatBytes(result->bytes), result->path, result->elapsed_seconds);
  if (!result->retention.deleted.empty() || !result->retention.errors.empty()) {
    spdlog::info("Retention: kept {}, deleted {}, failed {}", result->retention.kept.size(),
                 result->retention.deleted.size(), result->retention.errors.size());
  }
  return result;
}

}  // namespace sqlbackup::backup
