/**
 * @file dump_writer.cpp
 * @brief Dump writer implementation
 */

#include "dump/dump_writer.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "dump/dump_format.h"
#include "schema/ddl_emitter.h"
#include "utils/structured_log.h"

namespace sqlbackup::dump {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

std::string DumpWriter::FormatUtc(std::time_t time) {
  std::tm utc{};
  gmtime_r(&time, &utc);
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << " UTC";
  return oss.str();
}

void DumpWriter::Put(const std::string& text) {
  out_ << text;
  bytes_written_ += text.size();
}

void DumpWriter::PutStatement(const std::string& sql) {
  out_ << sql << dump_format::kTerminator << '\n';
  bytes_written_ += sql.size() + 2;
  statements_written_++;
}

Expected<void, Error> DumpWriter::CheckStream(const std::string& operation) {
  if (!out_) {
    Error error = MakeError(ErrorCode::kDumpWriteFailed, "Failed to write dump (" + operation + ")");
    if (!current_table_.empty()) {
      error.WithTable(current_table_);
    }
    return MakeUnexpected(std::move(error));
  }
  return {};
}

Expected<void, Error> DumpWriter::WriteHeader(const DumpHeader& header) {
  Put(std::string(dump_format::kTitle) + "\n");
  Put(dump_format::kFormatVersionPrefix + std::to_string(dump_format::kCurrentVersion) + "\n");
  Put(dump_format::kToolVersionPrefix + header.tool_version + "\n");
  Put(dump_format::kDatabasePrefix + header.database + "\n");
  Put(dump_format::kServerVersionPrefix + header.server_version + "\n");
  Put(dump_format::kGeneratedAtPrefix + FormatUtc(header.generated_at) + "\n");
  Put("\n");
  for (const char* statement : dump_format::kPreamble) {
    PutStatement(statement);
  }
  out_.flush();
  return CheckStream("header");
}

Expected<void, Error> DumpWriter::BeginTable(const std::string& table, const std::string& create_statement) {
  current_table_ = table;
  Put("\n");
  Put(dump_format::kTableMarkerPrefix + table + "\n");
  if (options_.add_drop_table) {
    PutStatement(schema::DdlEmitter::EmitDropTable(table));
  }
  PutStatement(create_statement);
  return CheckStream("table structure");
}

Expected<void, Error> DumpWriter::WriteStatement(const std::string& statement) {
  PutStatement(statement);
  return CheckStream("statement");
}

Expected<void, Error> DumpWriter::EndTable() {
  out_.flush();
  auto result = CheckStream("flush");
  current_table_.clear();
  return result;
}

Expected<void, Error> DumpWriter::WriteFooter() {
  Put("\n");
  Put(std::string(dump_format::kCompletionMarker) + "\n");
  for (const char* statement : dump_format::kEpilogue) {
    PutStatement(statement);
  }
  out_.flush();
  return CheckStream("footer");
}

// DumpFile

Expected<std::unique_ptr<DumpFile>, Error> DumpFile::Create(const std::string& path, bool overwrite) {
  namespace fs = std::filesystem;

  std::error_code error_code;
  const fs::path file_path(path);
  if (fs::exists(file_path, error_code)) {
    if (!overwrite) {
      return MakeUnexpected(MakeError(ErrorCode::kBackupPathExists,
                                      "Backup file " + path + " already exists (use --overwrite to replace it)"));
    }
    spdlog::warn("Overwriting existing backup file {}", path);
  }

  if (file_path.has_parent_path()) {
    fs::create_directories(file_path.parent_path(), error_code);
    if (error_code) {
      utils::LogStorageError("create_directories", file_path.parent_path().string(), error_code.message());
      return MakeUnexpected(MakeError(ErrorCode::kBackupFileOpenFailed,
                                      "Failed to create directory " + file_path.parent_path().string() + ": " +
                                          error_code.message()));
    }
  }

  auto file = std::unique_ptr<DumpFile>(new DumpFile(path));
  file->stream_.open(path, std::ios::binary | std::ios::trunc);
  if (!file->stream_.is_open()) {
    std::string reason = std::strerror(errno);
    utils::LogStorageError("open", path, reason);
    return MakeUnexpected(MakeError(ErrorCode::kBackupFileOpenFailed, "Failed to open " + path + ": " + reason));
  }
  return file;
}

Expected<void, Error> DumpFile::Close() {
  if (!stream_.is_open()) {
    return {};
  }
  stream_.flush();
  bool flushed = static_cast<bool>(stream_);
  stream_.close();
  if (!flushed || stream_.fail()) {
    utils::LogStorageError("close", path_, "final write failed");
    return MakeUnexpected(MakeError(ErrorCode::kDumpWriteFailed, "Failed to finish writing " + path_));
  }
  return {};
}

}  // namespace sqlbackup::dump
