/**
 * @file dump_writer.h
 * @brief Append-only writer for SQL dump files
 */

#pragma once

#include <cstdint>
#include <ctime>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::dump {

/**
 * @brief Header information written at the top of a dump
 */
struct DumpHeader {
  std::string tool_version;
  std::string database;
  std::string server_version;
  std::time_t generated_at = 0;  // UTC seconds
};

/**
 * @brief Dump writer options
 */
struct DumpWriterOptions {
  bool add_drop_table = true;  // DROP TABLE IF EXISTS before each CREATE
};

/**
 * @brief Dump writer
 *
 * Writes header and preamble, one section per table, then the completion
 * marker and epilogue. The stream is flushed after every table section so
 * an interrupted dump leaves a parseable prefix without the completion
 * marker.
 *
 * Example usage:
 * @code
 * DumpWriter writer(out);
 * writer.WriteHeader(header);
 * writer.BeginTable("users", create_sql);
 * writer.WriteStatement(insert_sql);
 * writer.EndTable();
 * writer.WriteFooter();
 * @endcode
 */
class DumpWriter {
 public:
  explicit DumpWriter(std::ostream& out, DumpWriterOptions options = {}) : out_(out), options_(options) {}

  /**
   * @brief Header comment lines and preamble session statements
   */
  utils::Expected<void, utils::Error> WriteHeader(const DumpHeader& header);

  /**
   * @brief Table marker, DROP TABLE (optional) and CREATE TABLE
   */
  utils::Expected<void, utils::Error> BeginTable(const std::string& table, const std::string& create_statement);

  /**
   * @brief One statement inside the current table section
   */
  utils::Expected<void, utils::Error> WriteStatement(const std::string& statement);

  /**
   * @brief Close the table section and flush
   */
  utils::Expected<void, utils::Error> EndTable();

  /**
   * @brief Completion marker and epilogue session statements, then flush
   */
  utils::Expected<void, utils::Error> WriteFooter();

  [[nodiscard]] uint64_t bytes_written() const { return bytes_written_; }
  [[nodiscard]] uint64_t statements_written() const { return statements_written_; }

  /**
   * @brief Format a time as "YYYY-MM-DD HH:MM:SS UTC"
   */
  static std::string FormatUtc(std::time_t time);

 private:
  std::ostream& out_;
  DumpWriterOptions options_;
  std::string current_table_;
  uint64_t bytes_written_ = 0;
  uint64_t statements_written_ = 0;

  void Put(const std::string& text);
  void PutStatement(const std::string& sql);
  utils::Expected<void, utils::Error> CheckStream(const std::string& operation);
};

/**
 * @brief Output file for a dump
 *
 * Refuses to replace an existing file unless overwriting is requested and
 * creates missing parent directories.
 */
class DumpFile {
 public:
  /**
   * @brief Open @p path for writing
   * @return kBackupPathExists when the file exists and @p overwrite is false,
   *         kBackupFileOpenFailed when it cannot be created
   */
  static utils::Expected<std::unique_ptr<DumpFile>, utils::Error> Create(const std::string& path, bool overwrite);

  ~DumpFile() = default;

  DumpFile(const DumpFile&) = delete;
  DumpFile& operator=(const DumpFile&) = delete;
  DumpFile(DumpFile&&) = delete;
  DumpFile& operator=(DumpFile&&) = delete;

  std::ostream& stream() { return stream_; }
  [[nodiscard]] const std::string& path() const { return path_; }

  /**
   * @brief Flush and close; reports a failed final write
   */
  utils::Expected<void, utils::Error> Close();

 private:
  explicit DumpFile(std::string path) : path_(std::move(path)) {}

  std::string path_;
  std::ofstream stream_;
};

}  // namespace sqlbackup::dump
