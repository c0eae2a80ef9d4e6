/**
 * @file error.h
 * @brief Error codes and Error value type used across sqlbackup
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sqlbackup::utils {

/**
 * @brief Error codes grouped by subsystem
 *
 * Ranges:
 * - 0-999:     General
 * - 1000-1999: Configuration
 * - 2000-2999: Connection (MySQL session)
 * - 3000-3999: Schema introspection
 * - 4000-4999: Dump (streaming, writing, backup file)
 * - 5000-5999: Restore
 * - 6000-6999: Retention
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class ErrorCode : int {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kInternalError = 5,
  kIOError = 6,
  kPermissionDenied = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigMissingRequired = 1003,
  kConfigInvalidValue = 1004,
  kConfigSchemaError = 1005,
  kConfigYamlError = 1006,
  kConfigJsonError = 1007,

  // Connection
  kMySQLConnectionFailed = 2000,
  kMySQLAuthFailed = 2001,
  kMySQLQueryFailed = 2002,
  kMySQLDisconnected = 2003,
  kMySQLTimeout = 2004,
  kMySQLTransactionFailed = 2005,

  // Schema introspection
  kIntrospectionFailed = 3000,
  kIntrospectionMissingReference = 3001,
  kIntrospectionEmptyTable = 3002,

  // Dump
  kDumpStreamFailed = 4000,
  kDumpWriteFailed = 4001,
  kBackupPathExists = 4002,
  kBackupFileOpenFailed = 4003,

  // Restore
  kRestoreFileNotFound = 5000,
  kRestoreParseError = 5001,
  kRestoreStatementFailed = 5002,
  kRestoreTruncatedDump = 5003,

  // Retention
  kRetentionDeleteFailed = 6000,
  kRetentionListFailed = 6001,
};

/**
 * @brief Error kinds (one per subsystem range)
 */
enum class ErrorKind : uint8_t {
  kGeneral,
  kConfig,
  kConnection,
  kIntrospection,
  kDump,
  kRestore,
  kRetention,
};

/**
 * @brief Human readable name of an error code
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Map an error code to its kind
 */
ErrorKind KindOf(ErrorCode code);

/**
 * @brief Human readable name of an error kind (e.g. "DumpError")
 */
const char* ErrorKindToString(ErrorKind kind);

/**
 * @brief Error value with code, message, free-text context and structured fields
 *
 * Structured fields identify where an operation stopped:
 * - table: table being introspected, dumped or restored
 * - statement_index: zero-based statement position inside a restored table section
 * - rows_emitted: rows already written for the table when a dump failed
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] ErrorKind kind() const { return KindOf(code_); }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  [[nodiscard]] const std::string& table() const { return table_; }
  [[nodiscard]] const std::optional<size_t>& statement_index() const { return statement_index_; }
  [[nodiscard]] const std::optional<uint64_t>& rows_emitted() const { return rows_emitted_; }

  Error& WithTable(std::string table) {
    table_ = std::move(table);
    return *this;
  }

  Error& WithStatementIndex(size_t index) {
    statement_index_ = index;
    return *this;
  }

  Error& WithRowsEmitted(uint64_t rows) {
    rows_emitted_ = rows;
    return *this;
  }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (table: ..., statement: ..., rows emitted: ...,
   * context: ...)"
   */
  [[nodiscard]] std::string to_string() const;

  // NOLINTNEXTLINE(google-explicit-constructor,hicpp-explicit-conversions)
  operator std::string() const { return to_string(); }

  [[nodiscard]] const char* what() const { return message_.c_str(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
  std::string table_;
  std::optional<size_t> statement_index_;
  std::optional<uint64_t> rows_emitted_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace sqlbackup::utils

// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define SQLBACKUP_ERROR(code, message) \
  ::sqlbackup::utils::MakeError((code), (message), std::string(__FILE__) + ":" + std::to_string(__LINE__))
