/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

#include <sstream>

namespace sqlbackup::utils {

namespace {
constexpr int kConfigRangeBegin = 1000;
constexpr int kConnectionRangeBegin = 2000;
constexpr int kIntrospectionRangeBegin = 3000;
constexpr int kDumpRangeBegin = 4000;
constexpr int kRestoreRangeBegin = 5000;
constexpr int kRetentionRangeBegin = 6000;
constexpr int kRetentionRangeEnd = 7000;
}  // namespace

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";

    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigMissingRequired:
      return "Missing required configuration";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigSchemaError:
      return "JSON schema error";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    case ErrorCode::kMySQLConnectionFailed:
      return "MySQL connection failed";
    case ErrorCode::kMySQLAuthFailed:
      return "MySQL authentication failed";
    case ErrorCode::kMySQLQueryFailed:
      return "MySQL query failed";
    case ErrorCode::kMySQLDisconnected:
      return "MySQL disconnected";
    case ErrorCode::kMySQLTimeout:
      return "MySQL timeout";
    case ErrorCode::kMySQLTransactionFailed:
      return "MySQL transaction failed";

    case ErrorCode::kIntrospectionFailed:
      return "Schema introspection failed";
    case ErrorCode::kIntrospectionMissingReference:
      return "Referenced table not found";
    case ErrorCode::kIntrospectionEmptyTable:
      return "Table has no columns";

    case ErrorCode::kDumpStreamFailed:
      return "Table data stream failed";
    case ErrorCode::kDumpWriteFailed:
      return "Dump write failed";
    case ErrorCode::kBackupPathExists:
      return "Backup path already exists";
    case ErrorCode::kBackupFileOpenFailed:
      return "Failed to open backup file";

    case ErrorCode::kRestoreFileNotFound:
      return "SQL file not found";
    case ErrorCode::kRestoreParseError:
      return "Dump parse error";
    case ErrorCode::kRestoreStatementFailed:
      return "Restore statement failed";
    case ErrorCode::kRestoreTruncatedDump:
      return "Dump file is truncated";

    case ErrorCode::kRetentionDeleteFailed:
      return "Failed to delete old backup";
    case ErrorCode::kRetentionListFailed:
      return "Failed to list backups";

    default:
      return "Unknown error code";
  }
}

ErrorKind KindOf(ErrorCode code) {
  const int value = static_cast<int>(code);
  if (value < kConfigRangeBegin || value >= kRetentionRangeEnd) {
    return ErrorKind::kGeneral;
  }
  if (value < kConnectionRangeBegin) {
    return ErrorKind::kConfig;
  }
  if (value < kIntrospectionRangeBegin) {
    return ErrorKind::kConnection;
  }
  if (value < kDumpRangeBegin) {
    return ErrorKind::kIntrospection;
  }
  if (value < kRestoreRangeBegin) {
    return ErrorKind::kDump;
  }
  if (value < kRetentionRangeBegin) {
    return ErrorKind::kRestore;
  }
  return ErrorKind::kRetention;
}

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kGeneral:
      return "Error";
    case ErrorKind::kConfig:
      return "ConfigError";
    case ErrorKind::kConnection:
      return "ConnectionError";
    case ErrorKind::kIntrospection:
      return "IntrospectionError";
    case ErrorKind::kDump:
      return "DumpError";
    case ErrorKind::kRestore:
      return "RestoreError";
    case ErrorKind::kRetention:
      return "RetentionError";
  }
  return "Error";
}

std::string Error::to_string() const {
  std::ostringstream oss;
  oss << "[" << ErrorCodeToString(code_) << " (" << static_cast<int>(code_) << ")] " << message_;

  std::ostringstream details;
  auto append = [&details](const std::string& part) {
    if (details.tellp() > 0) {
      details << ", ";
    }
    details << part;
  };
  if (!table_.empty()) {
    append("table: " + table_);
  }
  if (statement_index_) {
    append("statement: " + std::to_string(*statement_index_));
  }
  if (rows_emitted_) {
    append("rows emitted: " + std::to_string(*rows_emitted_));
  }
  if (!context_.empty()) {
    append("context: " + context_);
  }

  std::string detail_str = details.str();
  if (!detail_str.empty()) {
    oss << " (" << detail_str << ")";
  }
  return oss.str();
}

}  // namespace sqlbackup::utils
