/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::config {

// Default values for configuration
namespace defaults {

// MySQL connection defaults
constexpr int kMysqlPort = 3306;
constexpr int kMysqlConnectTimeoutSec = 10;
constexpr int kMysqlReadTimeoutSec = 3600;  // 1 hour (large tables stream for a long time)
constexpr int kMysqlWriteTimeoutSec = 3600;
constexpr const char* kMysqlCharset = "utf8mb4";

// Backup defaults
constexpr int kBatchSize = 1000;
constexpr const char* kDdlSource = "server";

// Directory searched for bare config names
constexpr const char* kConfigDir = "config";

}  // namespace defaults

/**
 * @brief MySQL connection configuration (database endpoint)
 */
struct MysqlConfig {
  std::string host = "127.0.0.1";
  int port = defaults::kMysqlPort;
  std::string user;
  std::string password;
  std::string database;
  std::string charset = defaults::kMysqlCharset;
  int connect_timeout_sec = defaults::kMysqlConnectTimeoutSec;
  int read_timeout_sec = defaults::kMysqlReadTimeoutSec;
  int write_timeout_sec = defaults::kMysqlWriteTimeoutSec;
  // SSL/TLS settings
  bool ssl_enable = false;
  std::string ssl_ca;
  std::string ssl_cert;
  std::string ssl_key;
  bool ssl_verify_server_cert = true;
};

/**
 * @brief Backup (dump) configuration
 */
struct BackupConfig {
  int batch_size = defaults::kBatchSize;
  std::string ddl_source = defaults::kDdlSource;  // "server" (SHOW CREATE TABLE) or "catalog"
  bool add_drop_table = true;
  bool overwrite = false;
  int incremental = 0;  // 0 = plain path; N > 0 = timestamped names, keep N newest
};

/**
 * @brief Restore configuration
 */
struct RestoreConfig {
  bool allow_truncated = false;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";
  std::string format = "text";  ///< "text" or "json"
  std::string file;             ///< Log file path (empty = stdout, path = file output)
};

/**
 * @brief Root configuration
 */
struct Config {
  MysqlConfig mysql;
  BackupConfig backup;
  RestoreConfig restore;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML or JSON file
 *
 * Automatically detects file format based on extension (.yaml, .yml, .json).
 * The file is always validated against the embedded JSON Schema, or against
 * @p schema_path when given. A file holding only connection keys at its
 * root (host, port, user, password, database) is read as the mysql section.
 *
 * @param path Path to configuration file (YAML or JSON)
 * @param schema_path Optional path to JSON Schema file for validation
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Validate JSON configuration against schema
 *
 * @param config_json_str JSON configuration string
 * @param schema_json_str JSON Schema string (empty = embedded schema)
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str);

/**
 * @brief Check that a connection config is usable before any network call
 *
 * Requires host, user and database, and a port in 1-65535.
 */
utils::Expected<void, utils::Error> ValidateMysqlConfig(const MysqlConfig& config);

/**
 * @brief Map a bare config name to "config/<name>.json"
 *
 * Names containing a directory separator or an extension are returned unchanged.
 */
std::string ResolveConfigPath(const std::string& name);

}  // namespace sqlbackup::config
