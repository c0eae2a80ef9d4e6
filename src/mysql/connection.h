/**
 * @file connection.h
 * @brief MySQL connection wrapper (C API) implementing ISession
 */

#pragma once

#include <mysql.h>

#include <memory>
#include <string>

#include "mysql/session_interface.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::mysql {

/**
 * @brief RAII wrapper for MYSQL_RES* to prevent memory leaks
 *
 * Custom deleter for std::unique_ptr that calls mysql_free_result
 */
struct MySQLResultDeleter {
  void operator()(MYSQL_RES* res) const {
    if (res != nullptr) {
      mysql_free_result(res);
    }
  }
};

/// Type alias for RAII-managed MYSQL_RES*
using MySQLResult = std::unique_ptr<MYSQL_RES, MySQLResultDeleter>;

/**
 * @brief Classify a result column for SQL literal rendering
 *
 * Numeric types are kNumeric. String and blob types carrying the binary
 * collation (charset 63), BIT and GEOMETRY are kBinary. Everything else
 * (character data, temporal types, ENUM, SET, JSON) is kString.
 */
ValueKind ClassifyField(enum_field_types type, unsigned int charsetnr);

/**
 * @brief Convert the current C API row into tagged values
 */
Row ConvertRow(MYSQL_ROW mysql_row, const unsigned long* lengths, const MYSQL_FIELD* fields,  // NOLINT(google-runtime-int)
               unsigned int num_fields);

/**
 * @brief MySQL connection wrapper
 *
 * Provides RAII wrapper around one MySQL connection. The handle is released
 * by Close() or the destructor on every path.
 */
class Connection : public ISession {
 public:
  /**
   * @brief Connection configuration
   */
  // NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers) - Default MySQL
  // connection settings
  struct Config {
    std::string host = "localhost";
    uint16_t port = 3306;  // MySQL default port
    std::string user;
    std::string password;
    std::string database;
    std::string charset = "utf8mb4";
    uint32_t connect_timeout = 10;  // Default timeout in seconds
    uint32_t read_timeout = 3600;   // Default timeout in seconds
    uint32_t write_timeout = 3600;  // Default timeout in seconds
    // SSL/TLS settings
    bool ssl_enable = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;
    bool ssl_verify_server_cert = true;
  };
  // NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

  /**
   * @brief Construct connection (not yet connected)
   */
  explicit Connection(Config config);

  /**
   * @brief Destructor - closes connection if open
   */
  ~Connection() override;

  // Non-copyable
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Movable
  Connection(Connection&& other) noexcept;
  Connection& operator=(Connection&& other) noexcept;

  /**
   * @brief Connect to MySQL server
   * @param context Optional context label for logging (e.g., "backup", "restore")
   * @return Expected<void, Error>: kMySQLAuthFailed for rejected credentials,
   *         kMySQLConnectionFailed otherwise
   */
  utils::Expected<void, utils::Error> Connect(const std::string& context = "");

  /**
   * @brief Check if connection is alive
   */
  [[nodiscard]] bool IsConnected() const;

  /**
   * @brief Close connection
   */
  void Close();

  utils::Expected<ResultSet, utils::Error> Query(const std::string& sql) override;

  utils::Expected<uint64_t, utils::Error> Execute(const std::string& sql) override;

  /**
   * @brief Stream a result with mysql_use_result
   *
   * The returned cursor must be destroyed before the next statement is run
   * on this connection.
   */
  utils::Expected<std::unique_ptr<IRowCursor>, utils::Error> OpenStreamingCursor(const std::string& sql) override;

  [[nodiscard]] std::string ServerVersion() const override;

  [[nodiscard]] std::string Database() const override { return config_.database; }

 private:
  Config config_;
  MYSQL* mysql_ = nullptr;
  std::string last_error_;

  /**
   * @brief Set last error message from MySQL
   */
  void SetMySQLError();

  /**
   * @brief Build a query error from the handle's current error state
   */
  utils::Error MakeQueryError(const std::string& sql);
};

}  // namespace sqlbackup::mysql
