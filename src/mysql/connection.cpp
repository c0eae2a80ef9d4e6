/**
 * @file connection.cpp
 * @brief MySQL connection wrapper implementation
 */

#include "mysql/connection.h"

#include <errmsg.h>
#include <mysqld_error.h>
#include <spdlog/spdlog.h>

#include <utility>

#include "utils/structured_log.h"

namespace sqlbackup::mysql {

namespace {

/// Charset number of the "binary" pseudo-charset
constexpr unsigned int kBinaryCharsetNr = 63;

utils::ErrorCode ClassifyClientError(unsigned int err) {
  switch (err) {
    case CR_SERVER_GONE_ERROR:
    case CR_SERVER_LOST:
      return utils::ErrorCode::kMySQLDisconnected;
    default:
      return utils::ErrorCode::kMySQLQueryFailed;
  }
}

/**
 * @brief Unbuffered cursor over mysql_use_result
 */
class StreamingCursor : public IRowCursor {
 public:
  StreamingCursor(MYSQL* mysql, MySQLResult result)
      : mysql_(mysql),
        result_(std::move(result)),
        fields_(mysql_fetch_fields(result_.get())),
        num_fields_(mysql_num_fields(result_.get())) {}

  utils::Expected<bool, utils::Error> Fetch(Row& row) override {
    if (done_) {
      return false;
    }
    MYSQL_ROW mysql_row = mysql_fetch_row(result_.get());
    if (mysql_row == nullptr) {
      done_ = true;
      // End of data and a broken stream both return NULL; only the error state tells them apart
      unsigned int err = mysql_errno(mysql_);
      if (err != 0) {
        std::string message = mysql_error(mysql_);
        utils::StructuredLog()
            .Event("mysql_stream_error")
            .Field("errno", static_cast<uint64_t>(err))
            .Field("error", message)
            .Error();
        return utils::MakeUnexpected(utils::MakeError(ClassifyClientError(err), "Row stream failed: " + message));
      }
      return false;
    }
    const unsigned long* lengths = mysql_fetch_lengths(result_.get());  // NOLINT(google-runtime-int)
    row = ConvertRow(mysql_row, lengths, fields_, num_fields_);
    return true;
  }

  [[nodiscard]] size_t ColumnCount() const override { return num_fields_; }

 private:
  MYSQL* mysql_;
  MySQLResult result_;
  const MYSQL_FIELD* fields_;
  unsigned int num_fields_;
  bool done_ = false;
};

}  // namespace

ValueKind ClassifyField(enum_field_types type, unsigned int charsetnr) {
  switch (type) {
    case MYSQL_TYPE_DECIMAL:
    case MYSQL_TYPE_NEWDECIMAL:
    case MYSQL_TYPE_TINY:
    case MYSQL_TYPE_SHORT:
    case MYSQL_TYPE_LONG:
    case MYSQL_TYPE_INT24:
    case MYSQL_TYPE_LONGLONG:
    case MYSQL_TYPE_FLOAT:
    case MYSQL_TYPE_DOUBLE:
    case MYSQL_TYPE_YEAR:
      return ValueKind::kNumeric;
    case MYSQL_TYPE_BIT:
    case MYSQL_TYPE_GEOMETRY:
      return ValueKind::kBinary;
    case MYSQL_TYPE_STRING:
    case MYSQL_TYPE_VAR_STRING:
    case MYSQL_TYPE_VARCHAR:
    case MYSQL_TYPE_TINY_BLOB:
    case MYSQL_TYPE_MEDIUM_BLOB:
    case MYSQL_TYPE_LONG_BLOB:
    case MYSQL_TYPE_BLOB:
      return charsetnr == kBinaryCharsetNr ? ValueKind::kBinary : ValueKind::kString;
    default:
      return ValueKind::kString;
  }
}

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic) - C API arrays
Row ConvertRow(MYSQL_ROW mysql_row, const unsigned long* lengths, const MYSQL_FIELD* fields,  // NOLINT(google-runtime-int)
               unsigned int num_fields) {
  Row row;
  row.reserve(num_fields);
  for (unsigned int i = 0; i < num_fields; ++i) {
    if (mysql_row[i] == nullptr) {
      row.push_back(FieldValue::Null());
      continue;
    }
    // Length-aware copy: binary values may contain NUL bytes
    FieldValue value;
    value.kind = ClassifyField(fields[i].type, fields[i].charsetnr);
    value.data.assign(mysql_row[i], lengths[i]);
    row.push_back(std::move(value));
  }
  return row;
}
// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

// Connection implementation

Connection::Connection(Config config) : config_(std::move(config)), mysql_(mysql_init(nullptr)) {
  if (mysql_ == nullptr) {
    last_error_ = "Failed to initialize MySQL handle";
  }
}

Connection::~Connection() {
  Close();
}

Connection::Connection(Connection&& other) noexcept
    : config_(std::move(other.config_)), mysql_(other.mysql_), last_error_(std::move(other.last_error_)) {
  other.mysql_ = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    Close();
    config_ = std::move(other.config_);
    mysql_ = other.mysql_;
    last_error_ = std::move(other.last_error_);
    other.mysql_ = nullptr;
  }
  return *this;
}

utils::Expected<void, utils::Error> Connection::Connect(const std::string& context) {
  if (mysql_ == nullptr) {
    last_error_ = "MySQL handle not initialized";
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMySQLConnectionFailed, last_error_));
  }

  // Set connection timeouts
  mysql_options(mysql_, MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout);
  mysql_options(mysql_, MYSQL_OPT_READ_TIMEOUT, &config_.read_timeout);
  mysql_options(mysql_, MYSQL_OPT_WRITE_TIMEOUT, &config_.write_timeout);

  if (!config_.charset.empty()) {
    mysql_options(mysql_, MYSQL_SET_CHARSET_NAME, config_.charset.c_str());
  }

  // Configure SSL/TLS if enabled
  if (config_.ssl_enable) {
    unsigned int ssl_mode = SSL_MODE_REQUIRED;
    if (config_.ssl_verify_server_cert) {
      ssl_mode = SSL_MODE_VERIFY_CA;
    }
    mysql_options(mysql_, MYSQL_OPT_SSL_MODE, &ssl_mode);

    if (!config_.ssl_ca.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_CA, config_.ssl_ca.c_str());
    }
    if (!config_.ssl_cert.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_CERT, config_.ssl_cert.c_str());
    }
    if (!config_.ssl_key.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_KEY, config_.ssl_key.c_str());
    }

    spdlog::debug("SSL/TLS enabled for MySQL connection");
  }

  std::string context_prefix = context.empty() ? "" : "[" + context + "] ";

  if (mysql_real_connect(mysql_, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                         config_.database.empty() ? nullptr : config_.database.c_str(), config_.port, nullptr,
                         0) == nullptr) {
    unsigned int err = mysql_errno(mysql_);
    SetMySQLError();
    utils::LogMySQLConnectionError(config_.host, config_.port, context_prefix + last_error_);

    auto code = (err == ER_ACCESS_DENIED_ERROR || err == ER_DBACCESS_DENIED_ERROR)
                    ? utils::ErrorCode::kMySQLAuthFailed
                    : utils::ErrorCode::kMySQLConnectionFailed;
    return utils::MakeUnexpected(utils::MakeError(code, "MySQL connection failed: " + last_error_,
                                                  config_.host + ":" + std::to_string(config_.port)));
  }

  std::string db_info = config_.database.empty() ? "" : "/" + config_.database;
  std::string ssl_info = config_.ssl_enable ? " (SSL/TLS)" : "";
  spdlog::info("{}Connected to MySQL {}:{}{}{} (server {})", context_prefix, config_.host, config_.port, db_info,
               ssl_info, ServerVersion());
  return {};
}

bool Connection::IsConnected() const {
  if (mysql_ == nullptr) {
    return false;
  }

  // Check if connection was established (thread_id will be 0 if not connected)
  return mysql_thread_id(mysql_) != 0;
}

void Connection::Close() {
  if (mysql_ != nullptr) {
    mysql_close(mysql_);
    mysql_ = nullptr;
    spdlog::debug("MySQL connection closed");
  }
}

utils::Expected<ResultSet, utils::Error> Connection::Query(const std::string& sql) {
  if (!IsConnected()) {
    last_error_ = "Not connected";
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMySQLDisconnected, last_error_));
  }

  spdlog::debug("Executing query: {}", sql);

  if (mysql_real_query(mysql_, sql.data(), sql.size()) != 0) {
    return utils::MakeUnexpected(MakeQueryError(sql));
  }

  MySQLResult result(mysql_store_result(mysql_));
  if (!result) {
    if (mysql_field_count(mysql_) > 0) {
      return utils::MakeUnexpected(MakeQueryError(sql));
    }
    return ResultSet{};
  }

  ResultSet result_set;
  unsigned int num_fields = mysql_num_fields(result.get());
  const MYSQL_FIELD* fields = mysql_fetch_fields(result.get());
  result_set.columns.reserve(num_fields);
  for (unsigned int i = 0; i < num_fields; ++i) {
    result_set.columns.emplace_back(fields[i].name);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  result_set.rows.reserve(mysql_num_rows(result.get()));

  MYSQL_ROW mysql_row = nullptr;
  while ((mysql_row = mysql_fetch_row(result.get())) != nullptr) {
    const unsigned long* lengths = mysql_fetch_lengths(result.get());  // NOLINT(google-runtime-int)
    result_set.rows.push_back(ConvertRow(mysql_row, lengths, fields, num_fields));
  }

  return result_set;
}

utils::Expected<uint64_t, utils::Error> Connection::Execute(const std::string& sql) {
  if (!IsConnected()) {
    last_error_ = "Not connected";
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMySQLDisconnected, last_error_));
  }

  spdlog::trace("Executing update: {}", sql.substr(0, 200));  // NOLINT(readability-magic-numbers)

  if (mysql_real_query(mysql_, sql.data(), sql.size()) != 0) {
    return utils::MakeUnexpected(MakeQueryError(sql));
  }

  // Drain an unexpected result set so the connection stays in sync
  if (mysql_field_count(mysql_) > 0) {
    MySQLResult discarded(mysql_store_result(mysql_));
    return static_cast<uint64_t>(0);
  }

  return static_cast<uint64_t>(mysql_affected_rows(mysql_));
}

utils::Expected<std::unique_ptr<IRowCursor>, utils::Error> Connection::OpenStreamingCursor(const std::string& sql) {
  if (!IsConnected()) {
    last_error_ = "Not connected";
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMySQLDisconnected, last_error_));
  }

  spdlog::debug("Opening streaming cursor: {}", sql);

  if (mysql_real_query(mysql_, sql.data(), sql.size()) != 0) {
    return utils::MakeUnexpected(MakeQueryError(sql));
  }

  MySQLResult result(mysql_use_result(mysql_));
  if (!result) {
    return utils::MakeUnexpected(MakeQueryError(sql));
  }

  return std::unique_ptr<IRowCursor>(std::make_unique<StreamingCursor>(mysql_, std::move(result)));
}

std::string Connection::ServerVersion() const {
  if (mysql_ == nullptr) {
    return "";
  }
  const char* info = mysql_get_server_info(mysql_);
  return info != nullptr ? std::string(info) : std::string();
}

void Connection::SetMySQLError() {
  if (mysql_ != nullptr) {
    last_error_ = mysql_error(mysql_);
  }
}

utils::Error Connection::MakeQueryError(const std::string& sql) {
  unsigned int err = mysql_errno(mysql_);
  std::string message = mysql_error(mysql_);
  last_error_ = message;
  utils::LogMySQLQueryError(sql, message);
  return utils::MakeError(ClassifyClientError(err), "Query failed: " + message);
}

}  // namespace sqlbackup::mysql
