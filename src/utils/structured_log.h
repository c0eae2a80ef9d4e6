/**
 * @file structured_log.h
 * @brief Structured logging utilities (JSON or key=value text)
 *
 * Provides a builder for logging events with named fields, so backup and
 * restore failures can be parsed from logs by monitoring tools.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlbackup::utils {

/**
 * @brief Output format for structured log records
 */
enum class LogFormat : uint8_t {
  JSON,  // {"event":"dump_error","table":"users"}
  TEXT,  // dump_error table=users
};

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("dump_error")
 *   .Field("table", table_name)
 *   .Field("rows_emitted", rows)
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  /**
   * @brief Set global output format
   */
  static void SetFormat(LogFormat format) { format_.store(format); }

  static LogFormat GetFormat() { return format_.load(); }

  /**
   * @brief Parse "json" / "text" (anything else falls back to TEXT)
   */
  static LogFormat ParseFormat(std::string_view name) { return name == "json" ? LogFormat::JSON : LogFormat::TEXT; }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddString(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddString(key, value); }

  StructuredLog& Field(const std::string& key, std::string_view value) { return AddString(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_.push_back({key, std::to_string(value), false});
    return *this;
  }

  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_.push_back({key, std::to_string(value), false});
    return *this;
  }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    fields_.push_back({key, oss.str(), false});
    return *this;
  }

  StructuredLog& Field(const std::string& key, bool value) {
    fields_.push_back({key, value ? "true" : "false", false});
    return *this;
  }

  /**
   * @brief Add message field (optional, for human-readable context)
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }
  void Critical() { spdlog::critical("{}", Build()); }

  /**
   * @brief Render the record in the current format
   */
  [[nodiscard]] std::string Build() const { return GetFormat() == LogFormat::JSON ? BuildJson() : BuildText(); }

 private:
  struct LogField {
    std::string key;
    std::string value;
    bool quoted;
  };

  inline static std::atomic<LogFormat> format_{LogFormat::TEXT};

  std::string event_;
  std::string message_;
  std::vector<LogField> fields_;

  StructuredLog& AddString(const std::string& key, std::string value) {
    fields_.push_back({key, std::move(value), true});
    return *this;
  }

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";
    bool first = true;

    if (!event_.empty()) {
      json << R"("event":")" << EscapeJson(event_) << R"(")";
      first = false;
    }
    if (!message_.empty()) {
      if (!first) {
        json << ",";
      }
      json << R"("message":")" << EscapeJson(message_) << R"(")";
      first = false;
    }
    for (const auto& field : fields_) {
      if (!first) {
        json << ",";
      }
      json << "\"" << field.key << "\":";
      if (field.quoted) {
        json << "\"" << EscapeJson(field.value) << "\"";
      } else {
        json << field.value;
      }
      first = false;
    }

    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << event_;
    if (!message_.empty()) {
      text << ": " << message_;
    }
    for (const auto& field : fields_) {
      text << " " << field.key << "=";
      if (field.quoted && field.value.find_first_of(" \t\"=") != std::string::npos) {
        text << std::quoted(field.value);
      } else {
        text << field.value;
      }
    }
    return text.str();
  }

  static std::string EscapeJson(const std::string& str) {
    // Control character threshold for JSON escaping (0x20 = space)
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\b':
          escaped << R"(\b)";
          break;
        case '\f':
          escaped << R"(\f)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log MySQL connection error in structured format
 */
inline void LogMySQLConnectionError(const std::string& host, int port, const std::string& error_msg) {
  StructuredLog()
      .Event("mysql_connection_error")
      .Field("host", host)
      .Field("port", static_cast<int64_t>(port))
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log MySQL query error in structured format
 */
inline void LogMySQLQueryError(const std::string& query, const std::string& error_msg) {
  // Maximum query length to log (prevent log spam from large INSERT batches)
  constexpr size_t kMaxQueryLogLength = 200;

  StructuredLog()
      .Event("mysql_query_error")
      .Field("query", query.substr(0, kMaxQueryLogLength))
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage (backup file) error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

}  // namespace sqlbackup::utils
