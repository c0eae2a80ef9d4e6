/**
 * @file row.h
 * @brief Tagged field values, rows and buffered result sets
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace sqlbackup::mysql {

/**
 * @brief How a field value must be rendered as a SQL literal
 */
enum class ValueKind : uint8_t {
  kNull,     // SQL NULL
  kNumeric,  // integer, decimal, float, year: server text written unquoted
  kString,   // character data: quoted and escaped
  kBinary,   // binary/blob/bit/geometry bytes: hex literal
};

/**
 * @brief One column value of a row, holding the exact bytes the server sent
 */
struct FieldValue {
  ValueKind kind = ValueKind::kNull;
  std::string data;

  static FieldValue Null() { return {}; }
  static FieldValue Numeric(std::string text) { return {ValueKind::kNumeric, std::move(text)}; }
  static FieldValue String(std::string text) { return {ValueKind::kString, std::move(text)}; }
  static FieldValue Binary(std::string bytes) { return {ValueKind::kBinary, std::move(bytes)}; }

  [[nodiscard]] bool IsNull() const { return kind == ValueKind::kNull; }

  bool operator==(const FieldValue& other) const { return kind == other.kind && data == other.data; }
  bool operator!=(const FieldValue& other) const { return !(*this == other); }
};

/// Values in column ordinal order
using Row = std::vector<FieldValue>;

/**
 * @brief Fully buffered query result
 */
struct ResultSet {
  std::vector<std::string> columns;
  std::vector<Row> rows;

  [[nodiscard]] bool empty() const { return rows.empty(); }
  [[nodiscard]] size_t size() const { return rows.size(); }

  /**
   * @brief Index of a column by name, or -1 when absent
   */
  [[nodiscard]] int ColumnIndex(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
      if (columns[i] == name) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }
};

}  // namespace sqlbackup::mysql
