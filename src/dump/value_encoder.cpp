/**
 * @file value_encoder.cpp
 * @brief SQL literal rendering
 */

#include "dump/value_encoder.h"

#include "utils/string_utils.h"

namespace sqlbackup::dump {

void AppendValue(std::string& out, const mysql::FieldValue& value) {
  switch (value.kind) {
    case mysql::ValueKind::kNull:
      out += "NULL";
      break;
    case mysql::ValueKind::kNumeric:
      out += value.data;
      break;
    case mysql::ValueKind::kString:
      out += '\'';
      out += utils::EscapeStringLiteral(value.data);
      out += '\'';
      break;
    case mysql::ValueKind::kBinary:
      if (value.data.empty()) {
        out += "''";
      } else {
        out += "X'";
        out += utils::HexEncode(value.data);
        out += '\'';
      }
      break;
  }
}

std::string EncodeValue(const mysql::FieldValue& value) {
  std::string out;
  AppendValue(out, value);
  return out;
}

std::string BuildInsertStatement(const std::string& table, const std::vector<std::string>& columns,
                                 const std::vector<mysql::Row>& rows) {
  std::string sql = "INSERT INTO " + utils::QuoteIdentifier(table) + " (" + utils::QuoteIdentifierList(columns) +
                    ") VALUES ";
  for (size_t r = 0; r < rows.size(); ++r) {
    if (r > 0) {
      sql += ',';
    }
    sql += '(';
    const auto& row = rows[r];
    for (size_t c = 0; c < row.size(); ++c) {
      if (c > 0) {
        sql += ',';
      }
      AppendValue(sql, row[c]);
    }
    sql += ')';
  }
  return sql;
}

}  // namespace sqlbackup::dump
