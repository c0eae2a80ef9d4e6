/**
 * @file table_schema.h
 * @brief Table structure as read from information_schema
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlbackup::schema {

/**
 * @brief Column definition
 */
struct ColumnDef {
  std::string name;
  std::string column_type;                    // COLUMN_TYPE verbatim, e.g. "varchar(255)", "int unsigned"
  bool nullable = true;
  std::optional<std::string> default_value;   // COLUMN_DEFAULT, absent when the column has none
  bool default_is_expression = false;         // CURRENT_TIMESTAMP, (uuid()), pre-quoted literals
  std::string extra;                          // "auto_increment", "on update CURRENT_TIMESTAMP", ...
  std::string generation_expression;          // non-empty for generated columns
  bool stored_generated = false;              // STORED (true) or VIRTUAL (false) generated column
  std::string comment;
  uint32_t ordinal_position = 0;              // 1-based

  [[nodiscard]] bool IsGenerated() const { return !generation_expression.empty(); }
};

/**
 * @brief One column of an index, with optional prefix length
 */
struct IndexColumn {
  std::string name;
  std::optional<uint32_t> prefix_length;  // SUB_PART
};

/**
 * @brief Secondary index definition (PRIMARY is kept in TableSchema::primary_key)
 */
struct IndexDef {
  std::string name;
  bool unique = false;
  std::string index_type = "BTREE";  // BTREE, HASH, FULLTEXT, SPATIAL
  std::vector<IndexColumn> columns;
};

/**
 * @brief Foreign key constraint definition
 */
struct ForeignKeyDef {
  std::string name;
  std::vector<std::string> columns;
  std::string referenced_schema;
  std::string referenced_table;
  std::vector<std::string> referenced_columns;
  std::string on_update = "RESTRICT";
  std::string on_delete = "RESTRICT";
};

/**
 * @brief Full description of one base table
 */
struct TableSchema {
  std::string name;
  std::vector<ColumnDef> columns;         // ordinal order
  std::vector<std::string> primary_key;   // key order
  std::vector<IndexDef> indexes;
  std::vector<ForeignKeyDef> foreign_keys;
  std::string engine;
  std::string collation;
  std::string comment;
  std::string create_statement;  // SHOW CREATE TABLE text

  /**
   * @brief Columns that accept values on INSERT (generated columns excluded), in ordinal order
   */
  [[nodiscard]] std::vector<std::string> InsertableColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& column : columns) {
      if (!column.IsGenerated()) {
        names.push_back(column.name);
      }
    }
    return names;
  }
};

/**
 * @brief All base tables of a database in dependency order
 */
struct DatabaseSchema {
  std::string name;
  std::vector<TableSchema> tables;         // referenced tables before referencing tables
  bool has_cycle = false;                  // foreign keys form a cycle
  std::vector<std::string> cyclic_tables;  // tables placed by catalog order because of the cycle
};

}  // namespace sqlbackup::schema
