/**
 * @file schema_introspector.cpp
 * @brief information_schema reader implementation
 */

#include "schema/schema_introspector.h"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <unordered_map>

#include "schema/dependency_order.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace sqlbackup::schema {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

const std::string& Text(const mysql::Row& row, size_t index) {
  return row[index].data;
}

bool IsNull(const mysql::Row& row, size_t index) {
  return index >= row.size() || row[index].IsNull();
}

uint32_t ToUint32(const std::string& text) {
  constexpr int kBase = 10;
  return static_cast<uint32_t>(std::strtoul(text.c_str(), nullptr, kBase));
}

std::string SchemaLiteral(const std::string& database) {
  return "'" + utils::EscapeStringLiteral(database) + "'";
}

Error CatalogError(const std::string& what, const Error& cause) {
  return MakeError(ErrorCode::kIntrospectionFailed, "Failed to read " + what + ": " + cause.message(),
                   cause.to_string());
}

/**
 * @brief Check the result has at least @p columns columns
 */
Expected<void, Error> RequireColumns(const mysql::ResultSet& result, size_t columns, const std::string& what) {
  if (result.columns.size() < columns) {
    return MakeUnexpected(MakeError(ErrorCode::kIntrospectionFailed,
                                    "Unexpected result shape while reading " + what + ": expected " +
                                        std::to_string(columns) + " columns, got " +
                                        std::to_string(result.columns.size())));
  }
  return {};
}

}  // namespace

bool IsNullDefault(const std::string& default_value) {
  return default_value.size() == 4 && utils::StartsWithIgnoreCase(default_value, "NULL");
}

bool IsDefaultExpression(const std::string& default_value, const std::string& extra) {
  if (IsNullDefault(default_value) || extra.find("DEFAULT_GENERATED") != std::string::npos) {
    return true;
  }
  // MariaDB reports literal defaults already quoted and expressions bare
  if (!default_value.empty() && default_value.front() == '\'') {
    return true;
  }
  return utils::StartsWithIgnoreCase(default_value, "CURRENT_TIMESTAMP") ||
         utils::StartsWithIgnoreCase(default_value, "NOW(") || utils::StartsWithIgnoreCase(default_value, "(");
}

Expected<std::vector<TableSchema>, Error> SchemaIntrospector::ListTables(const std::string& database) {
  const std::string sql =
      "SELECT TABLE_NAME, ENGINE, TABLE_COLLATION, TABLE_COMMENT FROM information_schema.TABLES "
      "WHERE TABLE_SCHEMA = " +
      SchemaLiteral(database) + " AND TABLE_TYPE = 'BASE TABLE' ORDER BY TABLE_NAME";

  auto result = session_.Query(sql);
  if (!result) {
    return MakeUnexpected(CatalogError("table list", result.error()));
  }
  constexpr size_t kTableColumns = 4;
  if (auto shape = RequireColumns(*result, kTableColumns, "table list"); !shape) {
    return MakeUnexpected(shape.error());
  }

  std::vector<TableSchema> tables;
  tables.reserve(result->rows.size());
  for (const auto& row : result->rows) {
    TableSchema table;
    table.name = Text(row, 0);
    if (!IsNull(row, 1)) {
      table.engine = Text(row, 1);
    }
    if (!IsNull(row, 2)) {
      table.collation = Text(row, 2);
    }
    if (!IsNull(row, 3)) {
      table.comment = Text(row, 3);
    }
    tables.push_back(std::move(table));
  }
  return tables;
}

Expected<void, Error> SchemaIntrospector::LoadColumns(const std::string& database, std::vector<TableSchema>& tables) {
  const std::string sql =
      "SELECT TABLE_NAME, COLUMN_NAME, ORDINAL_POSITION, COLUMN_DEFAULT, IS_NULLABLE, COLUMN_TYPE, EXTRA, "
      "COLUMN_COMMENT, GENERATION_EXPRESSION FROM information_schema.COLUMNS WHERE TABLE_SCHEMA = " +
      SchemaLiteral(database) + " ORDER BY TABLE_NAME, ORDINAL_POSITION";

  auto result = session_.Query(sql);
  if (!result) {
    return MakeUnexpected(CatalogError("columns", result.error()));
  }
  constexpr size_t kColumnColumns = 9;
  if (auto shape = RequireColumns(*result, kColumnColumns, "columns"); !shape) {
    return shape;
  }

  std::unordered_map<std::string, TableSchema*> by_name;
  for (auto& table : tables) {
    by_name.emplace(table.name, &table);
  }

  for (const auto& row : result->rows) {
    auto iter = by_name.find(Text(row, 0));
    if (iter == by_name.end()) {
      continue;  // view column
    }

    ColumnDef column;
    column.name = Text(row, 1);
    column.ordinal_position = ToUint32(Text(row, 2));
    column.extra = IsNull(row, 6) ? "" : Text(row, 6);
    if (!IsNull(row, 3) && !IsNullDefault(Text(row, 3))) {
      column.default_value = Text(row, 3);
      column.default_is_expression = IsDefaultExpression(*column.default_value, column.extra);
    }
    column.nullable = Text(row, 4) == "YES";
    column.column_type = Text(row, 5);
    column.comment = IsNull(row, 7) ? "" : Text(row, 7);
    if (!IsNull(row, 8)) {
      column.generation_expression = Text(row, 8);
      column.stored_generated = column.extra.find("STORED") != std::string::npos;
    }
    iter->second->columns.push_back(std::move(column));
  }

  for (const auto& table : tables) {
    if (table.columns.empty()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIntrospectionEmptyTable, "Table " + table.name + " has no columns").WithTable(table.name));
    }
  }
  return {};
}

Expected<void, Error> SchemaIntrospector::LoadIndexes(const std::string& database, std::vector<TableSchema>& tables) {
  const std::string sql =
      "SELECT TABLE_NAME, INDEX_NAME, NON_UNIQUE, SEQ_IN_INDEX, COLUMN_NAME, SUB_PART, INDEX_TYPE "
      "FROM information_schema.STATISTICS WHERE TABLE_SCHEMA = " +
      SchemaLiteral(database) + " ORDER BY TABLE_NAME, INDEX_NAME, SEQ_IN_INDEX";

  auto result = session_.Query(sql);
  if (!result) {
    return MakeUnexpected(CatalogError("indexes", result.error()));
  }
  constexpr size_t kIndexColumns = 7;
  if (auto shape = RequireColumns(*result, kIndexColumns, "indexes"); !shape) {
    return shape;
  }

  std::unordered_map<std::string, TableSchema*> by_name;
  for (auto& table : tables) {
    by_name.emplace(table.name, &table);
  }

  for (const auto& row : result->rows) {
    auto iter = by_name.find(Text(row, 0));
    if (iter == by_name.end()) {
      continue;
    }
    TableSchema& table = *iter->second;
    const std::string& index_name = Text(row, 1);

    if (IsNull(row, 4)) {
      // Functional key part; only the server DDL can represent it
      spdlog::debug("Skipping expression key part of index {} on {}", index_name, table.name);
      continue;
    }

    if (index_name == "PRIMARY") {
      table.primary_key.push_back(Text(row, 4));
      continue;
    }

    if (table.indexes.empty() || table.indexes.back().name != index_name) {
      IndexDef index;
      index.name = index_name;
      index.unique = Text(row, 2) == "0";
      index.index_type = IsNull(row, 6) ? "BTREE" : Text(row, 6);
      table.indexes.push_back(std::move(index));
    }

    IndexColumn column;
    column.name = Text(row, 4);
    if (!IsNull(row, 5)) {
      column.prefix_length = ToUint32(Text(row, 5));
    }
    table.indexes.back().columns.push_back(std::move(column));
  }
  return {};
}

Expected<void, Error> SchemaIntrospector::LoadForeignKeys(const std::string& database,
                                                          std::vector<TableSchema>& tables) {
  const std::string sql =
      "SELECT k.TABLE_NAME, k.CONSTRAINT_NAME, k.COLUMN_NAME, k.REFERENCED_TABLE_SCHEMA, "
      "k.REFERENCED_TABLE_NAME, k.REFERENCED_COLUMN_NAME, r.UPDATE_RULE, r.DELETE_RULE "
      "FROM information_schema.KEY_COLUMN_USAGE k "
      "JOIN information_schema.REFERENTIAL_CONSTRAINTS r "
      "ON r.CONSTRAINT_SCHEMA = k.CONSTRAINT_SCHEMA AND r.CONSTRAINT_NAME = k.CONSTRAINT_NAME "
      "AND r.TABLE_NAME = k.TABLE_NAME "
      "WHERE k.TABLE_SCHEMA = " +
      SchemaLiteral(database) +
      " AND k.REFERENCED_TABLE_NAME IS NOT NULL "
      "ORDER BY k.TABLE_NAME, k.CONSTRAINT_NAME, k.ORDINAL_POSITION";

  auto result = session_.Query(sql);
  if (!result) {
    return MakeUnexpected(CatalogError("foreign keys", result.error()));
  }
  constexpr size_t kForeignKeyColumns = 8;
  if (auto shape = RequireColumns(*result, kForeignKeyColumns, "foreign keys"); !shape) {
    return shape;
  }

  std::unordered_map<std::string, TableSchema*> by_name;
  for (auto& table : tables) {
    by_name.emplace(table.name, &table);
  }

  for (const auto& row : result->rows) {
    auto iter = by_name.find(Text(row, 0));
    if (iter == by_name.end()) {
      continue;
    }
    TableSchema& table = *iter->second;
    const std::string& constraint = Text(row, 1);

    if (table.foreign_keys.empty() || table.foreign_keys.back().name != constraint) {
      ForeignKeyDef fk;
      fk.name = constraint;
      fk.referenced_schema = IsNull(row, 3) ? "" : Text(row, 3);
      fk.referenced_table = Text(row, 4);
      fk.on_update = Text(row, 6);
      fk.on_delete = Text(row, 7);
      table.foreign_keys.push_back(std::move(fk));
    }
    table.foreign_keys.back().columns.push_back(Text(row, 2));
    table.foreign_keys.back().referenced_columns.push_back(Text(row, 5));
  }
  return {};
}

Expected<void, Error> SchemaIntrospector::LoadCreateStatement(const std::string& database, TableSchema& table) {
  auto result = session_.Query("SHOW CREATE TABLE " + utils::QuoteIdentifier(database) + "." +
                               utils::QuoteIdentifier(table.name));
  if (!result) {
    return MakeUnexpected(CatalogError("CREATE statement", result.error()).WithTable(table.name));
  }
  if (result->rows.empty() || result->rows.front().size() < 2 || IsNull(result->rows.front(), 1)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIntrospectionFailed, "SHOW CREATE TABLE returned no statement").WithTable(table.name));
  }
  table.create_statement = Text(result->rows.front(), 1);
  return {};
}

Expected<DatabaseSchema, Error> SchemaIntrospector::Introspect(const std::string& database) {
  auto tables = ListTables(database);
  if (!tables) {
    return MakeUnexpected(tables.error());
  }

  if (auto loaded = LoadColumns(database, *tables); !loaded) {
    return MakeUnexpected(loaded.error());
  }
  if (auto loaded = LoadIndexes(database, *tables); !loaded) {
    return MakeUnexpected(loaded.error());
  }
  if (auto loaded = LoadForeignKeys(database, *tables); !loaded) {
    return MakeUnexpected(loaded.error());
  }
  for (auto& table : *tables) {
    if (auto loaded = LoadCreateStatement(database, table); !loaded) {
      return MakeUnexpected(loaded.error());
    }
  }

  auto ordered = OrderByDependencies(std::move(*tables), database);
  if (!ordered) {
    return MakeUnexpected(ordered.error());
  }

  DatabaseSchema schema;
  schema.name = database;
  schema.tables = std::move(ordered->tables);
  schema.has_cycle = ordered->has_cycle;
  schema.cyclic_tables = std::move(ordered->cyclic_tables);

  utils::StructuredLog()
      .Event("schema_introspected")
      .Field("database", database)
      .Field("tables", static_cast<uint64_t>(schema.tables.size()))
      .Field("fk_cycle", schema.has_cycle)
      .Info();
  return schema;
}

}  // namespace sqlbackup::schema
