/**
 * @file schema_introspector.h
 * @brief Reads table structure of a database from information_schema
 */

#pragma once

#include <string>
#include <vector>

#include "mysql/session_interface.h"
#include "schema/table_schema.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::schema {

/**
 * @brief Schema introspector
 *
 * Reads base tables, columns, indexes and foreign keys of one database
 * and returns the tables in foreign-key dependency order. Must run before
 * any streaming cursor is opened on the same session.
 */
class SchemaIntrospector {
 public:
  explicit SchemaIntrospector(mysql::ISession& session) : session_(session) {}

  /**
   * @brief Introspect every base table of @p database
   *
   * Errors are kIntrospectionFailed (catalog query failed),
   * kIntrospectionEmptyTable (table without columns) or
   * kIntrospectionMissingReference, carrying the table name when one is
   * involved.
   */
  utils::Expected<DatabaseSchema, utils::Error> Introspect(const std::string& database);

  /**
   * @brief Base table names of @p database in catalog order
   */
  utils::Expected<std::vector<TableSchema>, utils::Error> ListTables(const std::string& database);

 private:
  mysql::ISession& session_;

  utils::Expected<void, utils::Error> LoadColumns(const std::string& database, std::vector<TableSchema>& tables);
  utils::Expected<void, utils::Error> LoadIndexes(const std::string& database, std::vector<TableSchema>& tables);
  utils::Expected<void, utils::Error> LoadForeignKeys(const std::string& database, std::vector<TableSchema>& tables);
  utils::Expected<void, utils::Error> LoadCreateStatement(const std::string& database, TableSchema& table);
};

/**
 * @brief Tell an expression default from a literal one
 *
 * @param default_value COLUMN_DEFAULT as returned by the server
 * @param extra EXTRA column ("DEFAULT_GENERATED" marks expressions on MySQL 8)
 */
bool IsDefaultExpression(const std::string& default_value, const std::string& extra);

/**
 * @brief True for the bare NULL that MariaDB reports for "no default"
 *
 * MariaDB quotes literal defaults, so a literal 'NULL' string default
 * arrives as "'NULL'" and is not matched.
 */
bool IsNullDefault(const std::string& default_value);

}  // namespace sqlbackup::schema
