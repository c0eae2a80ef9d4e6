/**
 * @file dependency_order.h
 * @brief Foreign-key dependency ordering of tables
 */

#pragma once

#include <string>
#include <vector>

#include "schema/table_schema.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::schema {

/**
 * @brief Result of OrderByDependencies
 */
struct DependencyOrder {
  std::vector<TableSchema> tables;
  bool has_cycle = false;
  std::vector<std::string> cyclic_tables;
};

/**
 * @brief Sort tables so every referenced table precedes the tables referencing it
 *
 * Stable topological sort (Kahn): among tables whose dependencies are
 * satisfied, the one earliest in @p tables (catalog order) goes first.
 * Self references and references to other schemas add no edge. Tables
 * left over by a cycle are appended in catalog order and reported.
 *
 * @param tables Tables in catalog order
 * @param schema_name Schema the tables belong to
 * @return Ordered tables, or kIntrospectionMissingReference when a foreign
 *         key names a table of @p schema_name that is not in @p tables
 */
utils::Expected<DependencyOrder, utils::Error> OrderByDependencies(std::vector<TableSchema> tables,
                                                                   const std::string& schema_name);

}  // namespace sqlbackup::schema
