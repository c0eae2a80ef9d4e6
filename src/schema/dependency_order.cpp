/**
 * @file dependency_order.cpp
 * @brief Stable topological sort of tables by foreign keys
 */

#include "schema/dependency_order.h"

#include <functional>
#include <queue>
#include <set>
#include <unordered_map>

#include "utils/structured_log.h"

namespace sqlbackup::schema {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

Expected<DependencyOrder, Error> OrderByDependencies(std::vector<TableSchema> tables, const std::string& schema_name) {
  const size_t count = tables.size();

  std::unordered_map<std::string, size_t> index_by_name;
  for (size_t i = 0; i < count; ++i) {
    index_by_name.emplace(tables[i].name, i);
  }

  // dependents[i]: tables that reference table i
  std::vector<std::set<size_t>> dependents(count);
  std::vector<size_t> in_degree(count, 0);

  for (size_t i = 0; i < count; ++i) {
    std::set<size_t> dependencies;
    for (const auto& fk : tables[i].foreign_keys) {
      if (!fk.referenced_schema.empty() && fk.referenced_schema != schema_name) {
        continue;
      }
      auto iter = index_by_name.find(fk.referenced_table);
      if (iter == index_by_name.end()) {
        return MakeUnexpected(
            MakeError(ErrorCode::kIntrospectionMissingReference,
                      "Foreign key " + fk.name + " references missing table " + fk.referenced_table)
                .WithTable(tables[i].name));
      }
      if (iter->second != i) {
        dependencies.insert(iter->second);
      }
    }
    in_degree[i] = dependencies.size();
    for (size_t dependency : dependencies) {
      dependents[dependency].insert(i);
    }
  }

  // Min-heap on catalog position keeps the sort stable
  std::priority_queue<size_t, std::vector<size_t>, std::greater<>> ready;
  for (size_t i = 0; i < count; ++i) {
    if (in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<size_t> order;
  order.reserve(count);
  std::vector<bool> placed(count, false);
  while (!ready.empty()) {
    size_t current = ready.top();
    ready.pop();
    order.push_back(current);
    placed[current] = true;
    for (size_t dependent : dependents[current]) {
      if (--in_degree[dependent] == 0) {
        ready.push(dependent);
      }
    }
  }

  DependencyOrder result;
  if (order.size() < count) {
    result.has_cycle = true;
    for (size_t i = 0; i < count; ++i) {
      if (!placed[i]) {
        order.push_back(i);
        result.cyclic_tables.push_back(tables[i].name);
      }
    }

    std::string names;
    for (const auto& name : result.cyclic_tables) {
      names += names.empty() ? name : "," + name;
    }
    utils::StructuredLog()
        .Event("foreign_key_cycle")
        .Field("schema", schema_name)
        .Field("tables", names)
        .Message("Tables placed in catalog order; restore relies on FOREIGN_KEY_CHECKS = 0")
        .Warn();
  }

  result.tables.reserve(count);
  for (size_t index : order) {
    result.tables.push_back(std::move(tables[index]));
  }
  return result;
}

}  // namespace sqlbackup::schema
