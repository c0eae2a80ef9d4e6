/**
 * @file ddl_emitter.cpp
 * @brief DDL emitter implementation
 */

#include "schema/ddl_emitter.h"

#include <sstream>

#include "utils/string_utils.h"

namespace sqlbackup::schema {

namespace {

/**
 * @brief Remove a token from the EXTRA column text
 */
void EraseToken(std::string& text, const std::string& token) {
  size_t pos = 0;
  while ((pos = text.find(token, pos)) != std::string::npos) {
    text.erase(pos, token.size());
  }
}

/**
 * @brief EXTRA attributes that belong in the column definition
 *
 * Drops the markers the catalog adds for generated columns and
 * expression defaults, which the definition expresses elsewhere.
 */
std::string ColumnAttributes(const ColumnDef& column) {
  std::string extra = column.extra;
  EraseToken(extra, "DEFAULT_GENERATED");
  EraseToken(extra, "VIRTUAL GENERATED");
  EraseToken(extra, "STORED GENERATED");
  EraseToken(extra, "PERSISTENT GENERATED");
  std::string trimmed(utils::Trim(extra));

  const std::string kAutoIncrement = "auto_increment";
  size_t pos = trimmed.find(kAutoIncrement);
  if (pos != std::string::npos) {
    trimmed.replace(pos, kAutoIncrement.size(), "AUTO_INCREMENT");
  }
  return trimmed;
}

/**
 * @brief DEFAULT clause for an expression default, empty when none applies
 *
 * MySQL 8 reports DEFAULT (uuid()) as "uuid()"; only CURRENT_TIMESTAMP
 * and its synonyms may appear without parentheses. MariaDB literals come
 * pre-quoted and are copied as they are.
 */
std::string ExpressionDefault(const ColumnDef& column) {
  const std::string& expr = *column.default_value;
  if (expr.size() == 4 && utils::StartsWithIgnoreCase(expr, "NULL")) {
    return column.nullable ? " DEFAULT NULL" : "";
  }
  const bool bare = expr.front() == '\'' || expr.front() == '(' ||
                    utils::StartsWithIgnoreCase(expr, "CURRENT_TIMESTAMP") ||
                    utils::StartsWithIgnoreCase(expr, "NOW(") || utils::StartsWithIgnoreCase(expr, "LOCALTIME");
  return bare ? " DEFAULT " + expr : " DEFAULT (" + expr + ")";
}

std::string ColumnDefinition(const ColumnDef& column) {
  std::ostringstream sql;
  sql << utils::QuoteIdentifier(column.name) << " " << column.column_type;

  if (column.IsGenerated()) {
    sql << " GENERATED ALWAYS AS (" << column.generation_expression << ")"
        << (column.stored_generated ? " STORED" : " VIRTUAL");
  }

  if (!column.nullable) {
    sql << " NOT NULL";
  }

  if (!column.IsGenerated()) {
    if (column.default_value.has_value()) {
      if (column.default_is_expression && !column.default_value->empty()) {
        sql << ExpressionDefault(column);
      } else {
        sql << " DEFAULT '" << utils::EscapeStringLiteral(*column.default_value) << "'";
      }
    } else if (column.nullable) {
      sql << " DEFAULT NULL";
    }
  }

  std::string attributes = ColumnAttributes(column);
  if (!attributes.empty()) {
    sql << " " << attributes;
  }

  if (!column.comment.empty()) {
    sql << " COMMENT '" << utils::EscapeStringLiteral(column.comment) << "'";
  }
  return sql.str();
}

std::string IndexDefinition(const IndexDef& index) {
  std::ostringstream sql;
  if (index.index_type == "FULLTEXT") {
    sql << "FULLTEXT KEY ";
  } else if (index.index_type == "SPATIAL") {
    sql << "SPATIAL KEY ";
  } else if (index.unique) {
    sql << "UNIQUE KEY ";
  } else {
    sql << "KEY ";
  }
  sql << utils::QuoteIdentifier(index.name) << " (";
  for (size_t i = 0; i < index.columns.size(); ++i) {
    if (i > 0) {
      sql << ",";
    }
    sql << utils::QuoteIdentifier(index.columns[i].name);
    if (index.columns[i].prefix_length.has_value()) {
      sql << "(" << *index.columns[i].prefix_length << ")";
    }
  }
  sql << ")";
  if (index.index_type == "HASH") {
    sql << " USING HASH";
  }
  return sql.str();
}

std::string ForeignKeyDefinition(const ForeignKeyDef& fk) {
  std::ostringstream sql;
  sql << "CONSTRAINT " << utils::QuoteIdentifier(fk.name) << " FOREIGN KEY ("
      << utils::QuoteIdentifierList(fk.columns) << ") REFERENCES ";
  if (!fk.referenced_schema.empty()) {
    sql << utils::QuoteIdentifier(fk.referenced_schema) << ".";
  }
  sql << utils::QuoteIdentifier(fk.referenced_table) << " (" << utils::QuoteIdentifierList(fk.referenced_columns)
      << ")";
  if (!fk.on_delete.empty()) {
    sql << " ON DELETE " << fk.on_delete;
  }
  if (!fk.on_update.empty()) {
    sql << " ON UPDATE " << fk.on_update;
  }
  return sql.str();
}

}  // namespace

bool ParseDdlSource(const std::string& name, DdlSource& source) {
  if (name == "server") {
    source = DdlSource::kServer;
    return true;
  }
  if (name == "catalog") {
    source = DdlSource::kCatalog;
    return true;
  }
  return false;
}

std::string DdlEmitter::EmitCreateTable(const TableSchema& table) const {
  if (source_ == DdlSource::kServer && !table.create_statement.empty()) {
    return table.create_statement;
  }
  return SynthesizeCreateTable(table);
}

std::string DdlEmitter::EmitDropTable(const std::string& table_name) {
  return "DROP TABLE IF EXISTS " + utils::QuoteIdentifier(table_name);
}

std::string DdlEmitter::SynthesizeCreateTable(const TableSchema& table) {
  std::vector<std::string> definitions;
  definitions.reserve(table.columns.size() + table.indexes.size() + table.foreign_keys.size() + 1);

  for (const auto& column : table.columns) {
    definitions.push_back(ColumnDefinition(column));
  }
  if (!table.primary_key.empty()) {
    definitions.push_back("PRIMARY KEY (" + utils::QuoteIdentifierList(table.primary_key) + ")");
  }
  for (const auto& index : table.indexes) {
    definitions.push_back(IndexDefinition(index));
  }
  for (const auto& fk : table.foreign_keys) {
    definitions.push_back(ForeignKeyDefinition(fk));
  }

  std::ostringstream sql;
  sql << "CREATE TABLE " << utils::QuoteIdentifier(table.name) << " (\n";
  for (size_t i = 0; i < definitions.size(); ++i) {
    sql << "  " << definitions[i] << (i + 1 < definitions.size() ? ",\n" : "\n");
  }
  sql << ")";

  if (!table.engine.empty()) {
    sql << " ENGINE=" << table.engine;
  }
  if (!table.collation.empty()) {
    sql << " DEFAULT COLLATE=" << table.collation;
  }
  if (!table.comment.empty()) {
    sql << " COMMENT='" << utils::EscapeStringLiteral(table.comment) << "'";
  }
  return sql.str();
}

}  // namespace sqlbackup::schema
