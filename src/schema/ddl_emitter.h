/**
 * @file ddl_emitter.h
 * @brief Emits CREATE / DROP TABLE statements for a table schema
 */

#pragma once

#include <cstdint>
#include <string>

#include "schema/table_schema.h"

namespace sqlbackup::schema {

/**
 * @brief Where CREATE TABLE text comes from
 */
enum class DdlSource : uint8_t {
  kServer,   // SHOW CREATE TABLE text, verbatim
  kCatalog,  // synthesized from the information_schema description
};

/**
 * @brief Parse "server" / "catalog"
 * @return false for any other name
 */
bool ParseDdlSource(const std::string& name, DdlSource& source);

/**
 * @brief DDL emitter
 *
 * Pure: emitting twice from the same schema yields identical text.
 * Statements carry no trailing semicolon.
 */
class DdlEmitter {
 public:
  explicit DdlEmitter(DdlSource source = DdlSource::kServer) : source_(source) {}

  /**
   * @brief CREATE TABLE statement reproducing @p table
   *
   * Uses the server text when the source is kServer and the text is
   * available; otherwise builds the statement from columns, primary key,
   * indexes and foreign keys, copying type strings and defaults verbatim.
   */
  [[nodiscard]] std::string EmitCreateTable(const TableSchema& table) const;

  /**
   * @brief DROP TABLE IF EXISTS statement
   */
  [[nodiscard]] static std::string EmitDropTable(const std::string& table_name);

  /**
   * @brief CREATE TABLE synthesized from the catalog description
   */
  [[nodiscard]] static std::string SynthesizeCreateTable(const TableSchema& table);

  [[nodiscard]] DdlSource source() const { return source_; }

 private:
  DdlSource source_;
};

}  // namespace sqlbackup::schema
