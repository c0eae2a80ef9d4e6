/**
 * @file dump_statement.h
 * @brief Statements of a parsed dump, grouped into sections
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace sqlbackup::dump {

/**
 * @brief Role of a statement in the dump
 */
enum class StatementKind : uint8_t {
  kSession,  // SET ... (preamble, epilogue)
  kSchema,   // DROP / CREATE / ALTER
  kData,     // INSERT / REPLACE
};

/**
 * @brief One ';'-terminated statement (terminator stripped)
 */
struct DumpStatement {
  StatementKind kind = StatementKind::kSession;
  std::string table;  // owning table section, empty in preamble/epilogue
  std::string sql;
};

/**
 * @brief Statements following one "-- Table:" marker, in file order
 */
struct TableSection {
  std::string table;
  std::vector<DumpStatement> statements;
};

/**
 * @brief Whole dump split into preamble, table sections and epilogue
 */
struct ParsedDump {
  std::vector<DumpStatement> preamble;
  std::vector<TableSection> tables;
  std::vector<DumpStatement> epilogue;
  bool complete = false;           // completion marker seen
  bool trailing_fragment = false;  // unterminated text at end of input
};

/**
 * @brief Classify a statement by its leading keyword
 */
StatementKind ClassifyStatement(const std::string& sql);

}  // namespace sqlbackup::dump
