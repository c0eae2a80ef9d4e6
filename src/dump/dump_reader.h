/**
 * @file dump_reader.h
 * @brief Splits a SQL dump into statements and table sections
 */

#pragma once

#include <cstdint>
#include <istream>
#include <string>

#include "dump/dump_statement.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::dump {

/**
 * @brief Incremental statement scanner
 *
 * Reads characters from a stream and yields complete statements and
 * structural markers. Statement terminators inside quoted strings
 * (single, double, backtick) and comments are not terminators. Backslash
 * escapes are honoured inside single and double quotes. Plain comments
 * (--, #, / * * /) are dropped; version comments (/ *! ... * /) are kept
 * because the server executes them.
 */
class StatementScanner {
 public:
  /**
   * @brief Kind of item produced by Next()
   */
  enum class ItemKind : uint8_t {
    kStatement,        // text holds the statement without terminator
    kTableMarker,      // text holds the table name
    kCompletionMarker,  // "-- Dump completed"
    kEnd,              // end of input
  };

  struct Item {
    ItemKind kind = ItemKind::kEnd;
    std::string text;
  };

  explicit StatementScanner(std::istream& input) : input_(input) {}

  /**
   * @brief Produce the next item
   */
  Item Next();

  /**
   * @brief Unterminated statement text left at end of input
   */
  [[nodiscard]] const std::string& trailing_fragment() const { return trailing_; }

  /**
   * @brief 1-based line number of the scanner position
   */
  [[nodiscard]] uint64_t line() const { return line_; }

 private:
  enum class State : uint8_t {
    kNormal,
    kSingleQuote,
    kDoubleQuote,
    kBacktick,
    kLineComment,
    kBlockComment,
    kVersionComment,
  };

  std::istream& input_;
  State state_ = State::kNormal;
  std::string buffer_;        // current statement text
  std::string comment_;       // current line comment text
  bool comment_at_line_start_ = false;
  bool at_line_start_ = true;
  bool escape_ = false;
  uint64_t line_ = 1;
  std::string trailing_;

  int Get();
  int Peek();
  bool BufferIsBlank() const;
  bool TakeMarker(Item& item);
};

/**
 * @brief Dump reader
 */
class DumpReader {
 public:
  /**
   * @brief Read a whole dump
   *
   * Statements before the first table marker form the preamble, statements
   * after the completion marker form the epilogue. A missing completion
   * marker marks the dump incomplete. Unterminated text after the
   * completion marker is a kRestoreParseError.
   */
  static utils::Expected<ParsedDump, utils::Error> Parse(std::istream& input);

  /**
   * @brief Read a dump file
   * @return kRestoreFileNotFound when @p path does not exist
   */
  static utils::Expected<ParsedDump, utils::Error> ParseFile(const std::string& path);
};

}  // namespace sqlbackup::dump
