/**
 * @file dump_reader.cpp
 * @brief Dump reader implementation
 */

#include "dump/dump_reader.h"

#include <spdlog/spdlog.h>

#include <cctype>
#include <filesystem>
#include <fstream>

#include "dump/dump_format.h"
#include "utils/string_utils.h"

namespace sqlbackup::dump {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr int kEof = std::char_traits<char>::eof();

bool IsBlank(int chr) {
  return chr == ' ' || chr == '\t' || chr == '\r' || chr == '\n';
}

std::string FirstKeyword(const std::string& sql) {
  size_t pos = 0;
  while (pos < sql.size() && std::isspace(static_cast<unsigned char>(sql[pos])) != 0) {
    ++pos;
  }
  // Version comment: /*!40101 SET ... */
  if (sql.compare(pos, 3, "/*!") == 0) {
    pos += 3;
    while (pos < sql.size() && std::isdigit(static_cast<unsigned char>(sql[pos])) != 0) {
      ++pos;
    }
    while (pos < sql.size() && std::isspace(static_cast<unsigned char>(sql[pos])) != 0) {
      ++pos;
    }
  }
  std::string keyword;
  while (pos < sql.size() && std::isalpha(static_cast<unsigned char>(sql[pos])) != 0) {
    keyword.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(sql[pos]))));
    ++pos;
  }
  return keyword;
}

}  // namespace

StatementKind ClassifyStatement(const std::string& sql) {
  const std::string keyword = FirstKeyword(sql);
  if (keyword == "INSERT" || keyword == "REPLACE") {
    return StatementKind::kData;
  }
  if (keyword == "CREATE" || keyword == "DROP" || keyword == "ALTER" || keyword == "RENAME" ||
      keyword == "TRUNCATE") {
    return StatementKind::kSchema;
  }
  return StatementKind::kSession;
}

// StatementScanner

int StatementScanner::Get() {
  int chr = input_.get();
  if (chr == '\n') {
    line_++;
  }
  return chr;
}

int StatementScanner::Peek() {
  return input_.peek();
}

bool StatementScanner::BufferIsBlank() const {
  for (char chr : buffer_) {
    if (!IsBlank(static_cast<unsigned char>(chr))) {
      return false;
    }
  }
  return true;
}

bool StatementScanner::TakeMarker(Item& item) {
  if (!comment_at_line_start_ || !BufferIsBlank()) {
    return false;
  }
  const std::string_view text = utils::Trim(comment_);
  const std::string_view table_prefix = dump_format::kTableMarkerPrefix;
  // The prefix ends with a space that Trim may have removed for an empty name
  if (text.size() > table_prefix.size() && text.substr(0, table_prefix.size()) == table_prefix) {
    item.kind = ItemKind::kTableMarker;
    item.text = std::string(text.substr(table_prefix.size()));
    buffer_.clear();
    return true;
  }
  if (text == dump_format::kCompletionMarker) {
    item.kind = ItemKind::kCompletionMarker;
    item.text.clear();
    buffer_.clear();
    return true;
  }
  return false;
}

StatementScanner::Item StatementScanner::Next() {
  Item item;
  while (true) {
    int chr = Get();

    if (chr == kEof) {
      if (state_ == State::kLineComment) {
        state_ = State::kNormal;
        if (TakeMarker(item)) {
          return item;
        }
      }
      trailing_ = std::string(utils::Trim(buffer_));
      buffer_.clear();
      item.kind = ItemKind::kEnd;
      return item;
    }

    switch (state_) {
      case State::kNormal:
        if (chr == '\n') {
          buffer_.push_back('\n');
          at_line_start_ = true;
        } else if (chr == '-' && Peek() == '-') {
          Get();
          int next = Peek();
          if (next == kEof || std::isspace(next) != 0 || std::iscntrl(next) != 0) {
            state_ = State::kLineComment;
            comment_ = "--";
            comment_at_line_start_ = at_line_start_;
          } else {
            buffer_ += "--";
            at_line_start_ = false;
          }
        } else if (chr == '#') {
          state_ = State::kLineComment;
          comment_ = "#";
          comment_at_line_start_ = false;
        } else if (chr == '/' && Peek() == '*') {
          Get();
          int next = Peek();
          if (next == '!' || next == '+') {
            state_ = State::kVersionComment;
            buffer_ += "/*";
          } else {
            state_ = State::kBlockComment;
          }
          at_line_start_ = false;
        } else if (chr == dump_format::kTerminator) {
          std::string statement(utils::Trim(buffer_));
          buffer_.clear();
          at_line_start_ = false;
          if (!statement.empty()) {
            item.kind = ItemKind::kStatement;
            item.text = std::move(statement);
            return item;
          }
        } else {
          buffer_.push_back(static_cast<char>(chr));
          if (chr == '\'') {
            state_ = State::kSingleQuote;
          } else if (chr == '"') {
            state_ = State::kDoubleQuote;
          } else if (chr == '`') {
            state_ = State::kBacktick;
          }
          if (chr != ' ' && chr != '\t' && chr != '\r') {
            at_line_start_ = false;
          }
        }
        break;

      case State::kSingleQuote:
      case State::kDoubleQuote: {
        buffer_.push_back(static_cast<char>(chr));
        const char quote = state_ == State::kSingleQuote ? '\'' : '"';
        if (escape_) {
          escape_ = false;
        } else if (chr == '\\') {
          escape_ = true;
        } else if (chr == quote) {
          state_ = State::kNormal;
        }
        break;
      }

      case State::kBacktick:
        buffer_.push_back(static_cast<char>(chr));
        if (chr == '`') {
          state_ = State::kNormal;
        }
        break;

      case State::kLineComment:
        if (chr == '\n') {
          state_ = State::kNormal;
          at_line_start_ = true;
          if (TakeMarker(item)) {
            return item;
          }
          buffer_.push_back('\n');
        } else {
          comment_.push_back(static_cast<char>(chr));
        }
        break;

      case State::kBlockComment:
        if (chr == '*' && Peek() == '/') {
          Get();
          state_ = State::kNormal;
          buffer_.push_back(' ');
        }
        break;

      case State::kVersionComment:
        buffer_.push_back(static_cast<char>(chr));
        if (chr == '*' && Peek() == '/') {
          Get();
          buffer_.push_back('/');
          state_ = State::kNormal;
        }
        break;
    }
  }
}

// DumpReader

Expected<ParsedDump, Error> DumpReader::Parse(std::istream& input) {
  ParsedDump dump;
  StatementScanner scanner(input);
  bool in_epilogue = false;

  while (true) {
    StatementScanner::Item item = scanner.Next();
    if (item.kind == StatementScanner::ItemKind::kEnd) {
      break;
    }

    switch (item.kind) {
      case StatementScanner::ItemKind::kStatement: {
        DumpStatement statement;
        statement.kind = ClassifyStatement(item.text);
        statement.sql = std::move(item.text);
        if (in_epilogue) {
          dump.epilogue.push_back(std::move(statement));
        } else if (!dump.tables.empty()) {
          statement.table = dump.tables.back().table;
          dump.tables.back().statements.push_back(std::move(statement));
        } else {
          dump.preamble.push_back(std::move(statement));
        }
        break;
      }
      case StatementScanner::ItemKind::kTableMarker:
        if (in_epilogue) {
          return MakeUnexpected(MakeError(ErrorCode::kRestoreParseError,
                                          "Table marker after completion marker at line " +
                                              std::to_string(scanner.line() - 1))
                                    .WithTable(item.text));
        }
        dump.tables.push_back(TableSection{std::move(item.text), {}});
        break;
      case StatementScanner::ItemKind::kCompletionMarker:
        if (in_epilogue) {
          return MakeUnexpected(MakeError(ErrorCode::kRestoreParseError,
                                          "Duplicate completion marker at line " + std::to_string(scanner.line() - 1)));
        }
        in_epilogue = true;
        dump.complete = true;
        break;
      case StatementScanner::ItemKind::kEnd:
        break;
    }
  }

  if (input.bad()) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Read error while parsing dump"));
  }

  if (!scanner.trailing_fragment().empty()) {
    if (dump.complete) {
      return MakeUnexpected(
          MakeError(ErrorCode::kRestoreParseError, "Unterminated statement after completion marker",
                    scanner.trailing_fragment().substr(0, 200)));  // NOLINT(readability-magic-numbers)
    }
    dump.trailing_fragment = true;
  }

  spdlog::debug("Parsed dump: {} preamble, {} tables, {} epilogue statements, complete={}", dump.preamble.size(),
                dump.tables.size(), dump.epilogue.size(), dump.complete);
  return dump;
}

Expected<ParsedDump, Error> DumpReader::ParseFile(const std::string& path) {
  std::error_code error_code;
  if (!std::filesystem::is_regular_file(path, error_code)) {
    return MakeUnexpected(MakeError(ErrorCode::kRestoreFileNotFound, "SQL file not found: " + path));
  }

  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to open SQL file: " + path));
  }
  return Parse(input);
}

}  // namespace sqlbackup::dump
