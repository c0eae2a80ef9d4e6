/**
 * @file string_utils.h
 * @brief String helpers for SQL text generation and log formatting
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sqlbackup::utils {

/**
 * @brief Quote an identifier with backticks, doubling embedded backticks
 *
 * QuoteIdentifier("users") -> "`users`", QuoteIdentifier("a`b") -> "`a``b`"
 */
std::string QuoteIdentifier(std::string_view name);

/**
 * @brief Join identifiers as a backtick-quoted, comma separated list
 *
 * {"id", "name"} -> "`id`, `name`"
 */
std::string QuoteIdentifierList(const std::vector<std::string>& names);

/**
 * @brief Escape a string for use inside a single-quoted MySQL literal
 *
 * Escapes NUL, quote characters, backslash, backspace, newline, carriage
 * return, tab and Ctrl-Z the way mysql_real_escape_string does, so the
 * literal survives line-oriented tooling. Does not add the surrounding quotes.
 */
std::string EscapeStringLiteral(std::string_view value);

/**
 * @brief Encode bytes as upper-case hexadecimal
 */
std::string HexEncode(std::string_view bytes);

/**
 * @brief Remove leading and trailing ASCII whitespace
 */
std::string_view Trim(std::string_view text);

/**
 * @brief Case-insensitive ASCII prefix check
 */
bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix);

/**
 * @brief Format bytes to human-readable string (e.g., "1.50MB", "500B")
 */
std::string FormatBytes(size_t bytes);

}  // namespace sqlbackup::utils
