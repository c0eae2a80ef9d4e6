/**
 * @file value_encoder.h
 * @brief Renders field values and row batches as SQL text
 */

#pragma once

#include <string>
#include <vector>

#include "mysql/row.h"

namespace sqlbackup::dump {

/**
 * @brief Append the SQL literal for @p value to @p out
 *
 * - NULL            -> NULL
 * - numeric         -> server text, unquoted
 * - string          -> '...' with MySQL escapes
 * - binary          -> X'..' hex literal ('' when empty)
 */
void AppendValue(std::string& out, const mysql::FieldValue& value);

/**
 * @brief SQL literal for @p value
 */
std::string EncodeValue(const mysql::FieldValue& value);

/**
 * @brief Multi-row INSERT for one batch (no trailing semicolon)
 *
 * INSERT INTO `table` (`a`, `b`) VALUES (1,'x'),(2,NULL)
 *
 * @param table Table name
 * @param columns Column names in ordinal order
 * @param rows Non-empty batch, each row aligned with @p columns
 */
std::string BuildInsertStatement(const std::string& table, const std::vector<std::string>& columns,
                                 const std::vector<mysql::Row>& rows);

}  // namespace sqlbackup::dump
