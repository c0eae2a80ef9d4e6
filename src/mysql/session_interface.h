/**
 * @file session_interface.h
 * @brief Abstract database session used by the dump and restore engines
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "mysql/row.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::mysql {

/**
 * @brief Forward-only cursor over an unbuffered result
 *
 * Rows are pulled from the server one at a time, so memory stays bounded
 * regardless of table size. While a cursor is open its session cannot run
 * other statements.
 */
class IRowCursor {
 public:
  virtual ~IRowCursor() = default;

  /**
   * @brief Fetch the next row
   * @param row Receives the values in column order
   * @return true when a row was read, false at end of data, error on a
   *         mid-stream failure (connection lost, timeout)
   */
  virtual utils::Expected<bool, utils::Error> Fetch(Row& row) = 0;

  /**
   * @brief Number of columns in the result
   */
  [[nodiscard]] virtual size_t ColumnCount() const = 0;
};

/**
 * @brief Interface for one live database session
 *
 * Implemented by Connection; tests substitute a mock.
 */
class ISession {
 public:
  virtual ~ISession() = default;

  /**
   * @brief Run a statement and buffer its whole result
   */
  virtual utils::Expected<ResultSet, utils::Error> Query(const std::string& sql) = 0;

  /**
   * @brief Run a statement without result set
   * @return Number of affected rows
   */
  virtual utils::Expected<uint64_t, utils::Error> Execute(const std::string& sql) = 0;

  /**
   * @brief Run a query and stream its rows lazily
   */
  virtual utils::Expected<std::unique_ptr<IRowCursor>, utils::Error> OpenStreamingCursor(const std::string& sql) = 0;

  /**
   * @brief Server version string (e.g. "8.0.36")
   */
  [[nodiscard]] virtual std::string ServerVersion() const = 0;

  /**
   * @brief Default database of the session
   */
  [[nodiscard]] virtual std::string Database() const = 0;
};

}  // namespace sqlbackup::mysql
