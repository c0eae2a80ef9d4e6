/**
 * @file transaction.h
 * @brief Scoped transaction guard over an ISession
 */

#pragma once

#include <memory>

#include "mysql/session_interface.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::mysql {

/**
 * @brief RAII transaction
 *
 * Begin() issues START TRANSACTION. The destructor issues ROLLBACK when the
 * transaction was neither committed nor rolled back, so every early return
 * leaves the target database unchanged.
 *
 * Example usage:
 * @code
 * auto txn = Transaction::Begin(session);
 * if (!txn) return MakeUnexpected(txn.error());
 * ... execute statements, return on error ...
 * return (*txn)->Commit();
 * @endcode
 */
class Transaction {
 public:
  /**
   * @brief Start a transaction on @p session
   */
  static utils::Expected<std::unique_ptr<Transaction>, utils::Error> Begin(ISession& session);

  /**
   * @brief Start a REPEATABLE READ transaction with a consistent snapshot
   *
   * Every read through @p session until Commit() sees the same point in
   * time, so a multi-table dump is consistent for InnoDB tables.
   */
  static utils::Expected<std::unique_ptr<Transaction>, utils::Error> BeginConsistentSnapshot(ISession& session);

  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  /**
   * @brief COMMIT; a failed commit leaves the transaction to be rolled back
   */
  utils::Expected<void, utils::Error> Commit();

  /**
   * @brief ROLLBACK explicitly
   */
  utils::Expected<void, utils::Error> Rollback();

  [[nodiscard]] bool IsActive() const { return active_; }

 private:
  explicit Transaction(ISession& session) : session_(session) {}

  ISession& session_;
  bool active_ = true;
};

}  // namespace sqlbackup::mysql
