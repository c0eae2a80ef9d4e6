/**
 * @file transaction.cpp
 * @brief Scoped transaction guard implementation
 */

#include "mysql/transaction.h"

#include <spdlog/spdlog.h>

#include "utils/structured_log.h"

namespace sqlbackup::mysql {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

Expected<std::unique_ptr<Transaction>, Error> Transaction::Begin(ISession& session) {
  auto result = session.Execute("START TRANSACTION");
  if (!result) {
    return MakeUnexpected(
        MakeError(ErrorCode::kMySQLTransactionFailed, "Failed to start transaction: " + result.error().message()));
  }
  return std::unique_ptr<Transaction>(new Transaction(session));
}

Expected<std::unique_ptr<Transaction>, Error> Transaction::BeginConsistentSnapshot(ISession& session) {
  auto isolation = session.Execute("SET SESSION TRANSACTION ISOLATION LEVEL REPEATABLE READ");
  if (!isolation) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLTransactionFailed,
                                    "Failed to set isolation level: " + isolation.error().message()));
  }
  auto result = session.Execute("START TRANSACTION WITH CONSISTENT SNAPSHOT");
  if (!result) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLTransactionFailed,
                                    "Failed to start consistent snapshot: " + result.error().message()));
  }
  spdlog::debug("Consistent snapshot started");
  return std::unique_ptr<Transaction>(new Transaction(session));
}

Transaction::~Transaction() {
  if (!active_) {
    return;
  }
  auto result = Rollback();
  if (!result) {
    utils::StructuredLog()
        .Event("transaction_rollback_failed")
        .Field("error", result.error().message())
        .Error();
  }
}

Expected<void, Error> Transaction::Commit() {
  if (!active_) {
    return MakeUnexpected(MakeError(ErrorCode::kMySQLTransactionFailed, "Transaction is not active"));
  }
  auto result = session_.Execute("COMMIT");
  if (!result) {
    return MakeUnexpected(
        MakeError(ErrorCode::kMySQLTransactionFailed, "Failed to commit transaction: " + result.error().message()));
  }
  active_ = false;
  return {};
}

Expected<void, Error> Transaction::Rollback() {
  if (!active_) {
    return {};
  }
  active_ = false;
  auto result = session_.Execute("ROLLBACK");
  if (!result) {
    return MakeUnexpected(
        MakeError(ErrorCode::kMySQLTransactionFailed, "Failed to roll back transaction: " + result.error().message()));
  }
  spdlog::debug("Transaction rolled back");
  return {};
}

}  // namespace sqlbackup::mysql
