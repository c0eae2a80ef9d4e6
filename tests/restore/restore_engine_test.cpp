/**
 * @file restore_engine_test.cpp
 * @brief Unit tests for dump replay using a mock session
 */

#include "restore/restore_engine.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "dump/dump_reader.h"
#include "mysql/mock_session.h"

using namespace sqlbackup::restore;
using sqlbackup::dump::DumpReader;
using sqlbackup::dump::ParsedDump;
using sqlbackup::mysql::testing::MockSession;
using sqlbackup::utils::Error;
using sqlbackup::utils::ErrorCode;
using sqlbackup::utils::Expected;
using sqlbackup::utils::MakeError;
using sqlbackup::utils::MakeUnexpected;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;

namespace {

const char* const kTwoTableDump =
    "-- sqlbackup dump\n"
    "SET NAMES utf8mb4;\n"
    "SET FOREIGN_KEY_CHECKS = 0;\n"
    "\n"
    "-- Table: users\n"
    "DROP TABLE IF EXISTS `users`;\n"
    "CREATE TABLE `users` (`id` int, `email` varchar(255));\n"
    "INSERT INTO `users` (`id`, `email`) VALUES (1,'a@example.com'),(2,NULL);\n"
    "INSERT INTO `users` (`id`, `email`) VALUES (3,'c@example.com');\n"
    "\n"
    "-- Table: orders\n"
    "DROP TABLE IF EXISTS `orders`;\n"
    "CREATE TABLE `orders` (`id` int, `user_id` int);\n"
    "INSERT INTO `orders` (`id`, `user_id`) VALUES (10,1);\n"
    "\n"
    "-- Dump completed\n"
    "SET FOREIGN_KEY_CHECKS = 1;\n";

ParsedDump Parse(const std::string& text) {
  std::istringstream input(text);
  auto parsed = DumpReader::Parse(input);
  EXPECT_TRUE(parsed) << parsed.error().to_string();
  return parsed ? *parsed : ParsedDump{};
}

uint64_t RowsInInsert(const std::string& sql) {
  if (sql.rfind("INSERT", 0) != 0) {
    return 0;
  }
  uint64_t rows = 1;
  for (size_t pos = sql.find("),("); pos != std::string::npos; pos = sql.find("),(", pos + 1)) {
    rows++;
  }
  return rows;
}

/**
 * @brief Records executed statements; fails the statement equal to fail_on_
 */
class RestoreEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(session_, Execute(_)).WillByDefault([this](const std::string& sql) -> Expected<uint64_t, Error> {
      executed_.push_back(sql);
      if (sql == fail_on_) {
        return MakeUnexpected(MakeError(ErrorCode::kMySQLQueryFailed, "Duplicate entry '1' for key 'PRIMARY'"));
      }
      return RowsInInsert(sql);
    });
  }

  NiceMock<MockSession> session_;
  std::vector<std::string> executed_;
  std::string fail_on_;
};

}  // namespace

TEST_F(RestoreEngineTest, ExecutesInFileOrderWithTransactions) {
  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.Restore(Parse(kTwoTableDump));
  ASSERT_TRUE(stats) << stats.error().to_string();

  EXPECT_THAT(executed_,
              ElementsAre("SET NAMES utf8mb4", "SET FOREIGN_KEY_CHECKS = 0",
                          "DROP TABLE IF EXISTS `users`", "CREATE TABLE `users` (`id` int, `email` varchar(255))",
                          "START TRANSACTION",
                          "INSERT INTO `users` (`id`, `email`) VALUES (1,'a@example.com'),(2,NULL)",
                          "INSERT INTO `users` (`id`, `email`) VALUES (3,'c@example.com')", "COMMIT",
                          "DROP TABLE IF EXISTS `orders`", "CREATE TABLE `orders` (`id` int, `user_id` int)",
                          "START TRANSACTION", "INSERT INTO `orders` (`id`, `user_id`) VALUES (10,1)", "COMMIT",
                          "SET FOREIGN_KEY_CHECKS = 1"));

  EXPECT_EQ(stats->tables, 2U);
  EXPECT_EQ(stats->rows_affected, 4U);
  EXPECT_EQ(stats->statements, 10U);
}

TEST_F(RestoreEngineTest, FailingStatementRollsBackAndStops) {
  fail_on_ = "INSERT INTO `users` (`id`, `email`) VALUES (3,'c@example.com')";

  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.Restore(Parse(kTwoTableDump));
  ASSERT_FALSE(stats);

  const Error& error = stats.error();
  EXPECT_EQ(error.code(), ErrorCode::kRestoreStatementFailed);
  EXPECT_EQ(error.table(), "users");
  EXPECT_EQ(error.statement_index(), 3U);
  EXPECT_NE(error.message().find("Duplicate entry"), std::string::npos);

  ASSERT_FALSE(executed_.empty());
  EXPECT_EQ(executed_.back(), "ROLLBACK");
  EXPECT_EQ(std::count(executed_.begin(), executed_.end(), "COMMIT"), 0);
  EXPECT_EQ(std::find(executed_.begin(), executed_.end(), "DROP TABLE IF EXISTS `orders`"), executed_.end());
}

TEST_F(RestoreEngineTest, LaterTableFailureKeepsEarlierTables) {
  fail_on_ = "INSERT INTO `orders` (`id`, `user_id`) VALUES (10,1)";

  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.Restore(Parse(kTwoTableDump));
  ASSERT_FALSE(stats);
  EXPECT_EQ(stats.error().table(), "orders");
  EXPECT_EQ(stats.error().statement_index(), 2U);
  EXPECT_EQ(std::count(executed_.begin(), executed_.end(), "COMMIT"), 1);
  EXPECT_EQ(executed_.back(), "ROLLBACK");
}

TEST_F(RestoreEngineTest, DdlFailureStopsBeforeTransaction) {
  fail_on_ = "CREATE TABLE `users` (`id` int, `email` varchar(255))";

  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.Restore(Parse(kTwoTableDump));
  ASSERT_FALSE(stats);
  EXPECT_EQ(stats.error().code(), ErrorCode::kRestoreStatementFailed);
  EXPECT_EQ(stats.error().statement_index(), 1U);
  EXPECT_EQ(std::count(executed_.begin(), executed_.end(), "START TRANSACTION"), 0);
}

TEST_F(RestoreEngineTest, PreambleFailure) {
  fail_on_ = "SET FOREIGN_KEY_CHECKS = 0";

  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.Restore(Parse(kTwoTableDump));
  ASSERT_FALSE(stats);
  EXPECT_EQ(stats.error().code(), ErrorCode::kRestoreStatementFailed);
  EXPECT_EQ(stats.error().statement_index(), 1U);
  EXPECT_EQ(executed_.size(), 2U);
}

TEST_F(RestoreEngineTest, TruncatedDumpRefused) {
  ParsedDump dump = Parse("-- Table: users\nCREATE TABLE `users` (`id` int);\nINSERT INTO `users` VALUES (1");

  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.Restore(dump);
  ASSERT_FALSE(stats);
  EXPECT_EQ(stats.error().code(), ErrorCode::kRestoreTruncatedDump);
  EXPECT_TRUE(executed_.empty());
}

TEST_F(RestoreEngineTest, TruncatedDumpAllowed) {
  ParsedDump dump = Parse("-- Table: users\nCREATE TABLE `users` (`id` int);\nINSERT INTO `users` VALUES (1");

  RestoreOptions options;
  options.allow_truncated = true;
  RestoreEngine engine(session_, options);
  auto stats = engine.Restore(dump);
  ASSERT_TRUE(stats) << stats.error().to_string();
  EXPECT_EQ(stats->tables, 1U);
  EXPECT_THAT(executed_, ElementsAre("CREATE TABLE `users` (`id` int)", "START TRANSACTION", "COMMIT"));
}

TEST_F(RestoreEngineTest, CancelledBetweenTables) {
  int polls = 0;
  RestoreOptions options;
  options.cancel_requested = [&polls] { return ++polls > 1; };

  RestoreEngine engine(session_, options);
  auto stats = engine.Restore(Parse(kTwoTableDump));
  ASSERT_FALSE(stats);
  EXPECT_EQ(stats.error().code(), ErrorCode::kCancelled);
  EXPECT_EQ(stats.error().table(), "orders");
  EXPECT_EQ(std::count(executed_.begin(), executed_.end(), "COMMIT"), 1);
}

TEST_F(RestoreEngineTest, RestoreFromFile) {
  const auto path = std::filesystem::temp_directory_path() / "sqlbackup_restore_engine_test.sql";
  {
    std::ofstream out(path);
    out << kTwoTableDump;
  }

  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.RestoreFromFile(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(stats) << stats.error().to_string();
  EXPECT_EQ(stats->tables, 2U);
}

TEST_F(RestoreEngineTest, MissingFile) {
  RestoreEngine engine(session_, RestoreOptions{});
  auto stats = engine.RestoreFromFile("/nonexistent/sqlbackup/dump.sql");
  ASSERT_FALSE(stats);
  EXPECT_EQ(stats.error().code(), ErrorCode::kRestoreFileNotFound);
  EXPECT_TRUE(executed_.empty());
}
