/**
 * @file backup_runner_test.cpp
 * @brief Unit tests for backup orchestration using a mock session
 */

#include "backup/backup_runner.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "dump/dump_reader.h"
#include "mysql/mock_session.h"
#include "restore/restore_engine.h"

using namespace sqlbackup::backup;
using sqlbackup::dump::DumpReader;
using sqlbackup::dump::ParsedDump;
using sqlbackup::dump::StatementKind;
using sqlbackup::mysql::FieldValue;
using sqlbackup::mysql::IRowCursor;
using sqlbackup::mysql::Row;
using sqlbackup::mysql::testing::MakeResultSet;
using sqlbackup::mysql::testing::MockSession;
using sqlbackup::mysql::testing::VectorRowCursor;
using sqlbackup::utils::Error;
using sqlbackup::utils::ErrorCode;
using sqlbackup::utils::Expected;
using sqlbackup::utils::MakeError;
using sqlbackup::utils::MakeUnexpected;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Not;
using ::testing::Return;
namespace fs = std::filesystem;

namespace {

using CursorResult = Expected<std::unique_ptr<IRowCursor>, Error>;

constexpr std::time_t kFixedTime = 1700000000;  // 2023-11-14 22:13:20 UTC

/**
 * @brief Mock session serving a "shop" database with orders -> users
 *
 * users holds 3 rows (one NULL email), orders holds 2.
 */
class BackupRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(session_, Database()).WillByDefault(Return("shop"));
    ON_CALL(session_, ServerVersion()).WillByDefault(Return("8.0.36"));
    ON_CALL(session_, Execute(_)).WillByDefault([this](const std::string& sql) -> Expected<uint64_t, Error> {
      executed_.push_back(sql);
      return uint64_t{0};
    });

    ON_CALL(session_, Query(HasSubstr("information_schema.TABLES")))
        .WillByDefault(Return(MakeResultSet({"TABLE_NAME", "ENGINE", "TABLE_COLLATION", "TABLE_COMMENT"},
                                            {{"orders", "InnoDB", "utf8mb4_bin", ""},
                                             {"users", "InnoDB", "utf8mb4_bin", ""}})));
    ON_CALL(session_, Query(HasSubstr("information_schema.COLUMNS")))
        .WillByDefault(Return(MakeResultSet(
            {"TABLE_NAME", "COLUMN_NAME", "ORDINAL_POSITION", "COLUMN_DEFAULT", "IS_NULLABLE", "COLUMN_TYPE",
             "EXTRA", "COLUMN_COMMENT", "GENERATION_EXPRESSION"},
            {
                {"orders", "id", "1", std::nullopt, "NO", "int", "", "", ""},
                {"orders", "user_id", "2", std::nullopt, "NO", "int", "", "", ""},
                {"users", "id", "1", std::nullopt, "NO", "int", "", "", ""},
                {"users", "email", "2", std::nullopt, "YES", "varchar(255)", "", "", ""},
            })));
    ON_CALL(session_, Query(HasSubstr("information_schema.STATISTICS")))
        .WillByDefault(Return(MakeResultSet({"TABLE_NAME", "INDEX_NAME", "NON_UNIQUE", "SEQ_IN_INDEX",
                                             "COLUMN_NAME", "SUB_PART", "INDEX_TYPE"},
                                            {{"orders", "PRIMARY", "0", "1", "id", std::nullopt, "BTREE"},
                                             {"users", "PRIMARY", "0", "1", "id", std::nullopt, "BTREE"}})));
    ON_CALL(session_, Query(HasSubstr("KEY_COLUMN_USAGE")))
        .WillByDefault(Return(MakeResultSet({"TABLE_NAME", "CONSTRAINT_NAME", "COLUMN_NAME",
                                             "REFERENCED_TABLE_SCHEMA", "REFERENCED_TABLE_NAME",
                                             "REFERENCED_COLUMN_NAME", "UPDATE_RULE", "DELETE_RULE"},
                                            {{"orders", "fk_user", "user_id", "shop", "users", "id", "RESTRICT",
                                              "RESTRICT"}})));
    ON_CALL(session_, Query(HasSubstr("SHOW CREATE TABLE `shop`.`orders`")))
        .WillByDefault(Return(MakeResultSet({"Table", "Create Table"}, {{"orders", kOrdersDdl}})));
    ON_CALL(session_, Query(HasSubstr("SHOW CREATE TABLE `shop`.`users`")))
        .WillByDefault(Return(MakeResultSet({"Table", "Create Table"}, {{"users", kUsersDdl}})));

    ON_CALL(session_, OpenStreamingCursor("SELECT `id`, `email` FROM `users`"))
        .WillByDefault([](const std::string&) -> CursorResult {
          std::vector<Row> rows = {
              {FieldValue::Numeric("1"), FieldValue::String("a@example.com")},
              {FieldValue::Numeric("2"), FieldValue::Null()},
              {FieldValue::Numeric("3"), FieldValue::String("O'Brien@example.com")},
          };
          return std::make_unique<VectorRowCursor>(2, std::move(rows));
        });
    ON_CALL(session_, OpenStreamingCursor("SELECT `id`, `user_id` FROM `orders`"))
        .WillByDefault([](const std::string&) -> CursorResult {
          std::vector<Row> rows = {
              {FieldValue::Numeric("10"), FieldValue::Numeric("1")},
              {FieldValue::Numeric("11"), FieldValue::Numeric("3")},
          };
          return std::make_unique<VectorRowCursor>(2, std::move(rows));
        });
  }

  BackupOptions Options() const {
    BackupOptions options;
    options.tool_version = "1.0.0";
    options.batch_size = 2;
    options.clock = [] { return std::chrono::system_clock::from_time_t(kFixedTime); };
    return options;
  }

  static constexpr const char* kUsersDdl = "CREATE TABLE `users` (\n  `id` int NOT NULL,\n  `email` varchar(255)\n)";
  static constexpr const char* kOrdersDdl = "CREATE TABLE `orders` (\n  `id` int NOT NULL,\n  `user_id` int NOT NULL\n)";

  NiceMock<MockSession> session_;
  std::vector<std::string> executed_;
};

std::string ReadFile(const fs::path& path) {
  std::ifstream input(path);
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

}  // namespace

// ===== Dump =====

TEST_F(BackupRunnerTest, DumpWritesTablesInDependencyOrder) {
  BackupRunner runner(session_, Options());
  std::ostringstream out;
  auto result = runner.Dump(out);
  ASSERT_TRUE(result) << result.error().to_string();

  EXPECT_EQ(result->tables, 2U);
  EXPECT_EQ(result->rows, 5U);
  EXPECT_FALSE(result->fk_cycle);
  EXPECT_EQ(result->bytes, out.str().size());

  const std::string text = out.str();
  EXPECT_THAT(text, HasSubstr("-- Database: shop\n"));
  EXPECT_THAT(text, HasSubstr("-- Server version: 8.0.36\n"));
  EXPECT_THAT(text, HasSubstr("-- Generated at: 2023-11-14 22:13:20 UTC\n"));
  EXPECT_LT(text.find("-- Table: users"), text.find("-- Table: orders"));
  EXPECT_THAT(text, HasSubstr("-- Dump completed\n"));
}

TEST_F(BackupRunnerTest, DumpPinsSessionAndUsesSnapshot) {
  BackupRunner runner(session_, Options());
  std::ostringstream out;
  ASSERT_TRUE(runner.Dump(out));

  ASSERT_EQ(executed_.size(), 5U);
  EXPECT_EQ(executed_[0], "SET NAMES utf8mb4");
  EXPECT_EQ(executed_[1], "SET time_zone = '+00:00'");
  EXPECT_EQ(executed_[2], "SET SESSION TRANSACTION ISOLATION LEVEL REPEATABLE READ");
  EXPECT_EQ(executed_[3], "START TRANSACTION WITH CONSISTENT SNAPSHOT");
  EXPECT_EQ(executed_[4], "COMMIT");
}

TEST_F(BackupRunnerTest, SessionCharsetMatchesDumpHeader) {
  BackupRunner runner(session_, Options());
  std::ostringstream out;
  ASSERT_TRUE(runner.Dump(out));

  ASSERT_FALSE(executed_.empty());
  EXPECT_EQ(executed_[0], "SET NAMES utf8mb4");
  EXPECT_THAT(out.str(), HasSubstr("SET NAMES utf8mb4;\n"));
}

TEST_F(BackupRunnerTest, CharsetFailureAbortsBeforeOutput) {
  ON_CALL(session_, Execute("SET NAMES utf8mb4"))
      .WillByDefault(Return(MakeUnexpected(MakeError(ErrorCode::kMySQLQueryFailed, "Unknown character set"))));
  BackupRunner runner(session_, Options());
  std::ostringstream out;
  auto result = runner.Dump(out);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kMySQLQueryFailed);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(BackupRunnerTest, WithoutSingleTransaction) {
  BackupOptions options = Options();
  options.single_transaction = false;
  BackupRunner runner(session_, options);
  std::ostringstream out;
  ASSERT_TRUE(runner.Dump(out));

  ASSERT_EQ(executed_.size(), 2U);
  EXPECT_EQ(executed_[0], "SET NAMES utf8mb4");
  EXPECT_EQ(executed_[1], "SET time_zone = '+00:00'");
}

TEST_F(BackupRunnerTest, DumpParsesBackIntoSections) {
  BackupRunner runner(session_, Options());
  std::ostringstream out;
  ASSERT_TRUE(runner.Dump(out));

  std::istringstream input(out.str());
  auto parsed = DumpReader::Parse(input);
  ASSERT_TRUE(parsed) << parsed.error().to_string();
  EXPECT_TRUE(parsed->complete);
  ASSERT_EQ(parsed->tables.size(), 2U);

  const auto& users = parsed->tables[0];
  EXPECT_EQ(users.table, "users");
  ASSERT_EQ(users.statements.size(), 4U);  // DROP, CREATE, 2 INSERT batches
  EXPECT_EQ(users.statements[0].sql, "DROP TABLE IF EXISTS `users`");
  EXPECT_EQ(users.statements[1].sql, kUsersDdl);
  EXPECT_EQ(users.statements[2].sql,
            "INSERT INTO `users` (`id`, `email`) VALUES (1,'a@example.com'),(2,NULL)");
  EXPECT_EQ(users.statements[3].sql, "INSERT INTO `users` (`id`, `email`) VALUES (3,'O\\'Brien@example.com')");
  EXPECT_EQ(users.statements[3].kind, StatementKind::kData);

  const auto& orders = parsed->tables[1];
  EXPECT_EQ(orders.table, "orders");
  ASSERT_EQ(orders.statements.size(), 3U);
  EXPECT_EQ(orders.statements[2].sql, "INSERT INTO `orders` (`id`, `user_id`) VALUES (10,1),(11,3)");
}

TEST_F(BackupRunnerTest, DumpReplaysThroughRestoreEngine) {
  BackupRunner runner(session_, Options());
  std::ostringstream out;
  ASSERT_TRUE(runner.Dump(out));

  std::istringstream input(out.str());
  auto parsed = DumpReader::Parse(input);
  ASSERT_TRUE(parsed);

  NiceMock<MockSession> target;
  std::vector<std::string> replayed;
  ON_CALL(target, Execute(_)).WillByDefault([&replayed](const std::string& sql) -> Expected<uint64_t, Error> {
    replayed.push_back(sql);
    return uint64_t{1};
  });

  sqlbackup::restore::RestoreEngine engine(target, sqlbackup::restore::RestoreOptions{});
  auto stats = engine.Restore(*parsed);
  ASSERT_TRUE(stats) << stats.error().to_string();
  EXPECT_EQ(stats->tables, 2U);
  EXPECT_NE(std::find(replayed.begin(), replayed.end(), std::string(kUsersDdl)), replayed.end());
}

TEST_F(BackupRunnerTest, CatalogDdlSource) {
  BackupOptions options = Options();
  options.ddl_source = sqlbackup::schema::DdlSource::kCatalog;
  options.add_drop_table = false;
  BackupRunner runner(session_, options);
  std::ostringstream out;
  ASSERT_TRUE(runner.Dump(out));

  const std::string text = out.str();
  EXPECT_THAT(text, Not(HasSubstr(kUsersDdl)));
  EXPECT_THAT(text, Not(HasSubstr("DROP TABLE")));
  EXPECT_THAT(text, HasSubstr("CONSTRAINT `fk_user` FOREIGN KEY (`user_id`) REFERENCES `shop`.`users` (`id`)"));
}

TEST_F(BackupRunnerTest, EmptyDatabaseStillComplete) {
  ON_CALL(session_, Query(HasSubstr("information_schema.TABLES")))
      .WillByDefault(Return(MakeResultSet({"TABLE_NAME", "ENGINE", "TABLE_COLLATION", "TABLE_COMMENT"}, {})));

  BackupRunner runner(session_, Options());
  std::ostringstream out;
  auto result = runner.Dump(out);
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(result->tables, 0U);
  EXPECT_THAT(out.str(), HasSubstr("-- Dump completed\n"));
  EXPECT_THAT(out.str(), Not(HasSubstr("-- Table:")));
}

TEST_F(BackupRunnerTest, CancelledBetweenTables) {
  BackupOptions options = Options();
  int polls = 0;
  options.cancel_requested = [&polls] { return ++polls > 1; };
  BackupRunner runner(session_, options);
  std::ostringstream out;
  auto result = runner.Dump(out);

  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kCancelled);
  EXPECT_EQ(result.error().table(), "orders");
  EXPECT_THAT(out.str(), HasSubstr("-- Table: users"));
  EXPECT_THAT(out.str(), Not(HasSubstr("-- Dump completed")));
  ASSERT_FALSE(executed_.empty());
  EXPECT_EQ(executed_.back(), "ROLLBACK");
}

TEST_F(BackupRunnerTest, StreamFailureLeavesIncompleteDump) {
  ON_CALL(session_, OpenStreamingCursor("SELECT `id`, `user_id` FROM `orders`"))
      .WillByDefault([](const std::string&) -> CursorResult {
        std::vector<Row> rows = {{FieldValue::Numeric("10"), FieldValue::Numeric("1")},
                                 {FieldValue::Numeric("11"), FieldValue::Numeric("3")},
                                 {FieldValue::Numeric("12"), FieldValue::Numeric("2")}};
        return std::make_unique<VectorRowCursor>(2, std::move(rows), 2);
      });

  BackupRunner runner(session_, Options());
  std::ostringstream out;
  auto result = runner.Dump(out);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kDumpStreamFailed);
  EXPECT_EQ(result.error().table(), "orders");
  EXPECT_EQ(result.error().rows_emitted(), 2U);

  std::istringstream input(out.str());
  auto parsed = DumpReader::Parse(input);
  ASSERT_TRUE(parsed);
  EXPECT_FALSE(parsed->complete);
}

TEST_F(BackupRunnerTest, IntrospectionFailure) {
  ON_CALL(session_, Query(HasSubstr("information_schema.TABLES")))
      .WillByDefault(Return(MakeUnexpected(MakeError(ErrorCode::kMySQLQueryFailed, "denied"))));

  BackupRunner runner(session_, Options());
  std::ostringstream out;
  auto result = runner.Dump(out);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kIntrospectionFailed);
  EXPECT_TRUE(out.str().empty());
}

// ===== Run =====

class BackupRunnerFileTest : public BackupRunnerTest {
 protected:
  void SetUp() override {
    BackupRunnerTest::SetUp();
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() / (std::string("sqlbackup_runner_") + info->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override { fs::remove_all(dir_); }

  fs::path dir_;
};

TEST_F(BackupRunnerFileTest, PlainPath) {
  BackupOptions options = Options();
  options.path = (dir_ / "shop.sql").string();
  BackupRunner runner(session_, options);

  auto result = runner.Run();
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(result->path, options.path);
  EXPECT_THAT(ReadFile(options.path), HasSubstr("-- Dump completed\n"));
}

TEST_F(BackupRunnerFileTest, ExistingFileRefused) {
  const fs::path path = dir_ / "shop.sql";
  {
    std::ofstream existing(path);
    existing << "keep me";
  }

  BackupOptions options = Options();
  options.path = path.string();
  BackupRunner runner(session_, options);

  auto result = runner.Run();
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kBackupPathExists);
  EXPECT_EQ(ReadFile(path), "keep me");
  EXPECT_TRUE(executed_.empty());
}

TEST_F(BackupRunnerFileTest, OverwriteReplacesFile) {
  const fs::path path = dir_ / "shop.sql";
  {
    std::ofstream existing(path);
    existing << "stale";
  }

  BackupOptions options = Options();
  options.path = path.string();
  options.overwrite = true;
  BackupRunner runner(session_, options);

  ASSERT_TRUE(runner.Run());
  EXPECT_THAT(ReadFile(path), HasSubstr("-- sqlbackup dump\n"));
}

TEST_F(BackupRunnerFileTest, IncrementalNamesAndPrunes) {
  for (const char* name : {"20230101_000000_shop.sql", "20230102_000000_shop.sql", "20230103_000000_shop.sql"}) {
    std::ofstream old(dir_ / name);
    old << "old";
  }

  BackupOptions options = Options();
  options.path = (dir_ / "shop.sql").string();
  options.incremental = 2;
  BackupRunner runner(session_, options);

  EXPECT_EQ(runner.ResolveOutputPath(std::chrono::system_clock::from_time_t(kFixedTime)),
            (dir_ / "20231114_221320_shop.sql").string());

  auto result = runner.Run();
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(result->path, (dir_ / "20231114_221320_shop.sql").string());
  EXPECT_EQ(result->retention.deleted.size(), 2U);
  EXPECT_EQ(result->retention.kept.size(), 2U);
  EXPECT_TRUE(result->retention.errors.empty());

  EXPECT_FALSE(fs::exists(dir_ / "20230101_000000_shop.sql"));
  EXPECT_FALSE(fs::exists(dir_ / "20230102_000000_shop.sql"));
  EXPECT_TRUE(fs::exists(dir_ / "20230103_000000_shop.sql"));
  EXPECT_TRUE(fs::exists(dir_ / "20231114_221320_shop.sql"));
  EXPECT_FALSE(fs::exists(dir_ / "shop.sql"));
}

TEST_F(BackupRunnerFileTest, RetentionDeleteFailureKeepsBackup) {
  for (const char* name : {"20230101_000000_shop.sql", "20230102_000000_shop.sql"}) {
    std::ofstream old(dir_ / name);
    old << "old";
  }

  BackupOptions options = Options();
  options.path = (dir_ / "shop.sql").string();
  options.incremental = 1;
  options.remove_backup = [](const std::string&, std::error_code& error_code) {
    error_code = std::make_error_code(std::errc::operation_not_permitted);
    return false;
  };
  BackupRunner runner(session_, options);

  auto result = runner.Run();
  ASSERT_TRUE(result) << result.error().to_string();
  EXPECT_EQ(result->path, (dir_ / "20231114_221320_shop.sql").string());
  EXPECT_TRUE(result->retention.deleted.empty());
  ASSERT_EQ(result->retention.errors.size(), 2U);
  for (const auto& error : result->retention.errors) {
    EXPECT_EQ(error.code(), ErrorCode::kRetentionDeleteFailed);
  }
  EXPECT_TRUE(fs::exists(dir_ / "20230101_000000_shop.sql"));
  EXPECT_THAT(ReadFile(dir_ / "20231114_221320_shop.sql"), HasSubstr("-- Dump completed\n"));
}

TEST_F(BackupRunnerFileTest, FailedDumpSkipsPruning) {
  {
    std::ofstream old(dir_ / "20230101_000000_shop.sql");
    old << "old";
  }
  ON_CALL(session_, Query(HasSubstr("information_schema.TABLES")))
      .WillByDefault(Return(MakeUnexpected(MakeError(ErrorCode::kMySQLQueryFailed, "denied"))));

  BackupOptions options = Options();
  options.path = (dir_ / "shop.sql").string();
  options.incremental = 1;
  BackupRunner runner(session_, options);

  ASSERT_FALSE(runner.Run());
  EXPECT_TRUE(fs::exists(dir_ / "20230101_000000_shop.sql"));
}
