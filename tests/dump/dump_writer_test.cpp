/**
 * @file dump_writer_test.cpp
 * @brief Unit tests for dump file writing
 */

#include "dump/dump_writer.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "dump/dump_format.h"

using namespace sqlbackup::dump;
using sqlbackup::utils::ErrorCode;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

namespace {

DumpHeader TestHeader() {
  DumpHeader header;
  header.tool_version = "1.0.0";
  header.database = "shop";
  header.server_version = "8.0.36";
  header.generated_at = 1700000000;  // 2023-11-14 22:13:20 UTC
  return header;
}

}  // namespace

// ===== DumpWriter =====

TEST(DumpWriterTest, FormatUtc) {
  EXPECT_EQ(DumpWriter::FormatUtc(0), "1970-01-01 00:00:00 UTC");
  EXPECT_EQ(DumpWriter::FormatUtc(1700000000), "2023-11-14 22:13:20 UTC");
}

TEST(DumpWriterTest, HeaderAndPreamble) {
  std::ostringstream out;
  DumpWriter writer(out);
  ASSERT_TRUE(writer.WriteHeader(TestHeader()));

  const std::string text = out.str();
  EXPECT_THAT(text, StartsWith("-- sqlbackup dump\n-- Format version: 1\n"));
  EXPECT_THAT(text, HasSubstr("-- Tool version: 1.0.0\n"));
  EXPECT_THAT(text, HasSubstr("-- Database: shop\n"));
  EXPECT_THAT(text, HasSubstr("-- Server version: 8.0.36\n"));
  EXPECT_THAT(text, HasSubstr("-- Generated at: 2023-11-14 22:13:20 UTC\n"));
  EXPECT_THAT(text, HasSubstr("SET NAMES utf8mb4;\n"));
  EXPECT_THAT(text, HasSubstr("SET FOREIGN_KEY_CHECKS = 0;\n"));
  EXPECT_EQ(writer.statements_written(), dump_format::kPreamble.size());
}

TEST(DumpWriterTest, FullDumpLayout) {
  std::ostringstream out;
  DumpWriter writer(out);
  ASSERT_TRUE(writer.WriteHeader(TestHeader()));
  ASSERT_TRUE(writer.BeginTable("users", "CREATE TABLE `users` (`id` int)"));
  ASSERT_TRUE(writer.WriteStatement("INSERT INTO `users` (`id`) VALUES (1),(2)"));
  ASSERT_TRUE(writer.EndTable());
  ASSERT_TRUE(writer.WriteFooter());

  const std::string text = out.str();
  EXPECT_THAT(text, HasSubstr("\n-- Table: users\n"
                              "DROP TABLE IF EXISTS `users`;\n"
                              "CREATE TABLE `users` (`id` int);\n"
                              "INSERT INTO `users` (`id`) VALUES (1),(2);\n"));
  EXPECT_THAT(text, HasSubstr("\n-- Dump completed\nSET UNIQUE_CHECKS = 1;\nSET FOREIGN_KEY_CHECKS = 1;\n"));

  // Completion marker follows the last table section
  EXPECT_LT(text.find("-- Table: users"), text.find("-- Dump completed"));

  EXPECT_EQ(writer.statements_written(), dump_format::kPreamble.size() + 3 + dump_format::kEpilogue.size());
  EXPECT_EQ(writer.bytes_written(), text.size());
}

TEST(DumpWriterTest, WithoutDropTable) {
  std::ostringstream out;
  DumpWriter writer(out, DumpWriterOptions{false});
  ASSERT_TRUE(writer.BeginTable("users", "CREATE TABLE `users` (`id` int)"));
  EXPECT_THAT(out.str(), Not(HasSubstr("DROP TABLE")));
  EXPECT_THAT(out.str(), HasSubstr("CREATE TABLE `users` (`id` int);\n"));
}

TEST(DumpWriterTest, EmptyTableSectionHasNoInsert) {
  std::ostringstream out;
  DumpWriter writer(out);
  ASSERT_TRUE(writer.BeginTable("empty", "CREATE TABLE `empty` (`id` int)"));
  ASSERT_TRUE(writer.EndTable());
  EXPECT_THAT(out.str(), Not(HasSubstr("INSERT")));
}

TEST(DumpWriterTest, FailedStreamReportsTable) {
  std::ostringstream out;
  DumpWriter writer(out);
  ASSERT_TRUE(writer.BeginTable("users", "CREATE TABLE `users` (`id` int)"));

  out.setstate(std::ios::badbit);
  auto result = writer.WriteStatement("INSERT INTO `users` (`id`) VALUES (1)");
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kDumpWriteFailed);
  EXPECT_EQ(result.error().table(), "users");
}

// ===== DumpFile =====

class DumpFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = std::filesystem::temp_directory_path() / (std::string("sqlbackup_dumpfile_") + info->name());
    std::filesystem::remove_all(dir_);
    std::filesystem::create_directories(dir_);
  }

  void TearDown() override { std::filesystem::remove_all(dir_); }

  std::filesystem::path dir_;
};

TEST_F(DumpFileTest, CreatesFileAndParentDirectories) {
  const std::string path = (dir_ / "nested" / "deeper" / "shop.sql").string();
  auto file = DumpFile::Create(path, false);
  ASSERT_TRUE(file) << file.error().to_string();
  (*file)->stream() << "SELECT 1;\n";
  ASSERT_TRUE((*file)->Close());

  std::ifstream input(path);
  std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "SELECT 1;\n");
}

TEST_F(DumpFileTest, RefusesExistingFileWithoutOverwrite) {
  const std::string path = (dir_ / "shop.sql").string();
  {
    std::ofstream existing(path);
    existing << "old";
  }

  auto file = DumpFile::Create(path, false);
  ASSERT_FALSE(file);
  EXPECT_EQ(file.error().code(), ErrorCode::kBackupPathExists);

  std::ifstream input(path);
  std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "old");
}

TEST_F(DumpFileTest, OverwriteTruncatesExistingFile) {
  const std::string path = (dir_ / "shop.sql").string();
  {
    std::ofstream existing(path);
    existing << "old contents that are longer";
  }

  auto file = DumpFile::Create(path, true);
  ASSERT_TRUE(file) << file.error().to_string();
  (*file)->stream() << "new";
  ASSERT_TRUE((*file)->Close());

  std::ifstream input(path);
  std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "new");
}

TEST_F(DumpFileTest, CloseTwiceIsHarmless) {
  auto file = DumpFile::Create((dir_ / "shop.sql").string(), false);
  ASSERT_TRUE(file);
  EXPECT_TRUE((*file)->Close());
  EXPECT_TRUE((*file)->Close());
}
