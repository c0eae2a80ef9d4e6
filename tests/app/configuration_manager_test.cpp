/**
 * @file configuration_manager_test.cpp
 * @brief Unit tests for ConfigurationManager loading, overrides and logging
 */

#include "app/configuration_manager.h"

#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "utils/structured_log.h"

using namespace sqlbackup::app;
using sqlbackup::utils::ErrorCode;
using sqlbackup::utils::LogFormat;
using sqlbackup::utils::StructuredLog;
namespace fs = std::filesystem;

namespace {

/**
 * @brief Test fixture that manages spdlog state and a scratch directory
 *
 * Each test starts with a fresh stdout logger at info level and TEXT
 * structured logs.
 */
class ConfigurationManagerTestFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    spdlog::drop_all();
    auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("sqlbackup_test", console_sink);
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::info);
    StructuredLog::SetFormat(LogFormat::TEXT);

    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() / (std::string("sqlbackup_cfgmgr_") + info->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    spdlog::drop_all();
    auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("default", console_sink));
    spdlog::set_level(spdlog::level::info);
    StructuredLog::SetFormat(LogFormat::TEXT);
    fs::remove_all(dir_);
  }

  std::string WriteConfig(const std::string& name, const std::string& logging_section = "") {
    const fs::path path = dir_ / name;
    std::ofstream out(path);
    out << "mysql:\n"
           "  host: 127.0.0.1\n"
           "  user: backup\n"
           "  database: shop\n"
           "backup:\n"
           "  batch_size: 250\n"
           "  incremental: 3\n"
        << logging_section;
    return path.string();
  }

  fs::path dir_;
};

}  // namespace

TEST_F(ConfigurationManagerTestFixture, CreateLoadsConfig) {
  auto manager = ConfigurationManager::Create(WriteConfig("shop.yaml"));
  ASSERT_TRUE(manager) << manager.error().to_string();
  EXPECT_EQ((*manager)->GetConfig().mysql.database, "shop");
  EXPECT_EQ((*manager)->GetConfig().backup.batch_size, 250);
  EXPECT_EQ((*manager)->GetConfigFilePath(), (dir_ / "shop.yaml").string());
}

TEST_F(ConfigurationManagerTestFixture, CreateMissingFile) {
  auto manager = ConfigurationManager::Create((dir_ / "absent.yaml").string());
  ASSERT_FALSE(manager);
  EXPECT_EQ(manager.error().code(), ErrorCode::kConfigFileNotFound);
}

TEST_F(ConfigurationManagerTestFixture, BareNameResolvesToConfigDirectory) {
  auto manager = ConfigurationManager::Create("sqlbackup_no_such_config_name");
  ASSERT_FALSE(manager);
  EXPECT_EQ(manager.error().code(), ErrorCode::kConfigFileNotFound);
  EXPECT_NE(manager.error().message().find("config/sqlbackup_no_such_config_name.json"), std::string::npos);
}

TEST_F(ConfigurationManagerTestFixture, CommandLineOverridesFile) {
  auto manager = ConfigurationManager::Create(WriteConfig("shop.yaml"));
  ASSERT_TRUE(manager);

  CommandLineArgs args;
  args.incremental = 10;
  args.batch_size = 5000;
  args.overwrite = true;
  args.allow_truncated = true;
  (*manager)->ApplyCommandLine(args);

  const auto& config = (*manager)->GetConfig();
  EXPECT_EQ(config.backup.incremental, 10);
  EXPECT_EQ(config.backup.batch_size, 5000);
  EXPECT_TRUE(config.backup.overwrite);
  EXPECT_TRUE(config.restore.allow_truncated);
}

TEST_F(ConfigurationManagerTestFixture, AbsentOverridesKeepFileValues) {
  auto manager = ConfigurationManager::Create(WriteConfig("shop.yaml"));
  ASSERT_TRUE(manager);

  (*manager)->ApplyCommandLine(CommandLineArgs{});

  const auto& config = (*manager)->GetConfig();
  EXPECT_EQ(config.backup.incremental, 3);
  EXPECT_EQ(config.backup.batch_size, 250);
  EXPECT_FALSE(config.backup.overwrite);
}

TEST_F(ConfigurationManagerTestFixture, PrintConfigTest) {
  auto manager = ConfigurationManager::Create(WriteConfig("shop.yaml"));
  ASSERT_TRUE(manager);

  ::testing::internal::CaptureStdout();
  int exit_code = (*manager)->PrintConfigTest();
  std::string output = ::testing::internal::GetCapturedStdout();

  EXPECT_EQ(exit_code, 0);
  EXPECT_NE(output.find("Configuration file syntax is OK"), std::string::npos);
  EXPECT_NE(output.find("backup@127.0.0.1:3306/shop"), std::string::npos);
  EXPECT_NE(output.find("Batch size: 250"), std::string::npos);
}

TEST_F(ConfigurationManagerTestFixture, LoggingLevelAndFormat) {
  auto manager = ConfigurationManager::Create(WriteConfig("shop.yaml",
                                                          "logging:\n"
                                                          "  level: debug\n"
                                                          "  format: json\n"));
  ASSERT_TRUE(manager);

  ASSERT_TRUE((*manager)->ApplyLoggingConfig());
  EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
  EXPECT_EQ(StructuredLog::GetFormat(), LogFormat::JSON);
}

TEST_F(ConfigurationManagerTestFixture, LoggingToFile) {
  const fs::path log_file = dir_ / "logs" / "sqlbackup.log";
  auto manager = ConfigurationManager::Create(WriteConfig("shop.yaml", "logging:\n"
                                                                       "  level: info\n"
                                                                       "  file: " +
                                                                           log_file.string() + "\n"));
  ASSERT_TRUE(manager) << manager.error().to_string();

  ASSERT_TRUE((*manager)->ApplyLoggingConfig());
  spdlog::info("file logging test message");
  spdlog::default_logger()->flush();

  ASSERT_TRUE(fs::exists(log_file));
  std::ifstream input(log_file);
  std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  EXPECT_NE(content.find("file logging test message"), std::string::npos);
}
