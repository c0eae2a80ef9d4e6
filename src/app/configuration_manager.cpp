/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "utils/structured_log.h"

namespace sqlbackup::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const std::string& config_file,
                                                                                    const std::string& schema_file) {
  const std::string resolved = config::ResolveConfigPath(config_file);
  auto config_result = config::LoadConfig(resolved, schema_file);
  if (!config_result) {
    return MakeUnexpected(config_result.error());
  }

  auto manager =
      std::unique_ptr<ConfigurationManager>(new ConfigurationManager(resolved, schema_file, std::move(*config_result)));
  return manager;
}

ConfigurationManager::ConfigurationManager(std::string config_file, std::string schema_file,
                                           config::Config initial_config)
    : config_file_(std::move(config_file)), schema_file_(std::move(schema_file)), config_(std::move(initial_config)) {}

void ConfigurationManager::ApplyCommandLine(const CommandLineArgs& args) {
  if (args.incremental) {
    config_.backup.incremental = static_cast<int>(*args.incremental);
  }
  if (args.batch_size) {
    config_.backup.batch_size = static_cast<int>(*args.batch_size);
  }
  if (args.overwrite) {
    config_.backup.overwrite = true;
  }
  if (args.allow_truncated) {
    config_.restore.allow_truncated = true;
  }
}

int ConfigurationManager::PrintConfigTest() const {
  std::cout << "Configuration file syntax is OK\n";
  std::cout << "Configuration details:\n";
  std::cout << "  File: " << config_file_ << "\n";
  std::cout << "  MySQL: " << config_.mysql.user << "@" << config_.mysql.host << ":" << config_.mysql.port << "/"
            << config_.mysql.database << "\n";
  std::cout << "  Charset: " << config_.mysql.charset << "\n";
  std::cout << "  SSL: " << (config_.mysql.ssl_enable ? "enabled" : "disabled") << "\n";
  std::cout << "  Batch size: " << config_.backup.batch_size << "\n";
  std::cout << "  DDL source: " << config_.backup.ddl_source << "\n";
  std::cout << "  Incremental: " << config_.backup.incremental << "\n";
  std::cout << "  Logging level: " << config_.logging.level << "\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() {
  // Configure log output (file or stdout) BEFORE setting level
  if (!config_.logging.file.empty()) {
    try {
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }

      auto file_logger = spdlog::basic_logger_mt("sqlbackup", config_.logging.file);
      spdlog::set_default_logger(file_logger);
    } catch (const spdlog::spdlog_ex& ex) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIOError, "Log file initialization failed: " + std::string(ex.what())));
    } catch (const std::exception& ex) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
    }
  }

  const std::string& level = config_.logging.level;
  if (level == "trace") {
    spdlog::set_level(spdlog::level::trace);
  } else if (level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else if (level == "critical") {
    spdlog::set_level(spdlog::level::critical);
  } else if (level == "off") {
    spdlog::set_level(spdlog::level::off);
  }

  utils::StructuredLog::SetFormat(utils::StructuredLog::ParseFormat(config_.logging.format));

  if (!config_.logging.file.empty()) {
    spdlog::info("Logging to file: {}", config_.logging.file);
  }

  return {};
}

}  // namespace sqlbackup::app
