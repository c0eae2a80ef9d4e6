/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <iostream>

#include "backup/backup_runner.h"
#include "restore/restore_engine.h"
#include "schema/ddl_emitter.h"
#include "utils/structured_log.h"
#include "version.h"

namespace sqlbackup::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(
    int argc, char* argv[]) {  // NOLINT(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays)
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);

  if (args.show_help) {
    CommandLineParser::PrintHelp(argv[0]);  // NOLINT
    auto app = std::unique_ptr<Application>(new Application(std::move(args), nullptr));
    return app;
  }

  if (args.show_version) {
    CommandLineParser::PrintVersion();
    auto app = std::unique_ptr<Application>(new Application(std::move(args), nullptr));
    return app;
  }

  auto config_mgr = ConfigurationManager::Create(args.config_file, args.schema_file);
  if (!config_mgr) {
    return MakeUnexpected(config_mgr.error());
  }
  (*config_mgr)->ApplyCommandLine(args);

  auto app = std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
  return app;
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

mysql::Connection::Config Application::BuildConnectionConfig(const config::MysqlConfig& mysql_config) {
  mysql::Connection::Config conn_config;
  conn_config.host = mysql_config.host;
  conn_config.port = static_cast<uint16_t>(mysql_config.port);
  conn_config.user = mysql_config.user;
  conn_config.password = mysql_config.password;
  conn_config.database = mysql_config.database;
  conn_config.charset = mysql_config.charset;
  conn_config.connect_timeout = static_cast<uint32_t>(mysql_config.connect_timeout_sec);
  conn_config.read_timeout = static_cast<uint32_t>(mysql_config.read_timeout_sec);
  conn_config.write_timeout = static_cast<uint32_t>(mysql_config.write_timeout_sec);
  conn_config.ssl_enable = mysql_config.ssl_enable;
  conn_config.ssl_ca = mysql_config.ssl_ca;
  conn_config.ssl_cert = mysql_config.ssl_cert;
  conn_config.ssl_key = mysql_config.ssl_key;
  conn_config.ssl_verify_server_cert = mysql_config.ssl_verify_server_cert;
  return conn_config;
}

int Application::Run() {
  int special_exit_code = HandleSpecialModes();
  if (special_exit_code >= 0) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    return Fail("logging_config_failed", logging_result.error());
  }

  spdlog::info("{} starting...", Version::FullString());

  auto signal_mgr = SignalManager::Create();
  if (!signal_mgr) {
    return Fail("signal_setup_failed", signal_mgr.error());
  }
  signal_manager_ = std::move(*signal_mgr);

  auto validated = config::ValidateMysqlConfig(config_manager_->GetConfig().mysql);
  if (!validated) {
    return Fail("config_invalid", validated.error());
  }

  const bool backup = args_.mode == OperationMode::kBackup;
  auto result = backup ? RunBackup() : RunRestore();
  if (!result) {
    if (result.error().code() == ErrorCode::kCancelled && SignalManager::ReceivedSignal() != 0) {
      utils::StructuredLog()
          .Event("operation_cancelled")
          .Field("operation", backup ? "backup" : "restore")
          .Field("signal", SignalManager::SignalName(SignalManager::ReceivedSignal()))
          .Warn();
    }
    return Fail(backup ? "backup_failed" : "restore_failed", result.error());
  }
  return 0;
}

int Application::HandleSpecialModes() {
  if (args_.show_help || args_.show_version) {
    return 0;
  }
  if (args_.config_test_mode) {
    auto validated = config::ValidateMysqlConfig(config_manager_->GetConfig().mysql);
    if (!validated) {
      return Fail("config_invalid", validated.error());
    }
    return config_manager_->PrintConfigTest();
  }
  return -1;
}

Expected<std::unique_ptr<mysql::Connection>, Error> Application::OpenConnection(const std::string& context) {
  auto connection =
      std::make_unique<mysql::Connection>(BuildConnectionConfig(config_manager_->GetConfig().mysql));
  auto connected = connection->Connect(context);
  if (!connected) {
    return MakeUnexpected(connected.error());
  }
  return connection;
}

Expected<void, Error> Application::RunBackup() {
  const config::Config& config = config_manager_->GetConfig();

  backup::BackupOptions options;
  options.database = config.mysql.database;
  options.path = args_.path;
  options.incremental = static_cast<size_t>(config.backup.incremental);
  options.overwrite = config.backup.overwrite;
  options.batch_size = static_cast<size_t>(config.backup.batch_size);
  options.add_drop_table = config.backup.add_drop_table;
  options.tool_version = Version::String();
  options.cancel_requested = [] { return SignalManager::IsShutdownRequested(); };
  if (!schema::ParseDdlSource(config.backup.ddl_source, options.ddl_source)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigInvalidValue, "Unknown backup.ddl_source: " + config.backup.ddl_source));
  }

  auto connection = OpenConnection("backup");
  if (!connection) {
    return MakeUnexpected(connection.error());
  }

  backup::BackupRunner runner(**connection, std::move(options));
  auto result = runner.Run();
  if (!result) {
    return MakeUnexpected(result.error());
  }
  std::cout << "Backup written to " << result->path << " (" << result->tables << " tables, " << result->rows
            << " rows)\n";
  return {};
}

Expected<void, Error> Application::RunRestore() {
  const config::Config& config = config_manager_->GetConfig();

  restore::RestoreOptions options;
  options.allow_truncated = config.restore.allow_truncated;
  options.cancel_requested = [] { return SignalManager::IsShutdownRequested(); };

  auto connection = OpenConnection("restore");
  if (!connection) {
    return MakeUnexpected(connection.error());
  }

  restore::RestoreEngine engine(**connection, std::move(options));
  auto stats = engine.RestoreFromFile(args_.path);
  if (!stats) {
    return MakeUnexpected(stats.error());
  }
  std::cout << "Restored " << args_.path << " (" << stats->tables << " tables, " << stats->rows_affected
            << " rows)\n";
  return {};
}

int Application::Fail(const std::string& type, const Error& error) {  // static
  utils::StructuredLog()
      .Event("application_error")
      .Field("type", type)
      .Field("error", error.to_string())
      .Error();
  std::cerr << "Error: " << error.message() << "\n";
  return 1;
}

}  // namespace sqlbackup::app
