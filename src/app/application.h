/**
 * @file application.h
 * @brief Main application class
 */

#ifndef SQLBACKUP_APP_APPLICATION_H_
#define SQLBACKUP_APP_APPLICATION_H_

#include <memory>
#include <string>

#include "app/command_line_parser.h"
#include "app/configuration_manager.h"
#include "app/signal_manager.h"
#include "mysql/connection.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Main application class
 *
 * Orchestrates one command-line invocation:
 * 1. Parse command-line arguments
 * 2. Load configuration and merge overrides
 * 3. Setup logging and signal handlers
 * 4. Connect to the configured database
 * 5. Run the backup or the restore
 *
 * Usage:
 * @code
 * auto app = Application::Create(argc, argv);
 * if (!app) {
 *   std::cerr << "Error: " << app.error().message() << "\n";
 *   return 1;
 * }
 * return (*app)->Run();
 * @endcode
 */
class Application {
 public:
  /**
   * @brief Create application from command-line arguments
   *
   * Prints help or version right away; loads the configuration otherwise.
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<std::unique_ptr<Application>, Error> Create(int argc, char* argv[]);

  ~Application() = default;

  Application(const Application&) = delete;
  Application& operator=(const Application&) = delete;
  Application(Application&&) = delete;
  Application& operator=(Application&&) = delete;

  /**
   * @brief Run the application
   * @return Exit code (0 = success, 1 = fatal error)
   */
  int Run();

  /**
   * @brief Connection settings for a configured endpoint
   */
  static mysql::Connection::Config BuildConnectionConfig(const config::MysqlConfig& mysql_config);

 private:
  Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr);

  int HandleSpecialModes();

  Expected<std::unique_ptr<mysql::Connection>, Error> OpenConnection(const std::string& context);
  Expected<void, Error> RunBackup();
  Expected<void, Error> RunRestore();

  /**
   * @brief Report a fatal error on stderr and in the log
   * @return Exit code 1
   */
  static int Fail(const std::string& type, const Error& error);

  CommandLineArgs args_;
  std::unique_ptr<ConfigurationManager> config_manager_;
  std::unique_ptr<SignalManager> signal_manager_;
};

}  // namespace sqlbackup::app

#endif  // SQLBACKUP_APP_APPLICATION_H_
