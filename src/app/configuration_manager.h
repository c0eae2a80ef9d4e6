/**
 * @file configuration_manager.h
 * @brief Configuration manager for loading and validating configuration files
 */

#ifndef SQLBACKUP_APP_CONFIGURATION_MANAGER_H_
#define SQLBACKUP_APP_CONFIGURATION_MANAGER_H_

#include <memory>
#include <string>

#include "app/command_line_parser.h"
#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Configuration manager
 *
 * Responsibilities:
 * - Load configuration from file (YAML/JSON)
 * - Validate against schema
 * - Merge command-line overrides
 * - Apply logging configuration
 *
 * Create() validates config before returning an instance.
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager and load configuration
   * @param config_file Path to configuration file, or a bare config name
   * @param schema_file Optional schema file path (empty = use built-in)
   * @return Expected with manager instance or error
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const std::string& config_file,
                                                                       const std::string& schema_file = "");

  ~ConfigurationManager() = default;

  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  /**
   * @brief Get current configuration (read-only)
   */
  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Override file settings with the ones given on the command line
   */
  void ApplyCommandLine(const CommandLineArgs& args);

  /**
   * @brief Test mode: Print configuration details
   * @return Exit code (0 = success)
   */
  int PrintConfigTest() const;

  /**
   * @brief Apply logging configuration
   *
   * Side effects:
   * - Sets spdlog log level
   * - Switches to a file logger when logging.file is set
   * - Sets the StructuredLog output format
   */
  Expected<void, Error> ApplyLoggingConfig();

  /**
   * @brief Resolved config file path
   */
  const std::string& GetConfigFilePath() const { return config_file_; }

 private:
  ConfigurationManager(std::string config_file, std::string schema_file, config::Config initial_config);

  std::string config_file_;
  std::string schema_file_;
  config::Config config_;
};

}  // namespace sqlbackup::app

#endif  // SQLBACKUP_APP_CONFIGURATION_MANAGER_H_
