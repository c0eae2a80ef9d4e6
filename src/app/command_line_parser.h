/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef SQLBACKUP_APP_COMMAND_LINE_PARSER_H_
#define SQLBACKUP_APP_COMMAND_LINE_PARSER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace sqlbackup::app {

using utils::Error;
using utils::Expected;

/**
 * @brief Operation selected on the command line
 */
enum class OperationMode : uint8_t {
  kNone,
  kBackup,
  kRestore,  // --restore and its alias --push
};

/**
 * @brief Parsed command-line arguments
 */
struct CommandLineArgs {
  OperationMode mode = OperationMode::kNone;
  std::string config_file;
  std::string schema_file;  ///< Optional JSON Schema file path
  std::string path;         ///< Dump file (backup output or restore input)
  std::optional<size_t> incremental;  ///< Overrides backup.incremental
  std::optional<size_t> batch_size;   ///< Overrides backup.batch_size
  bool overwrite = false;
  bool allow_truncated = false;
  bool config_test_mode = false;
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Command-line argument parser
 *
 * Short (-p) and long (--path) options; exactly one of --backup or
 * --restore (--push) unless testing the configuration.
 */
class CommandLineParser {
 public:
  /**
   * @brief Parse command line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with parsed arguments or kInvalidArgument
   *
   * Supported options:
   * - --backup: Dump the configured database to --path
   * - --restore, --push: Replay --path into the configured database
   * - -c, --config <file>: Configuration file path or bare config name
   * - -p, --path <file>: Dump file path
   * - -i, --incremental <N>: Timestamped backup, keep the N newest
   * - -b, --batch-size <N>: Rows per INSERT statement
   * - --overwrite: Replace an existing backup file
   * - --allow-truncated: Replay a dump without completion marker
   * - -t, --config-test: Test configuration file and exit
   * - -s, --schema <file>: Use custom JSON Schema
   * - -h, --help / -v, --version
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  /**
   * @brief Print help message to stdout
   * @param program_name Program name (argv[0])
   */
  static void PrintHelp(const char* program_name);

  /**
   * @brief Print version information to stdout
   */
  static void PrintVersion();

 private:
  CommandLineParser() = default;
};

}  // namespace sqlbackup::app

#endif  // SQLBACKUP_APP_COMMAND_LINE_PARSER_H_
