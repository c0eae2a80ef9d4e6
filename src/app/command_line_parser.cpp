/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>

#include "version.h"

namespace sqlbackup::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Check if argument matches short or long option
 */
bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return arg == short_opt || arg == long_opt;
}

Expected<size_t, Error> ParseCount(const std::string& option, const std::string& value) {
  if (value.empty() || std::isdigit(static_cast<unsigned char>(value[0])) == 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, option + " requires a non-negative integer, got '" + value + "'"));
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);  // NOLINT(readability-magic-numbers)
  if (errno != 0 || end == nullptr || *end != '\0') {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, option + " requires a non-negative integer, got '" + value + "'"));
  }
  if (parsed > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {  // NOLINT(google-runtime-int)
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    option + " must be at most " + std::to_string(std::numeric_limits<int>::max())));
  }
  return static_cast<size_t>(parsed);
}

Expected<void, Error> SetMode(CommandLineArgs& args, OperationMode mode, const std::string& arg) {
  if (args.mode != OperationMode::kNone && args.mode != mode) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "Conflicting operation " + arg + ": choose --backup or --restore"));
  }
  args.mode = mode;
  return {};
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid argument count (argc < 1)"));
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
      return args;
    }
    if (arg == "-v" || arg == "--version") {
      args.show_version = true;
      return args;
    }
  }

  if (argc < 2) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "No arguments provided. Use --help for usage."));
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    // Options taking a value
    auto next_value = [&](const char* name) -> Expected<std::string, Error> {
      if (i + 1 >= argc) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, std::string(name) + " requires an argument"));
      }
      return std::string(argv[++i]);
    };

    if (arg == "--backup") {
      if (auto set = SetMode(args, OperationMode::kBackup, arg); !set) {
        return MakeUnexpected(set.error());
      }
    } else if (arg == "--restore" || arg == "--push") {
      if (auto set = SetMode(args, OperationMode::kRestore, arg); !set) {
        return MakeUnexpected(set.error());
      }
    } else if (MatchesOption(arg, "-c", "--config")) {
      auto value = next_value("--config");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.config_file = *value;
    } else if (MatchesOption(arg, "-p", "--path")) {
      auto value = next_value("--path");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.path = *value;
    } else if (MatchesOption(arg, "-i", "--incremental")) {
      auto value = next_value("--incremental");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      auto count = ParseCount("--incremental", *value);
      if (!count) {
        return MakeUnexpected(count.error());
      }
      args.incremental = *count;
    } else if (MatchesOption(arg, "-b", "--batch-size")) {
      auto value = next_value("--batch-size");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      auto count = ParseCount("--batch-size", *value);
      if (!count) {
        return MakeUnexpected(count.error());
      }
      if (*count == 0) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--batch-size must be at least 1"));
      }
      args.batch_size = *count;
    } else if (arg == "--overwrite") {
      args.overwrite = true;
    } else if (arg == "--allow-truncated") {
      args.allow_truncated = true;
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (MatchesOption(arg, "-s", "--schema")) {
      auto value = next_value("--schema");
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.schema_file = *value;
    } else if (arg[0] == '-') {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown option: " + arg));
    } else {
      // Positional argument: config file without -c flag
      if (args.config_file.empty()) {
        args.config_file = arg;
      } else {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                        "Unexpected positional argument: " + arg + " (config file already specified)"));
      }
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  if (args.config_file.empty()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "Configuration file path required. Use --help for usage."));
  }

  if (args.config_test_mode) {
    return args;
  }

  if (args.mode == OperationMode::kNone) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "No operation given: use --backup or --restore. Use --help for usage."));
  }
  if (args.path.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--path is required"));
  }
  if (args.mode == OperationMode::kRestore) {
    if (args.incremental || args.batch_size || args.overwrite) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                      "--incremental, --batch-size and --overwrite apply to --backup only"));
    }
  } else if (args.allow_truncated) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "--allow-truncated applies to --restore only"));
  }

  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " --backup  -c <config> -p <file.sql> [OPTIONS]\n";
  std::cout << "       " << program_name << " --restore -c <config> -p <file.sql> [OPTIONS]\n";
  std::cout << "       " << program_name << " -t -c <config>\n";
  std::cout << "\n";
  std::cout << "Operations:\n";
  std::cout << "  --backup                       Dump the configured database to a SQL file\n";
  std::cout << "  --restore, --push              Replay a SQL file into the configured database\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file|name>       Configuration file (a bare name means config/<name>.json)\n";
  std::cout << "  -p, --path <file.sql>          Dump file path\n";
  std::cout << "  -i, --incremental <N>          Timestamped backup file, keep the N newest\n";
  std::cout << "  -b, --batch-size <N>           Rows per INSERT statement (default 1000)\n";
  std::cout << "      --overwrite                Replace an existing backup file\n";
  std::cout << "      --allow-truncated          Replay a dump that has no completion marker\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -s, --schema <schema.json>     Use custom JSON Schema (optional)\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Configuration file format (auto-detected):\n";
  std::cout << "  - YAML (.yaml, .yml) - validated against built-in schema\n";
  std::cout << "  - JSON (.json)       - validated against built-in schema\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace sqlbackup::app
