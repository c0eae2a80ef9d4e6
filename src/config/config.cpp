/**
 * @file config.cpp
 * @brief Configuration parser implementation with JSON Schema validation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_schema_embedded.h"  // Auto-generated embedded schema

namespace sqlbackup::config {

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;
using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

constexpr int kMaxPort = 65535;

/**
 * @brief Convert YAML node to JSON object recursively
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      // Numbers and booleans keep their JSON type; everything else is a string
      const auto scalar = node.as<std::string>();
      if (node.Tag() == "!") {  // quoted in the source document
        return scalar;
      }
      json parsed = json::parse(scalar, nullptr, false);
      if (parsed.is_discarded() || parsed.is_object() || parsed.is_array()) {
        return scalar;
      }
      return parsed;
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

/**
 * @brief Wrap a flat connection record ({"host": ..., "database": ...}) as {"mysql": {...}}
 */
json NormalizeRoot(json root) {
  if (!root.is_object() || root.contains("mysql")) {
    return root;
  }
  static const char* const kFlatKeys[] = {"host", "port", "user", "password", "database"};
  bool flat = false;
  for (const char* key : kFlatKeys) {
    if (root.contains(key)) {
      flat = true;
      break;
    }
  }
  if (!flat) {
    return root;
  }
  json wrapped = json::object();
  wrapped["mysql"] = std::move(root);
  return wrapped;
}

/**
 * @brief Parse MySQL configuration from JSON
 */
MysqlConfig ParseMysqlConfig(const json& json_obj) {
  MysqlConfig config;

  if (json_obj.contains("host")) {
    config.host = json_obj["host"].get<std::string>();
  }
  if (json_obj.contains("port")) {
    config.port = json_obj["port"].get<int>();
  }
  if (json_obj.contains("user")) {
    config.user = json_obj["user"].get<std::string>();
  }
  if (json_obj.contains("password")) {
    config.password = json_obj["password"].get<std::string>();
  }
  if (json_obj.contains("database")) {
    config.database = json_obj["database"].get<std::string>();
  }
  if (json_obj.contains("charset")) {
    config.charset = json_obj["charset"].get<std::string>();
  }
  if (json_obj.contains("connect_timeout_sec")) {
    config.connect_timeout_sec = json_obj["connect_timeout_sec"].get<int>();
  }
  if (json_obj.contains("read_timeout_sec")) {
    config.read_timeout_sec = json_obj["read_timeout_sec"].get<int>();
  }
  if (json_obj.contains("write_timeout_sec")) {
    config.write_timeout_sec = json_obj["write_timeout_sec"].get<int>();
  }
  if (json_obj.contains("ssl_enable")) {
    config.ssl_enable = json_obj["ssl_enable"].get<bool>();
  }
  if (json_obj.contains("ssl_ca")) {
    config.ssl_ca = json_obj["ssl_ca"].get<std::string>();
  }
  if (json_obj.contains("ssl_cert")) {
    config.ssl_cert = json_obj["ssl_cert"].get<std::string>();
  }
  if (json_obj.contains("ssl_key")) {
    config.ssl_key = json_obj["ssl_key"].get<std::string>();
  }
  if (json_obj.contains("ssl_verify_server_cert")) {
    config.ssl_verify_server_cert = json_obj["ssl_verify_server_cert"].get<bool>();
  }

  return config;
}

/**
 * @brief Parse configuration from JSON object
 */
Config ParseConfigFromJson(const json& root) {
  Config config;

  if (root.contains("mysql")) {
    config.mysql = ParseMysqlConfig(root["mysql"]);
  }

  if (root.contains("backup")) {
    const auto& backup = root["backup"];
    if (backup.contains("batch_size")) {
      config.backup.batch_size = backup["batch_size"].get<int>();
    }
    if (backup.contains("ddl_source")) {
      config.backup.ddl_source = backup["ddl_source"].get<std::string>();
    }
    if (backup.contains("add_drop_table")) {
      config.backup.add_drop_table = backup["add_drop_table"].get<bool>();
    }
    if (backup.contains("overwrite")) {
      config.backup.overwrite = backup["overwrite"].get<bool>();
    }
    if (backup.contains("incremental")) {
      config.backup.incremental = backup["incremental"].get<int>();
    }
  }

  if (root.contains("restore")) {
    const auto& restore = root["restore"];
    if (restore.contains("allow_truncated")) {
      config.restore.allow_truncated = restore["allow_truncated"].get<bool>();
    }
  }

  if (root.contains("logging")) {
    const auto& logging = root["logging"];
    if (logging.contains("level")) {
      config.logging.level = logging["level"].get<std::string>();
    }
    if (logging.contains("format")) {
      config.logging.format = logging["format"].get<std::string>();
    }
    if (logging.contains("file")) {
      config.logging.file = logging["file"].get<std::string>();
    }
  }

  return config;
}

/**
 * @brief Read file contents as string
 */
Expected<std::string, Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    std::stringstream err_msg;
    err_msg << "Failed to open configuration file: " << path << "\n";
    err_msg << "  Possible reasons:\n";
    err_msg << "    - File does not exist\n";
    err_msg << "    - Insufficient read permissions\n";
    err_msg << "    - Invalid file path\n";
    err_msg << "  Example config: examples/config.yaml";
    return MakeUnexpected(MakeError(ErrorCode::kConfigFileNotFound, err_msg.str()));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string content = buffer.str();
  if (content.empty()) {
    std::stringstream err_msg;
    err_msg << "Configuration file is empty: " << path << "\n";
    err_msg << "  Please provide a valid configuration file.\n";
    err_msg << "  Example config: examples/config.yaml";
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, err_msg.str()));
  }

  return content;
}

/**
 * @brief Detect file format based on extension
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class FileFormat { kYaml, kJson, kUnknown };

FileFormat DetectFileFormat(const std::string& path) {
  const std::string ext = std::filesystem::path(path).extension().string();
  if (ext == ".json") {
    return FileFormat::kJson;
  }
  if (ext == ".yaml" || ext == ".yml") {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

/**
 * @brief Parse file content into a JSON document according to its format
 */
Expected<json, Error> ParseDocument(const std::string& path, const std::string& content, FileFormat format) {
  if (format == FileFormat::kJson) {
    try {
      return json::parse(content);
    } catch (const json::parse_error& e) {
      std::stringstream err_msg;
      err_msg << "JSON parse error in configuration file: " << path << "\n";
      err_msg << "  Error details: " << e.what() << "\n";
      if (e.byte != 0) {
        err_msg << "  Error position: byte " << e.byte << "\n";
      }
      err_msg << "  Common issues:\n";
      err_msg << "    - Missing or extra commas\n";
      err_msg << "    - Unquoted string values\n";
      err_msg << "    - Mismatched brackets or braces";
      return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, err_msg.str()));
    }
  }

  try {
    return YamlToJson(YAML::Load(content));
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error in configuration file: " << path << "\n";
    err_msg << "  Error details: " << e.what() << "\n";
    if (e.mark.line >= 0) {
      err_msg << "  Error location: line " << (e.mark.line + 1) << ", column " << (e.mark.column + 1) << "\n";
    }
    err_msg << "  Common issues:\n";
    err_msg << "    - Incorrect indentation (use spaces, not tabs)\n";
    err_msg << "    - Missing colon after key name\n";
    err_msg << "    - Unquoted special characters in values";
    return MakeUnexpected(MakeError(ErrorCode::kConfigYamlError, err_msg.str()));
  }
}

}  // namespace

Expected<void, Error> ValidateConfigJson(const std::string& config_json_str, const std::string& schema_json_str) {
  json config_json;
  json schema_json;
  try {
    config_json = json::parse(config_json_str);
    // Use embedded schema if no custom schema provided
    schema_json = json::parse(schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str);
  } catch (const json::parse_error& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, std::string("JSON parse error: ") + e.what()));
  }

  json_validator validator;
  try {
    validator.set_root_schema(schema_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, std::string("Invalid JSON Schema: ") + e.what()));
  }

  try {
    validator.validate(config_json);
  } catch (const std::exception& e) {
    std::stringstream err_msg;
    err_msg << "Configuration validation failed:\n";
    err_msg << "  " << e.what() << "\n\n";
    err_msg << "  Common configuration issues:\n";
    err_msg << "    - Missing required fields (mysql.user, mysql.database)\n";
    err_msg << "    - Invalid data types (string instead of number, etc.)\n";
    err_msg << "    - Invalid enum values (backup.ddl_source, logging.format)\n";
    err_msg << "    - Unknown keys (typos in section or field names)";
    return MakeUnexpected(MakeError(ErrorCode::kConfigValidationError, err_msg.str()));
  }

  spdlog::debug("Configuration validation passed");
  return {};
}

Expected<Config, Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  auto content = ReadFileToString(path);
  if (!content) {
    return MakeUnexpected(content.error());
  }

  FileFormat format = DetectFileFormat(path);
  if (format == FileFormat::kUnknown) {
    // YAML is a superset of JSON, so it reads either
    spdlog::debug("Unknown file format, parsing as YAML: {}", path);
    format = FileFormat::kYaml;
  }

  auto document = ParseDocument(path, *content, format);
  if (!document) {
    return MakeUnexpected(document.error());
  }
  json root = NormalizeRoot(std::move(*document));

  std::string schema_str;
  if (!schema_path.empty()) {
    auto schema_content = ReadFileToString(schema_path);
    if (!schema_content) {
      return MakeUnexpected(schema_content.error());
    }
    schema_str = std::move(*schema_content);
  }
  auto valid = ValidateConfigJson(root.dump(), schema_str);
  if (!valid) {
    return MakeUnexpected(valid.error());
  }

  Config config;
  try {
    config = ParseConfigFromJson(root);
  } catch (const json::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigInvalidValue, std::string("Invalid configuration value: ") + e.what(), path));
  }

  spdlog::info("Configuration loaded successfully from {}", path);
  spdlog::info("  MySQL: {}:{}@{}:{}/{}", config.mysql.user, std::string(config.mysql.password.length(), '*'),
               config.mysql.host, config.mysql.port, config.mysql.database);

  return config;
}

Expected<void, Error> ValidateMysqlConfig(const MysqlConfig& config) {
  if (config.host.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigMissingRequired, "mysql.host is required"));
  }
  if (config.user.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigMissingRequired, "mysql.user is required"));
  }
  if (config.database.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigMissingRequired, "mysql.database is required"));
  }
  if (config.port <= 0 || config.port > kMaxPort) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue,
                                    "mysql.port must be between 1 and 65535 (got " + std::to_string(config.port) + ")"));
  }
  return {};
}

std::string ResolveConfigPath(const std::string& name) {
  std::filesystem::path path(name);
  if (path.has_parent_path() || path.has_extension()) {
    return name;
  }
  return (std::filesystem::path(defaults::kConfigDir) / (name + ".json")).string();
}

}  // namespace sqlbackup::config
