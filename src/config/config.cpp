/**
 * @file config.cpp
 * @brief Configuration parser implementation for errdedup
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace errdedup::config {

namespace {

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * Scalars are typed by the first successful conversion: integer, double,
 * bool, then string.
 *
 * @param yaml_node YAML node to convert
 * @return nlohmann::json JSON representation
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    int64_t int_value = 0;
    if (YAML::convert<int64_t>::decode(yaml_node, int_value)) {
      return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(yaml_node, double_value)) {
      return double_value;
    }
    bool bool_value = false;
    if (YAML::convert<bool>::decode(yaml_node, bool_value)) {
      return bool_value;
    }
    return yaml_node.as<std::string>();
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object = nlohmann::json::object();
    for (const auto& pair : yaml_node) {
      std::string key = pair.first.as<std::string>();
      json_object[key] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

/**
 * @brief Parse dedup configuration
 */
DedupConfig ParseDedupConfig(const YAML::Node& node) {
  DedupConfig config;

  if (node["enabled"]) {
    config.enabled = node["enabled"].as<bool>();
  }
  if (node["ttl_ms"]) {
    config.ttl_ms = node["ttl_ms"].as<int64_t>();
  }
  if (node["max_size"]) {
    config.max_size = node["max_size"].as<int64_t>();
  }
  if (node["similarity_threshold"]) {
    config.similarity_threshold = node["similarity_threshold"].as<double>();
  }
  if (node["cleanup_interval_ms"]) {
    config.cleanup_interval_ms = node["cleanup_interval_ms"].as<int64_t>();
  }
  if (node["max_context_depth"]) {
    config.max_context_depth = node["max_context_depth"].as<int64_t>();
  }

  return config;
}

/**
 * @brief Parse logging configuration
 */
LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  if (node["level"]) {
    config.level = node["level"].as<std::string>();
  }
  if (node["json"]) {
    config.json = node["json"].as<bool>();
  }
  if (node["file"]) {
    config.file = node["file"].as<std::string>();
  }

  return config;
}

/**
 * @brief Validate configuration against JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    // Parse embedded schema
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Info();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed:\n";
      err_msg << "  " << e.what() << "\n\n";
      err_msg << "  Common configuration issues:\n";
      err_msg << "    - Unknown keys (only 'dedup' and 'logging' sections are accepted)\n";
      err_msg << "    - Invalid data types (string instead of number, etc.)\n";
      err_msg << "    - Invalid enum values (check logging.level)\n";
      err_msg << "    - Out of range values (check min/max constraints)";
      utils::StructuredLog().Event("config_validation").Field("status", "failed").Field("error", e.what()).Warn();
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

/**
 * @brief Schema check, section parse and semantic check of a loaded document
 */
utils::Expected<Config, utils::Error> ParseRoot(const YAML::Node& root) {
  // An empty document means "all defaults"
  nlohmann::json config_json = root.IsNull() ? nlohmann::json::object() : YamlToJson(root);

  auto validation_result = ValidateConfigSchema(config_json);
  if (!validation_result) {
    return utils::MakeUnexpected(validation_result.error());
  }

  Config config;

  if (root["dedup"]) {
    config.dedup = ParseDedupConfig(root["dedup"]);
  }
  if (root["logging"]) {
    config.logging = ParseLoggingConfig(root["logging"]);
  }

  auto semantic_validation = ValidateConfig(config);
  if (!semantic_validation) {
    return utils::MakeUnexpected(semantic_validation.error());
  }

  return config;
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);
    return ParseRoot(root);
  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what()),
                         path));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what()), path));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what()), path));
  }
}

utils::Expected<Config, utils::Error> LoadConfigFromString(const std::string& yaml) {
  try {
    YAML::Node root = YAML::Load(yaml);
    return ParseRoot(root);
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Validate dedup configuration
  if (config.dedup.ttl_ms <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "dedup.ttl_ms must be greater than 0"));
  }
  if (config.dedup.max_size <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "dedup.max_size must be greater than 0"));
  }
  if (config.dedup.similarity_threshold < 0.0 || config.dedup.similarity_threshold > 1.0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "dedup.similarity_threshold must be between 0.0 and 1.0"));
  }
  if (config.dedup.cleanup_interval_ms < 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "dedup.cleanup_interval_ms must be >= 0 (0 = disabled)"));
  }
  if (config.dedup.max_context_depth <= 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "dedup.max_context_depth must be greater than 0"));
  }

  // Validate logging configuration
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }

  return {};
}

}  // namespace errdedup::config
