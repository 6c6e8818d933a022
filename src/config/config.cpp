/**
 * @file config.cpp
 * @brief Configuration parser implementation for stashd
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

namespace stashd::config {

namespace {

constexpr int kMaxPort = 65535;

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * Scalars are tried as integer, then float, then bool, then string.
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

StorageConfig ParseStorageConfig(const YAML::Node& node) {
  StorageConfig config;

  if (node["region_file"]) {
    config.region_file = node["region_file"].as<std::string>();
  }
  if (node["content_format"]) {
    config.content_format = node["content_format"].as<std::string>();
  }
  if (node["schema_version"]) {
    config.schema_version = node["schema_version"].as<uint64_t>();
  }
  if (node["page_size_bytes"]) {
    config.page_size_bytes = node["page_size_bytes"].as<uint64_t>();
  }

  return config;
}

RetryConfig ParseRetryConfig(const YAML::Node& node) {
  RetryConfig config;

  if (node["base_delay_ms"]) {
    config.base_delay_ms = node["base_delay_ms"].as<uint64_t>();
  }
  if (node["max_delay_ms"]) {
    config.max_delay_ms = node["max_delay_ms"].as<uint64_t>();
  }
  if (node["max_attempts"]) {
    config.max_attempts = node["max_attempts"].as<int>();
  }
  if (node["jitter"]) {
    config.jitter = node["jitter"].as<bool>();
  }

  return config;
}

/**
 * @brief Parse transfer configuration (including the nested retry block)
 */
TransferConfig ParseTransferConfig(const YAML::Node& node) {
  TransferConfig config;

  if (node["backup_chunk_size"]) {
    config.backup_chunk_size = node["backup_chunk_size"].as<uint64_t>();
  }
  if (node["restore_chunk_size"]) {
    config.restore_chunk_size = node["restore_chunk_size"].as<uint64_t>();
  }
  if (node["max_in_flight"]) {
    config.max_in_flight = node["max_in_flight"].as<int>();
  }
  if (node["retry"]) {
    config.retry = ParseRetryConfig(node["retry"]);
  }

  return config;
}

AgentConfig ParseAgentConfig(const YAML::Node& node) {
  AgentConfig config;

  if (node["type"]) {
    config.type = node["type"].as<std::string>();
  }
  if (node["host"]) {
    config.host = node["host"].as<std::string>();
  }
  if (node["port"]) {
    config.port = node["port"].as<int>();
  }
  if (node["timeout_ms"]) {
    config.timeout_ms = node["timeout_ms"].as<int>();
  }
  if (node["identity"]) {
    config.identity = node["identity"].as<std::string>();
  }
  if (node["canister_id"]) {
    config.canister_id = node["canister_id"].as<std::string>();
  }

  return config;
}

ApiConfig ParseApiConfig(const YAML::Node& node) {
  ApiConfig config;

  if (node["http"]) {
    const auto& http_node = node["http"];
    if (http_node["enable"]) {
      config.http.enable = http_node["enable"].as<bool>();
    }
    if (http_node["bind"]) {
      config.http.bind = http_node["bind"].as<std::string>();
    }
    if (http_node["port"]) {
      config.http.port = http_node["port"].as<int>();
    }
    if (http_node["read_timeout_sec"]) {
      config.http.read_timeout_sec = http_node["read_timeout_sec"].as<int>();
    }
    if (http_node["write_timeout_sec"]) {
      config.http.write_timeout_sec = http_node["write_timeout_sec"].as<int>();
    }
    if (http_node["max_payload_bytes"]) {
      config.http.max_payload_bytes = http_node["max_payload_bytes"].as<uint64_t>();
    }
  }

  return config;
}

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
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed:\n";
      err_msg << "  " << e.what() << "\n\n";
      err_msg << "  Common configuration issues:\n";
      err_msg << "    - Unknown keys (typos in section or field names)\n";
      err_msg << "    - Invalid data types (string instead of number, etc.)\n";
      err_msg << "    - Invalid enum values (content_format, agent.type, logging.level)\n";
      err_msg << "    - Out of range values (ports, max_in_flight)";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

utils::Expected<void, utils::Error> InvalidValue(const std::string& message) {
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue, message));
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    nlohmann::json config_json = YamlToJson(root);
    if (config_json.is_null()) {
      config_json = nlohmann::json::object();
    }

    auto validation_result = ValidateConfigSchema(config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;

    if (root["storage"]) {
      config.storage = ParseStorageConfig(root["storage"]);
    }
    if (root["transfer"]) {
      config.transfer = ParseTransferConfig(root["transfer"]);
    }
    if (root["agent"]) {
      config.agent = ParseAgentConfig(root["agent"]);
    }
    if (root["api"]) {
      config.api = ParseApiConfig(root["api"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound,
                         "Failed to open config file: " + std::string(e.what())));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Storage
  if (config.storage.content_format != "bincode" && config.storage.content_format != "msgpack") {
    return InvalidValue("storage.content_format must be one of: bincode, msgpack (got: " +
                        config.storage.content_format + ")");
  }
  if (config.storage.page_size_bytes == 0) {
    return InvalidValue("storage.page_size_bytes must be greater than 0");
  }
  if (config.storage.region_file.empty()) {
    return InvalidValue("storage.region_file must not be empty");
  }

  // Transfer
  if (config.transfer.backup_chunk_size == 0 || config.transfer.backup_chunk_size > defaults::kMaxChunkSize) {
    return InvalidValue("transfer.backup_chunk_size must be between 1 and " + std::to_string(defaults::kMaxChunkSize));
  }
  if (config.transfer.restore_chunk_size == 0 || config.transfer.restore_chunk_size > defaults::kMaxChunkSize) {
    return InvalidValue("transfer.restore_chunk_size must be between 1 and " +
                        std::to_string(defaults::kMaxChunkSize));
  }
  if (config.transfer.max_in_flight < 1 || config.transfer.max_in_flight > defaults::kMaxInFlightLimit) {
    return InvalidValue("transfer.max_in_flight must be between 1 and " + std::to_string(defaults::kMaxInFlightLimit));
  }
  if (config.transfer.retry.max_attempts < 1) {
    return InvalidValue("transfer.retry.max_attempts must be at least 1");
  }
  if (config.transfer.retry.base_delay_ms > config.transfer.retry.max_delay_ms) {
    return InvalidValue("transfer.retry.base_delay_ms must be <= max_delay_ms");
  }

  // Agent
  if (config.agent.type != "embedded" && config.agent.type != "http") {
    return InvalidValue("agent.type must be one of: embedded, http (got: " + config.agent.type + ")");
  }
  if (config.agent.port <= 0 || config.agent.port > kMaxPort) {
    return InvalidValue("agent.port must be between 1 and 65535");
  }
  if (config.agent.timeout_ms <= 0) {
    return InvalidValue("agent.timeout_ms must be greater than 0");
  }

  // API
  if (config.api.http.enable && (config.api.http.port <= 0 || config.api.http.port > kMaxPort)) {
    return InvalidValue("api.http.port must be between 1 and 65535");
  }
  if (config.api.http.read_timeout_sec <= 0 || config.api.http.write_timeout_sec <= 0) {
    return InvalidValue("api.http timeouts must be greater than 0");
  }
  if (config.api.http.max_payload_bytes == 0) {
    return InvalidValue("api.http.max_payload_bytes must be greater than 0");
  }

  // Logging
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return InvalidValue("logging.level must be one of: trace, debug, info, warn, error (got: " +
                        config.logging.level + ")");
  }

  return {};
}

}  // namespace stashd::config
