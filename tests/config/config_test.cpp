/**
 * @file config_test.cpp
 * @brief Unit tests for configuration parser
 */

#include "config/config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>

using namespace stashd::config;

namespace {

void WriteFile(const char* path, const char* content) {
  std::ofstream ofs(path);
  ofs << content;
}

}  // namespace

/**
 * @brief Test loading valid configuration file
 */
TEST(ConfigTest, LoadValidConfig) {
  auto config_result = LoadConfig("test_config.yaml");
  ASSERT_TRUE(config_result) << "Failed to load config: " << config_result.error().message();
  Config config = *config_result;

  // Storage config
  EXPECT_EQ(config.storage.region_file, "/tmp/stashd_test.region");
  EXPECT_EQ(config.storage.content_format, "msgpack");
  EXPECT_EQ(config.storage.schema_version, 3);
  EXPECT_EQ(config.storage.page_size_bytes, 4096);

  // Transfer config
  EXPECT_EQ(config.transfer.backup_chunk_size, 1048576);
  EXPECT_EQ(config.transfer.restore_chunk_size, 524288);
  EXPECT_EQ(config.transfer.max_in_flight, 4);
  EXPECT_EQ(config.transfer.retry.base_delay_ms, 100);
  EXPECT_EQ(config.transfer.retry.max_delay_ms, 1000);
  EXPECT_EQ(config.transfer.retry.max_attempts, 3);
  EXPECT_FALSE(config.transfer.retry.jitter);

  // Agent config
  EXPECT_EQ(config.agent.type, "http");
  EXPECT_EQ(config.agent.host, "10.0.0.5");
  EXPECT_EQ(config.agent.port, 9000);
  EXPECT_EQ(config.agent.timeout_ms, 5000);
  EXPECT_EQ(config.agent.identity, "operator");
  EXPECT_EQ(config.agent.canister_id, "forum");

  // API config
  EXPECT_TRUE(config.api.http.enable);
  EXPECT_EQ(config.api.http.bind, "0.0.0.0");
  EXPECT_EQ(config.api.http.port, 9090);
  EXPECT_EQ(config.api.http.read_timeout_sec, 10);
  EXPECT_EQ(config.api.http.write_timeout_sec, 15);
  EXPECT_EQ(config.api.http.max_payload_bytes, 4194304);

  // Logging config
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_FALSE(config.logging.json);
  EXPECT_EQ(config.logging.file, "/tmp/stashd_test.log");
}

TEST(ConfigTest, LoadNonExistentFile) {
  auto config_result = LoadConfig("nonexistent_config.yaml");
  EXPECT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), stashd::utils::ErrorCode::kConfigFileNotFound);
}

/**
 * @brief Test configuration validation with invalid values
 */
TEST(ConfigTest, ValidateInvalidConfig) {
  Config config;

  config.transfer.backup_chunk_size = 0;
  auto result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), stashd::utils::ErrorCode::kConfigInvalidValue);

  config.transfer.backup_chunk_size = defaults::kMaxChunkSize + 1;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), stashd::utils::ErrorCode::kConfigInvalidValue);

  config.transfer.backup_chunk_size = defaults::kBackupChunkSize;
  config.transfer.restore_chunk_size = defaults::kMaxChunkSize + 1;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);

  config.transfer.restore_chunk_size = defaults::kRestoreChunkSize;
  config.transfer.max_in_flight = 65;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), stashd::utils::ErrorCode::kConfigInvalidValue);

  config.transfer.max_in_flight = defaults::kMaxInFlight;
  config.transfer.retry.max_attempts = 0;
  result = ValidateConfig(config);
  EXPECT_FALSE(result);

  config.transfer.retry.max_attempts = defaults::kRetryMaxAttempts;
  config.transfer.retry.base_delay_ms = 20000;  // > max_delay_ms
  result = ValidateConfig(config);
  EXPECT_FALSE(result);

  config.transfer.retry.base_delay_ms = defaults::kRetryBaseDelayMs;
  config.storage.content_format = "protobuf";
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), stashd::utils::ErrorCode::kConfigInvalidValue);

  config.storage.content_format = "bincode";
  config.agent.type = "grpc";
  result = ValidateConfig(config);
  EXPECT_FALSE(result);
  EXPECT_EQ(result.error().code(), stashd::utils::ErrorCode::kConfigInvalidValue);
}

TEST(ConfigTest, ValidateValidConfig) {
  Config config;

  auto result = ValidateConfig(config);
  EXPECT_TRUE(result) << "Validation failed: " << result.error().message();
}

/**
 * @brief Test loading configuration with minimal settings
 */
TEST(ConfigTest, LoadMinimalConfig) {
  WriteFile("minimal_test_config.yaml", R"(
storage:
  content_format: msgpack

transfer:
  max_in_flight: 2
)");

  auto config_result = LoadConfig("minimal_test_config.yaml");
  ASSERT_TRUE(config_result) << "Failed to load minimal config: " << config_result.error().message();

  Config config = *config_result;
  EXPECT_EQ(config.storage.content_format, "msgpack");
  EXPECT_EQ(config.transfer.max_in_flight, 2);

  // Check defaults are used for unspecified values
  EXPECT_EQ(config.storage.region_file, defaults::kRegionFile);
  EXPECT_EQ(config.transfer.backup_chunk_size, defaults::kBackupChunkSize);
  EXPECT_EQ(config.transfer.restore_chunk_size, defaults::kRestoreChunkSize);
  EXPECT_EQ(config.transfer.retry.max_attempts, defaults::kRetryMaxAttempts);
  EXPECT_EQ(config.agent.type, "embedded");

  std::remove("minimal_test_config.yaml");
}

TEST(ConfigTest, LoadEmptyConfig) {
  WriteFile("empty_test_config.yaml", "");

  auto config_result = LoadConfig("empty_test_config.yaml");
  ASSERT_TRUE(config_result) << config_result.error().message();
  EXPECT_EQ(config_result->transfer.max_in_flight, defaults::kMaxInFlight);

  std::remove("empty_test_config.yaml");
}

/**
 * @brief Test loading configuration with invalid YAML syntax
 */
TEST(ConfigTest, LoadInvalidYAML) {
  WriteFile("invalid_test_config.yaml", R"(
transfer:
  max_in_flight: [unclosed array
  backup_chunk_size: 10
)");

  auto config_result = LoadConfig("invalid_test_config.yaml");
  EXPECT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), stashd::utils::ErrorCode::kConfigYamlError);

  std::remove("invalid_test_config.yaml");
}

TEST(ConfigTest, SchemaRejectsUnknownKey) {
  WriteFile("unknown_key_test_config.yaml", R"(
transfer:
  max_in_flight: 4
  chunk_count: 7
)");

  auto config_result = LoadConfig("unknown_key_test_config.yaml");
  EXPECT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), stashd::utils::ErrorCode::kConfigValidationError);

  std::remove("unknown_key_test_config.yaml");
}

TEST(ConfigTest, SchemaRejectsWrongType) {
  WriteFile("wrong_type_test_config.yaml", R"(
agent:
  port: not-a-port
)");

  auto config_result = LoadConfig("wrong_type_test_config.yaml");
  EXPECT_FALSE(config_result);
  EXPECT_EQ(config_result.error().code(), stashd::utils::ErrorCode::kConfigValidationError);

  std::remove("wrong_type_test_config.yaml");
}

TEST(ConfigTest, DefaultValues) {
  Config config;

  EXPECT_EQ(config.storage.content_format, "bincode");
  EXPECT_EQ(config.storage.page_size_bytes, 65536);
  EXPECT_EQ(config.transfer.backup_chunk_size, 2621440);
  EXPECT_EQ(config.transfer.restore_chunk_size, 2096000);
  EXPECT_EQ(config.transfer.max_in_flight, 10);
  EXPECT_EQ(config.transfer.retry.base_delay_ms, 2000);
  EXPECT_EQ(config.transfer.retry.max_delay_ms, 10000);
  EXPECT_EQ(config.transfer.retry.max_attempts, 5);
  EXPECT_TRUE(config.transfer.retry.jitter);
  EXPECT_EQ(config.api.http.port, defaults::kHttpPort);
  EXPECT_TRUE(config.api.http.enable);
}
