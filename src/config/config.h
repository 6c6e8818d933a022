/**
 * @file config.h
 * @brief Configuration structures and YAML parser for stashd
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::config {

// Default values for configuration
namespace defaults {

// Storage defaults
constexpr const char* kRegionFile = "stashd.region";
constexpr const char* kContentFormat = "bincode";
constexpr uint64_t kSchemaVersion = 1;
constexpr uint64_t kPageSizeBytes = 64 * 1024;

// Transfer defaults
constexpr uint64_t kBackupChunkSize = 1024 * 1024 * 5 / 2;  // 2.5 MiB
constexpr uint64_t kRestoreChunkSize = 2096000;             // below a 2 MiB call payload
constexpr uint64_t kMaxChunkSize = 64ULL * 1024 * 1024;  // largest window one call may move
constexpr int kMaxInFlight = 10;
constexpr int kMaxInFlightLimit = 64;

// Retry defaults
constexpr uint64_t kRetryBaseDelayMs = 2000;
constexpr uint64_t kRetryMaxDelayMs = 10000;
constexpr int kRetryMaxAttempts = 5;

// Agent / API defaults
constexpr const char* kAgentHost = "127.0.0.1";
constexpr int kHttpPort = 8420;
constexpr int kAgentTimeoutMs = 30000;
constexpr const char* kAnonymousIdentity = "anonymous";
constexpr int kHttpTimeoutSec = 30;
constexpr uint64_t kMaxPayloadBytes = 8 * 1024 * 1024;

}  // namespace defaults

/**
 * @brief Stable storage (region) configuration
 */
struct StorageConfig {
  std::string region_file = defaults::kRegionFile;        ///< Region persisted by the daemon
  std::string content_format = defaults::kContentFormat;  ///< "bincode" or "msgpack"
  uint64_t schema_version = defaults::kSchemaVersion;     ///< Schema version written on save
  uint64_t page_size_bytes = defaults::kPageSizeBytes;    ///< Stable memory page size
};

/**
 * @brief Backoff for a single chunk
 */
struct RetryConfig {
  uint64_t base_delay_ms = defaults::kRetryBaseDelayMs;
  uint64_t max_delay_ms = defaults::kRetryMaxDelayMs;
  int max_attempts = defaults::kRetryMaxAttempts;  ///< Total attempts, including the first
  bool jitter = true;
};

/**
 * @brief Chunked backup/restore configuration
 */
struct TransferConfig {
  uint64_t backup_chunk_size = defaults::kBackupChunkSize;
  uint64_t restore_chunk_size = defaults::kRestoreChunkSize;
  int max_in_flight = defaults::kMaxInFlight;  ///< Concurrent chunk calls
  RetryConfig retry;
};

/**
 * @brief Remote call collaborator
 */
struct AgentConfig {
  std::string type = "embedded";  ///< "embedded" (in-process) or "http"
  std::string host = defaults::kAgentHost;
  int port = defaults::kHttpPort;
  int timeout_ms = defaults::kAgentTimeoutMs;
  std::string identity = defaults::kAnonymousIdentity;
  std::string canister_id = "stashd";
};

/**
 * @brief API configuration
 */
struct ApiConfig {
  struct {
    bool enable = true;
    std::string bind = "127.0.0.1";
    int port = defaults::kHttpPort;
    int read_timeout_sec = defaults::kHttpTimeoutSec;
    int write_timeout_sec = defaults::kHttpTimeoutSec;
    uint64_t max_payload_bytes = defaults::kMaxPayloadBytes;
  } http;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stdout)
};

/**
 * @brief Root configuration
 */
struct Config {
  StorageConfig storage;
  TransferConfig transfer;
  AgentConfig agent;
  ApiConfig api;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML file
 *
 * The file is validated against the embedded JSON Schema, then semantically
 * via ValidateConfig().
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace stashd::config
