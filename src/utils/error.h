/**
 * @file error.h
 * @brief Error codes and error type used across stashd
 *
 * Errors are grouped by subsystem. Values are stable: they appear in
 * structured logs and in HTTP error responses, so never renumber them.
 *
 * Ranges:
 *   0-99     General
 *   100-199  Configuration
 *   200-299  Storage (header, data formats, layouts, stable memory)
 *   300-399  Migration
 *   400-499  Remote calls (agent, HTTP transport)
 *   500-599  Transfer (backup/restore orchestration)
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace stashd::utils {

/**
 * @brief Error codes
 */
// NOLINTNEXTLINE(performance-enum-size) - Serialized as int in logs and HTTP responses
enum class ErrorCode : int {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotFound = 4,
  kAlreadyExists = 5,
  kTimeout = 6,
  kInternalError = 7,
  kNotImplemented = 8,
  kIoError = 9,

  // Configuration
  kConfigFileNotFound = 100,
  kConfigParseError = 101,
  kConfigYamlError = 102,
  kConfigValidationError = 103,
  kConfigInvalidValue = 104,

  // Storage
  kInvalidContentFormat = 200,
  kInvalidHeaderLength = 201,
  kMsgPackEncodeError = 202,
  kMsgPackDecodeError = 203,
  kBincodeEncodeError = 204,
  kBincodeDecodeError = 205,
  kStableMemoryOutOfBounds = 206,
  kStableMemoryGrowFailed = 207,
  kDecompressionError = 208,
  kCompressionError = 209,

  // Migration
  kMigrationError = 300,

  // Remote calls
  kRemoteCallFailed = 400,
  kRemoteMethodNotFound = 401,
  kRemoteRejected = 402,
  kCallArgumentError = 403,
  kNetworkBindFailed = 404,
  kNetworkAlreadyRunning = 405,

  // Transfer
  kBackupLengthMismatch = 500,
  kStableStorageNotInitialized = 501,
  kRetriesExhausted = 502,
  kTransferCancelled = 503,
};

/**
 * @brief Get symbolic name of an error code
 */
const char* ErrorCodeName(ErrorCode code);

/**
 * @brief Error value carried by Expected
 *
 * An error has a code, a human-readable message and an optional context
 * (file path, method name, chunk offset...). Context is kept separate from the
 * message so callers can add it without rewriting the original text.
 */
class Error {
 public:
  Error() = default;

  Error(ErrorCode code, std::string message, std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }

  /**
   * @brief Render "<CodeName>: message (context)"
   */
  [[nodiscard]] std::string to_string() const;

  bool operator==(const Error& other) const {
    return code_ == other.code_ && message_ == other.message_ && context_ == other.context_;
  }
  bool operator!=(const Error& other) const { return !(*this == other); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an error
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

/**
 * @brief Copy an error, replacing its context
 */
inline Error WithContext(const Error& error, std::string context) {
  return Error(error.code(), error.message(), std::move(context));
}

}  // namespace stashd::utils
