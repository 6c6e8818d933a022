/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

namespace stashd::utils {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kOutOfRange:
      return "OutOfRange";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kNotImplemented:
      return "NotImplemented";
    case ErrorCode::kIoError:
      return "Io";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kInvalidContentFormat:
      return "InvalidContentFormat";
    case ErrorCode::kInvalidHeaderLength:
      return "InvalidHeaderLength";
    case ErrorCode::kMsgPackEncodeError:
      return "MsgPackEncodeError";
    case ErrorCode::kMsgPackDecodeError:
      return "MsgPackDecodeError";
    case ErrorCode::kBincodeEncodeError:
      return "BincodeEncodeError";
    case ErrorCode::kBincodeDecodeError:
      return "BincodeDecodeError";
    case ErrorCode::kStableMemoryOutOfBounds:
      return "StableMemoryOutOfBounds";
    case ErrorCode::kStableMemoryGrowFailed:
      return "StableMemoryGrowFailed";
    case ErrorCode::kDecompressionError:
      return "DecompressionError";
    case ErrorCode::kCompressionError:
      return "CompressionError";
    case ErrorCode::kMigrationError:
      return "MigrationError";
    case ErrorCode::kRemoteCallFailed:
      return "RemoteCallFailed";
    case ErrorCode::kRemoteMethodNotFound:
      return "RemoteMethodNotFound";
    case ErrorCode::kRemoteRejected:
      return "RemoteRejected";
    case ErrorCode::kCallArgumentError:
      return "CallArgumentError";
    case ErrorCode::kNetworkBindFailed:
      return "NetworkBindFailed";
    case ErrorCode::kNetworkAlreadyRunning:
      return "NetworkAlreadyRunning";
    case ErrorCode::kBackupLengthMismatch:
      return "BackupLengthMismatch";
    case ErrorCode::kStableStorageNotInitialized:
      return "CanisterStableStorageNotInitialized";
    case ErrorCode::kRetriesExhausted:
      return "RetriesExhausted";
    case ErrorCode::kTransferCancelled:
      return "TransferCancelled";
  }
  return "Unknown";
}

std::string Error::to_string() const {
  std::string result = ErrorCodeName(code_);
  if (!message_.empty()) {
    result += ": ";
    result += message_;
  }
  if (!context_.empty()) {
    result += " (";
    result += context_;
    result += ")";
  }
  return result;
}

}  // namespace stashd::utils
