/**
 * @file data_format.cpp
 * @brief Content format tag helpers
 */

#include "storage/data_format.h"

#include <algorithm>
#include <cctype>

namespace stashd::storage {

DataFormatType DataFormatTypeFromU64(uint64_t tag) {
  switch (tag) {
    case 1:
      return DataFormatType::kMsgPack;
    case 2:
      return DataFormatType::kBincode;
    default:
      return DataFormatType::kUnknown;
  }
}

const char* DataFormatTypeToString(DataFormatType format) {
  switch (format) {
    case DataFormatType::kMsgPack:
      return "MsgPack";
    case DataFormatType::kBincode:
      return "Bincode";
    case DataFormatType::kUnknown:
    default:
      return "Unknown";
  }
}

utils::Expected<DataFormatType, utils::Error> ParseDataFormatType(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  if (lower == "msgpack") {
    return DataFormatType::kMsgPack;
  }
  if (lower == "bincode") {
    return DataFormatType::kBincode;
  }
  return utils::MakeUnexpected(
      utils::MakeError(utils::ErrorCode::kInvalidContentFormat, "Unknown content format: " + name));
}

}  // namespace stashd::storage
