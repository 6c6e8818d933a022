/**
 * @file header.h
 * @brief Fixed-layout header that prefixes every V2 snapshot
 *
 * On-disk layout (all fields little-endian u64):
 * @code
 *   [header_length][content_length][content_format][content_schema_version][pre_upgrade_instruction_count]
 * @endcode
 *
 * header_length counts the fields that follow it. Readers accept shorter
 * headers written by older builds (missing fields read as zero) and reject
 * longer ones.
 */

#pragma once

#include <cstdint>
#include <future>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "storage/data_format.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::storage {

/**
 * @brief Snapshot header
 */
struct Header {
  /// Number of u64 fields following header_length in the current build
  static constexpr uint64_t kNumFields = 4;

  uint64_t header_length = kNumFields;          ///< Fields present after header_length
  uint64_t content_length = 0;                  ///< Encoded content size in bytes
  DataFormatType content_format = DataFormatType::kUnknown;
  uint64_t content_schema_version = 0;          ///< Schema version the content was written at
  uint64_t pre_upgrade_instruction_count = 0;   ///< Instruction counter when the save finished

  /**
   * @brief Fresh header for a save with the given format and schema
   */
  static Header FromFormatAndSchema(DataFormatType format, uint64_t schema_version);

  /**
   * @brief Encode to bytes; always emits the compiled field count
   */
  std::vector<uint8_t> ToBytes() const;

  utils::Expected<void, utils::Error> WriteTo(std::ostream& out) const;

  /**
   * @brief Write on a background task; the stream must outlive the future
   */
  std::future<utils::Expected<void, utils::Error>> WriteToAsync(std::ostream& out) const;

  /**
   * @brief Decode a header from the current stream position
   */
  static utils::Expected<Header, utils::Error> FromReader(std::istream& in);

  static std::future<utils::Expected<Header, utils::Error>> FromReaderAsync(std::istream& in);

  static utils::Expected<Header, utils::Error> FromBytes(const std::vector<uint8_t>& bytes);

  /**
   * @brief Size of a header with every compiled field, including header_length
   */
  static constexpr uint64_t NumAllFieldsBytes() { return (kNumFields + 1) * sizeof(uint64_t); }

  /**
   * @brief Header (as declared by header_length) plus content
   */
  uint64_t NumContentAndHeaderBytes() const {
    return header_length * sizeof(uint64_t) + sizeof(uint64_t) + content_length;
  }

  bool operator==(const Header& other) const {
    return header_length == other.header_length && content_length == other.content_length &&
           content_format == other.content_format && content_schema_version == other.content_schema_version &&
           pre_upgrade_instruction_count == other.pre_upgrade_instruction_count;
  }
  bool operator!=(const Header& other) const { return !(*this == other); }
};

template <typename Archive>
void Serialize(Archive& ar, Header& header) {
  ar("header_length", header.header_length);
  ar("content_length", header.content_length);
  ar("content_format", header.content_format);
  ar("content_schema_version", header.content_schema_version);
  ar("pre_upgrade_instruction_count", header.pre_upgrade_instruction_count);
}

}  // namespace stashd::storage
