/**
 * @file header.cpp
 * @brief Snapshot header encoding/decoding
 */

#include "storage/header.h"

#include <sstream>
#include <string>

namespace stashd::storage {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

void AppendU64(std::vector<uint8_t>& out, uint64_t value) {
  for (size_t i = 0; i < sizeof(uint64_t); ++i) {
    out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

bool ReadU64(std::istream& input_stream, uint64_t& value) {
  unsigned char buf[sizeof(uint64_t)];
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(buf), sizeof(buf));
  if (static_cast<size_t>(input_stream.gcount()) != sizeof(buf)) {
    return false;
  }
  value = 0;
  for (size_t i = 0; i < sizeof(uint64_t); ++i) {
    value |= static_cast<uint64_t>(buf[i]) << (8 * i);
  }
  return true;
}

}  // namespace

Header Header::FromFormatAndSchema(DataFormatType format, uint64_t schema_version) {
  Header header;
  header.header_length = kNumFields;
  header.content_format = format;
  header.content_schema_version = schema_version;
  return header;
}

std::vector<uint8_t> Header::ToBytes() const {
  std::vector<uint8_t> out;
  out.reserve(NumAllFieldsBytes());
  AppendU64(out, kNumFields);
  AppendU64(out, content_length);
  AppendU64(out, static_cast<uint64_t>(content_format));
  AppendU64(out, content_schema_version);
  AppendU64(out, pre_upgrade_instruction_count);
  return out;
}

utils::Expected<void, utils::Error> Header::WriteTo(std::ostream& out) const {
  const auto bytes = ToBytes();
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out.good()) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to write header"));
  }
  return {};
}

std::future<utils::Expected<void, utils::Error>> Header::WriteToAsync(std::ostream& out) const {
  Header copy = *this;
  return std::async(std::launch::async, [copy, &out]() { return copy.WriteTo(out); });
}

utils::Expected<Header, utils::Error> Header::FromReader(std::istream& in) {
  uint64_t declared = 0;
  if (!ReadU64(in, declared)) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to read header length"));
  }
  if (declared > kNumFields) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidHeaderLength, "Invalid header length " +
                                                                          std::to_string(declared) + " expecting " +
                                                                          std::to_string(kNumFields)));
  }

  uint64_t fields[kNumFields] = {0, 0, 0, 0};
  for (uint64_t i = 0; i < declared; ++i) {
    if (!ReadU64(in, fields[i])) {
      return MakeUnexpected(
          MakeError(ErrorCode::kIoError, "Failed to read header field " + std::to_string(i + 1) + " of " +
                                             std::to_string(declared)));
    }
  }

  Header header;
  header.header_length = declared;
  header.content_length = fields[0];
  header.content_format = DataFormatTypeFromU64(fields[1]);
  header.content_schema_version = fields[2];
  header.pre_upgrade_instruction_count = fields[3];

  if (header.content_format == DataFormatType::kUnknown) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidContentFormat, "Invalid content format " + std::to_string(fields[1])));
  }
  return header;
}

std::future<utils::Expected<Header, utils::Error>> Header::FromReaderAsync(std::istream& in) {
  return std::async(std::launch::async, [&in]() { return FromReader(in); });
}

utils::Expected<Header, utils::Error> Header::FromBytes(const std::vector<uint8_t>& bytes) {
  std::istringstream in(std::string(bytes.begin(), bytes.end()));
  return FromReader(in);
}

}  // namespace stashd::storage
