/**
 * @file header_test.cpp
 * @brief Unit tests for the snapshot header
 */

#include "storage/header.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace stashd::storage;
using stashd::utils::ErrorCode;

namespace {

void AppendU64(std::vector<uint8_t>& out, uint64_t value) {
  for (size_t i = 0; i < sizeof(uint64_t); ++i) {
    out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

Header SampleHeader() {
  Header header = Header::FromFormatAndSchema(DataFormatType::kBincode, 7);
  header.content_length = 1234;
  header.pre_upgrade_instruction_count = 987654321;
  return header;
}

}  // namespace

TEST(HeaderTest, FromFormatAndSchema) {
  Header header = Header::FromFormatAndSchema(DataFormatType::kMsgPack, 3);
  EXPECT_EQ(header.header_length, Header::kNumFields);
  EXPECT_EQ(header.content_length, 0U);
  EXPECT_EQ(header.content_format, DataFormatType::kMsgPack);
  EXPECT_EQ(header.content_schema_version, 3U);
  EXPECT_EQ(header.pre_upgrade_instruction_count, 0U);
}

TEST(HeaderTest, ToBytesLayout) {
  Header header = SampleHeader();
  auto bytes = header.ToBytes();
  ASSERT_EQ(bytes.size(), Header::NumAllFieldsBytes());
  EXPECT_EQ(Header::NumAllFieldsBytes(), 40U);

  std::vector<uint8_t> expected;
  AppendU64(expected, 4);
  AppendU64(expected, 1234);
  AppendU64(expected, 2);
  AppendU64(expected, 7);
  AppendU64(expected, 987654321);
  EXPECT_EQ(bytes, expected);
}

TEST(HeaderTest, RoundTripThroughStream) {
  Header header = SampleHeader();
  std::stringstream stream;
  ASSERT_TRUE(header.WriteTo(stream));

  auto decoded = Header::FromReader(stream);
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(*decoded, header);
  EXPECT_EQ(decoded->NumContentAndHeaderBytes(), 40U + 1234U);
}

TEST(HeaderTest, AsyncWriteAndRead) {
  Header header = SampleHeader();
  std::stringstream stream;
  auto written = header.WriteToAsync(stream).get();
  ASSERT_TRUE(written);

  auto decoded = Header::FromReaderAsync(stream).get();
  ASSERT_TRUE(decoded);
  EXPECT_EQ(*decoded, header);
}

TEST(HeaderTest, ShorterHeaderFromOlderWriter) {
  // Only content_length and content_format were written
  std::vector<uint8_t> bytes;
  AppendU64(bytes, 2);
  AppendU64(bytes, 55);
  AppendU64(bytes, 1);
  bytes.push_back(0xEE);  // first content byte

  std::istringstream in(std::string(bytes.begin(), bytes.end()));
  auto decoded = Header::FromReader(in);
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(decoded->header_length, 2U);
  EXPECT_EQ(decoded->content_length, 55U);
  EXPECT_EQ(decoded->content_format, DataFormatType::kMsgPack);
  EXPECT_EQ(decoded->content_schema_version, 0U);
  EXPECT_EQ(decoded->pre_upgrade_instruction_count, 0U);
  EXPECT_EQ(decoded->NumContentAndHeaderBytes(), 24U + 55U);

  // Stream is left at the start of the content
  EXPECT_EQ(in.get(), 0xEE);
}

TEST(HeaderTest, ToBytesAlwaysWritesCompiledFieldCount) {
  Header header = SampleHeader();
  header.header_length = 2;
  auto decoded = Header::FromBytes(header.ToBytes());
  ASSERT_TRUE(decoded);
  EXPECT_EQ(decoded->header_length, Header::kNumFields);
}

TEST(HeaderTest, RejectsLongerHeader) {
  std::vector<uint8_t> bytes;
  AppendU64(bytes, 5);
  for (int i = 0; i < 5; ++i) {
    AppendU64(bytes, 1);
  }
  auto decoded = Header::FromBytes(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), ErrorCode::kInvalidHeaderLength);
  EXPECT_EQ(decoded.error().message(), "Invalid header length 5 expecting 4");
}

TEST(HeaderTest, RejectsUnknownFormat) {
  Header header = SampleHeader();
  auto bytes = header.ToBytes();
  bytes[16] = 9;  // content_format
  auto decoded = Header::FromBytes(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), ErrorCode::kInvalidContentFormat);
}

TEST(HeaderTest, ZeroFilledRegionIsNotAHeader) {
  std::vector<uint8_t> zeros(64, 0);
  auto decoded = Header::FromBytes(zeros);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), ErrorCode::kInvalidContentFormat);
}

TEST(HeaderTest, TruncatedInput) {
  auto bytes = SampleHeader().ToBytes();
  bytes.resize(20);
  auto decoded = Header::FromBytes(bytes);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), ErrorCode::kIoError);

  auto empty = Header::FromBytes({});
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code(), ErrorCode::kIoError);
}
