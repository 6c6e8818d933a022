/**
 * @file call_codec_test.cpp
 * @brief Unit tests for remote call argument encoding
 */

#include "service/call_codec.h"

#include <gtest/gtest.h>

#include <string>
#include <tuple>
#include <vector>

using namespace stashd::service;
using stashd::utils::ErrorCode;

TEST(CallCodecTest, EmptyArgumentList) {
  auto encoded = EncodeArgs();
  ASSERT_TRUE(encoded);
  EXPECT_TRUE(encoded->empty());

  auto decoded = DecodeArgs<>(*encoded);
  EXPECT_TRUE(decoded);
}

TEST(CallCodecTest, OffsetAndLength) {
  auto encoded = EncodeArgs(uint64_t{1024}, uint64_t{2621440});
  ASSERT_TRUE(encoded);
  EXPECT_EQ(encoded->size(), 16U);

  auto decoded = DecodeArgs<uint64_t, uint64_t>(*encoded);
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(std::get<0>(*decoded), 1024U);
  EXPECT_EQ(std::get<1>(*decoded), 2621440U);
}

TEST(CallCodecTest, OffsetAndBytes) {
  Bytes payload = {1, 2, 3, 250};
  auto encoded = EncodeArgs(uint64_t{40}, payload);
  ASSERT_TRUE(encoded);

  auto decoded = DecodeArgs<uint64_t, Bytes>(*encoded);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(std::get<0>(*decoded), 40U);
  EXPECT_EQ(std::get<1>(*decoded), payload);
}

TEST(CallCodecTest, NestedByteVectors) {
  std::vector<Bytes> chunks = {{1, 2}, {}, {3}};
  auto encoded = EncodeArgs(uint64_t{0}, chunks);
  ASSERT_TRUE(encoded);

  auto decoded = DecodeArgs<uint64_t, std::vector<Bytes>>(*encoded);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(std::get<1>(*decoded), chunks);
}

TEST(CallCodecTest, DecodeOne) {
  auto encoded = EncodeArgs(std::string("stashd"));
  ASSERT_TRUE(encoded);
  auto decoded = DecodeOne<std::string>(*encoded);
  ASSERT_TRUE(decoded);
  EXPECT_EQ(*decoded, "stashd");
}

TEST(CallCodecTest, TrailingBytesRejected) {
  auto encoded = EncodeArgs(uint64_t{1}, uint64_t{2});
  ASSERT_TRUE(encoded);

  auto decoded = DecodeArgs<uint64_t>(*encoded);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), ErrorCode::kCallArgumentError);
  EXPECT_EQ(decoded.error().message(), "Trailing bytes after arguments");

  auto empty_expected = DecodeArgs<>(*encoded);
  ASSERT_FALSE(empty_expected);
  EXPECT_EQ(empty_expected.error().code(), ErrorCode::kCallArgumentError);
}

TEST(CallCodecTest, ShortInputRejected) {
  auto encoded = EncodeArgs(uint64_t{1});
  ASSERT_TRUE(encoded);

  auto decoded = DecodeArgs<uint64_t, uint64_t>(*encoded);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), ErrorCode::kCallArgumentError);
}

TEST(CallCodecTest, BoolArgument) {
  auto encoded = EncodeArgs(true);
  ASSERT_TRUE(encoded);
  EXPECT_EQ(*encoded, Bytes{1});

  auto decoded = DecodeOne<bool>(*encoded);
  ASSERT_TRUE(decoded);
  EXPECT_TRUE(*decoded);
}
