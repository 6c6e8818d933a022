/**
 * @file stable_memory_test.cpp
 * @brief Unit tests for StableMemory and its stream adapter
 */

#include "storage/stable_memory.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace stashd::storage;
using stashd::utils::ErrorCode;

TEST(StableMemoryTest, StartsEmpty) {
  StableMemory memory(1024);
  EXPECT_EQ(memory.Size(), 0U);
  EXPECT_EQ(memory.SizeBytes(), 0U);
  EXPECT_EQ(memory.PageSize(), 1024U);
}

TEST(StableMemoryTest, GrowReturnsPreviousSize) {
  StableMemory memory(1024);
  auto first = memory.Grow(2);
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, 0U);

  auto second = memory.Grow(3);
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, 2U);
  EXPECT_EQ(memory.Size(), 5U);
  EXPECT_EQ(memory.SizeBytes(), 5U * 1024U);

  // New pages are zeroed
  auto bytes = memory.Read(0, memory.SizeBytes());
  ASSERT_TRUE(bytes);
  for (auto byte : *bytes) {
    ASSERT_EQ(byte, 0);
  }
}

TEST(StableMemoryTest, GrowBeyondLimit) {
  StableMemory memory(16, 4);
  ASSERT_TRUE(memory.Grow(3));
  auto grown = memory.Grow(2);
  ASSERT_FALSE(grown);
  EXPECT_EQ(grown.error().code(), ErrorCode::kStableMemoryGrowFailed);
  EXPECT_EQ(memory.Size(), 3U);
}

TEST(StableMemoryTest, ReadWriteBounds) {
  StableMemory memory(16);
  ASSERT_TRUE(memory.Grow(1));

  std::vector<uint8_t> data = {1, 2, 3, 4};
  ASSERT_TRUE(memory.Write(12, data));
  auto read = memory.Read(12, 4);
  ASSERT_TRUE(read);
  EXPECT_EQ(*read, data);

  auto past_end = memory.Write(13, data);
  ASSERT_FALSE(past_end);
  EXPECT_EQ(past_end.error().code(), ErrorCode::kStableMemoryOutOfBounds);

  auto read_past_end = memory.Read(10, 10);
  ASSERT_FALSE(read_past_end);
  EXPECT_EQ(read_past_end.error().code(), ErrorCode::kStableMemoryOutOfBounds);
}

TEST(StableMemoryTest, ReadZeroFilledPastEnd) {
  StableMemory memory(8);
  ASSERT_TRUE(memory.Grow(1));
  ASSERT_TRUE(memory.Write(6, std::vector<uint8_t>{0xAA, 0xBB}));

  auto bytes = memory.ReadZeroFilled(6, 6);
  std::vector<uint8_t> expected = {0xAA, 0xBB, 0, 0, 0, 0};
  EXPECT_EQ(bytes, expected);

  auto beyond = memory.ReadZeroFilled(100, 3);
  EXPECT_EQ(beyond, std::vector<uint8_t>(3, 0));
}

TEST(StableMemoryTest, EnsureCapacityRoundsToPages) {
  StableMemory memory(100);
  ASSERT_TRUE(memory.EnsureCapacity(250));
  EXPECT_EQ(memory.Size(), 3U);

  // Already large enough
  ASSERT_TRUE(memory.EnsureCapacity(300));
  EXPECT_EQ(memory.Size(), 3U);
}

TEST(StableMemoryTest, SaveAndLoadFile) {
  const std::string path = "stable_memory_test.region";
  {
    StableMemory memory(32);
    ASSERT_TRUE(memory.Grow(2));
    ASSERT_TRUE(memory.Write(40, std::vector<uint8_t>{9, 8, 7}));
    ASSERT_TRUE(memory.SaveToFile(path));
  }

  StableMemory loaded(32);
  ASSERT_TRUE(loaded.LoadFromFile(path));
  EXPECT_EQ(loaded.Size(), 2U);
  auto bytes = loaded.Read(40, 3);
  ASSERT_TRUE(bytes);
  EXPECT_EQ(*bytes, (std::vector<uint8_t>{9, 8, 7}));

  std::remove(path.c_str());
}

TEST(StableMemoryTest, LoadPadsToWholePages) {
  const std::string path = "stable_memory_short.region";
  {
    std::ofstream out(path, std::ios::binary);
    out << "abcde";
  }

  StableMemory memory(4);
  ASSERT_TRUE(memory.LoadFromFile(path));
  EXPECT_EQ(memory.Size(), 2U);
  auto bytes = memory.Read(0, 8);
  ASSERT_TRUE(bytes);
  EXPECT_EQ(*bytes, (std::vector<uint8_t>{'a', 'b', 'c', 'd', 'e', 0, 0, 0}));

  std::remove(path.c_str());
}

TEST(StableMemoryTest, LoadMissingFile) {
  StableMemory memory;
  auto loaded = memory.LoadFromFile("does_not_exist.region");
  ASSERT_FALSE(loaded);
  EXPECT_EQ(loaded.error().code(), ErrorCode::kIoError);
}

TEST(StableMemoryTest, StreamWriteGrowsRegion) {
  StableMemory memory(8);
  StableMemoryStream stream(memory);
  stream << "hello stable memory";
  stream.flush();
  ASSERT_TRUE(stream.good());

  EXPECT_EQ(memory.Size(), 3U);
  auto bytes = memory.Read(0, 19);
  ASSERT_TRUE(bytes);
  EXPECT_EQ(std::string(bytes->begin(), bytes->end()), "hello stable memory");
}

TEST(StableMemoryTest, StreamSeekAndRead) {
  StableMemory memory(16);
  ASSERT_TRUE(memory.Grow(1));
  ASSERT_TRUE(memory.Write(0, std::vector<uint8_t>{'0', '1', '2', '3', '4', '5'}));

  StableMemoryStream stream(memory, 2);
  char buf[3] = {};
  stream.read(buf, 3);
  ASSERT_EQ(stream.gcount(), 3);
  EXPECT_EQ(std::string(buf, 3), "234");
  EXPECT_EQ(static_cast<std::streamoff>(stream.tellg()), 5);

  stream.seekg(0);
  EXPECT_EQ(stream.get(), '0');

  // Reading past the end hits EOF
  stream.seekg(14);
  char tail[4] = {};
  stream.read(tail, 4);
  EXPECT_EQ(stream.gcount(), 2);
  EXPECT_TRUE(stream.eof());
}

TEST(StableMemoryTest, ConcurrentWritersDisjointRanges) {
  StableMemory memory(64);
  ASSERT_TRUE(memory.Grow(4));

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&memory, t]() {
      std::vector<uint8_t> data(64, static_cast<uint8_t>(t + 1));
      ASSERT_TRUE(memory.Write(static_cast<uint64_t>(t) * 64, data));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (int t = 0; t < 4; ++t) {
    auto bytes = memory.Read(static_cast<uint64_t>(t) * 64, 64);
    ASSERT_TRUE(bytes);
    EXPECT_EQ(*bytes, std::vector<uint8_t>(64, static_cast<uint8_t>(t + 1)));
  }
}
