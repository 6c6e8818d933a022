/**
 * @file file_util_test.cpp
 * @brief Unit tests for snapshot file helpers
 */

#include "storage/file_util.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include "system/system_interface.h"

using namespace stashd::storage;
using stashd::system::FixedSystem;
using stashd::utils::ErrorCode;

namespace file_fixture {

struct Settings {
  std::map<std::string, std::string> values;
  uint32_t revision = 0;
};

template <typename Archive>
void Serialize(Archive& ar, Settings& settings) {
  ar("values", settings.values);
  ar("revision", settings.revision);
}

}  // namespace file_fixture

using file_fixture::Settings;

class FileUtilTest : public ::testing::Test {
 protected:
  void SetUp() override {
    settings_.values = {{"theme", "dark"}, {"lang", "en"}};
    settings_.revision = 12;
  }

  void TearDown() override {
    std::remove(path_.c_str());
    std::remove((path_ + ".tmp").c_str());
  }

  FixedSystem system_{100, 200, 300};
  Settings settings_;
  std::string path_ = "file_util_test.snapshot";
};

TEST_F(FileUtilTest, SaveAndRestore) {
  Header header = Header::FromFormatAndSchema(DataFormatType::kBincode, 5);
  auto saved = SaveToFile(system_, path_, settings_, header, Transient{});
  ASSERT_TRUE(saved) << saved.error().to_string();
  EXPECT_FALSE(std::filesystem::exists(path_ + ".tmp"));
  EXPECT_EQ(std::filesystem::file_size(path_), saved->NumContentAndHeaderBytes());

  auto restored = RestoreFromFile<Settings>(system_, path_);
  ASSERT_TRUE(restored) << restored.error().to_string();
  EXPECT_EQ(restored->value.values, settings_.values);
  EXPECT_EQ(restored->value.revision, 12U);
  EXPECT_EQ(restored->header, *saved);
}

TEST_F(FileUtilTest, ReadFileHeader) {
  Header header = Header::FromFormatAndSchema(DataFormatType::kMsgPack, 9);
  auto saved = SaveToFile(system_, path_, settings_, header, Transient{});
  ASSERT_TRUE(saved);

  auto read = ReadFileHeader(path_);
  ASSERT_TRUE(read) << read.error().to_string();
  EXPECT_EQ(*read, *saved);
  EXPECT_EQ(read->content_schema_version, 9U);
  EXPECT_EQ(read->pre_upgrade_instruction_count, 100U);
}

TEST_F(FileUtilTest, SkipNextSaveLeavesFileUntouched) {
  {
    std::ofstream out(path_);
    out << "previous";
  }
  Transient transient;
  transient.skip_next_save = true;
  Header header = Header::FromFormatAndSchema(DataFormatType::kBincode, 0);

  auto saved = SaveToFile(system_, path_, settings_, header, transient);
  ASSERT_TRUE(saved);
  EXPECT_EQ(*saved, header);

  std::ifstream in(path_);
  std::string contents;
  in >> contents;
  EXPECT_EQ(contents, "previous");
}

TEST_F(FileUtilTest, FailedSaveRemovesTempFile) {
  Header header = Header::FromFormatAndSchema(DataFormatType::kUnknown, 0);
  auto saved = SaveToFile(system_, path_, settings_, header, Transient{});
  ASSERT_FALSE(saved);
  EXPECT_EQ(saved.error().code(), ErrorCode::kInvalidContentFormat);
  EXPECT_FALSE(std::filesystem::exists(path_));
  EXPECT_FALSE(std::filesystem::exists(path_ + ".tmp"));
}

TEST_F(FileUtilTest, RestoreV1File) {
  {
    std::ofstream out(path_, std::ios::binary);
    ASSERT_TRUE(layout_v1::Save(system_, out, settings_));
  }

  auto strict = RestoreFromFile<Settings>(system_, path_);
  EXPECT_FALSE(strict);

  auto restored = RestoreFromFileV1V2<Settings>(system_, path_);
  ASSERT_TRUE(restored) << restored.error().to_string();
  EXPECT_EQ(restored->layout, LayoutVersion::kV1);
  EXPECT_EQ(restored->value.values, settings_.values);
}

TEST_F(FileUtilTest, MissingFile) {
  auto restored = RestoreFromFile<Settings>(system_, "missing.snapshot");
  ASSERT_FALSE(restored);
  EXPECT_EQ(restored.error().code(), ErrorCode::kIoError);

  auto header = ReadFileHeader("missing.snapshot");
  ASSERT_FALSE(header);
  EXPECT_EQ(header.error().code(), ErrorCode::kIoError);
}
