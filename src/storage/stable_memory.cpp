/**
 * @file stable_memory.cpp
 * @brief StableMemory region and its stream adapter
 */

#include "storage/stable_memory.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>

#include "utils/structured_log.h"

namespace stashd::storage {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

utils::Error OutOfBounds(const char* operation, uint64_t offset, uint64_t len, uint64_t size) {
  return MakeError(ErrorCode::kStableMemoryOutOfBounds,
                   std::string(operation) + " out of bounds: offset " + std::to_string(offset) + " length " +
                       std::to_string(len) + " region size " + std::to_string(size));
}

}  // namespace

StableMemory::StableMemory(uint64_t page_size, uint64_t max_pages) : page_size_(page_size), max_pages_(max_pages) {}

uint64_t StableMemory::Size() const {
  std::shared_lock lock(mutex_);
  return bytes_.size() / page_size_;
}

uint64_t StableMemory::SizeBytes() const {
  std::shared_lock lock(mutex_);
  return bytes_.size();
}

utils::Expected<uint64_t, utils::Error> StableMemory::Grow(uint64_t pages) {
  std::unique_lock lock(mutex_);
  return GrowLocked(pages);
}

utils::Expected<uint64_t, utils::Error> StableMemory::GrowLocked(uint64_t pages) {
  uint64_t old_pages = bytes_.size() / page_size_;
  if (pages == 0) {
    return old_pages;
  }
  if (pages > max_pages_ - old_pages) {
    return MakeUnexpected(MakeError(ErrorCode::kStableMemoryGrowFailed,
                                    "Cannot grow by " + std::to_string(pages) + " pages: limit is " +
                                        std::to_string(max_pages_) + " pages"));
  }
  try {
    bytes_.resize((old_pages + pages) * page_size_, 0);
  } catch (const std::bad_alloc&) {
    return MakeUnexpected(MakeError(ErrorCode::kStableMemoryGrowFailed,
                                    "Out of memory growing to " + std::to_string(old_pages + pages) + " pages"));
  }
  utils::StructuredLog()
      .Event("stable_memory_grow")
      .Field("old_pages", old_pages)
      .Field("new_pages", old_pages + pages)
      .Debug();
  return old_pages;
}

utils::Expected<void, utils::Error> StableMemory::EnsureCapacity(uint64_t end) {
  std::unique_lock lock(mutex_);
  if (end <= bytes_.size()) {
    return {};
  }
  uint64_t missing = end - bytes_.size();
  uint64_t pages = (missing + page_size_ - 1) / page_size_;
  auto grown = GrowLocked(pages);
  if (!grown) {
    return MakeUnexpected(grown.error());
  }
  return {};
}

utils::Expected<std::vector<uint8_t>, utils::Error> StableMemory::Read(uint64_t offset, uint64_t len) const {
  std::shared_lock lock(mutex_);
  if (offset > bytes_.size() || len > bytes_.size() - offset) {
    return MakeUnexpected(OutOfBounds("Read", offset, len, bytes_.size()));
  }
  auto begin = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
  return std::vector<uint8_t>(begin, begin + static_cast<std::ptrdiff_t>(len));
}

std::vector<uint8_t> StableMemory::ReadZeroFilled(uint64_t offset, uint64_t len) const {
  std::vector<uint8_t> out(len, 0);
  std::shared_lock lock(mutex_);
  if (offset < bytes_.size()) {
    uint64_t available = std::min<uint64_t>(len, bytes_.size() - offset);
    std::memcpy(out.data(), bytes_.data() + offset, available);
  }
  return out;
}

utils::Expected<void, utils::Error> StableMemory::Write(uint64_t offset, const uint8_t* data, uint64_t len) {
  std::unique_lock lock(mutex_);
  if (offset > bytes_.size() || len > bytes_.size() - offset) {
    return MakeUnexpected(OutOfBounds("Write", offset, len, bytes_.size()));
  }
  if (len > 0) {
    std::memcpy(bytes_.data() + offset, data, len);
  }
  return {};
}

utils::Expected<void, utils::Error> StableMemory::LoadFromFile(const std::string& path) {
  std::ifstream input_stream(path, std::ios::binary | std::ios::ate);
  if (!input_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to open region file for reading: " + path + " (" +
                                                             std::strerror(errno) + ")"));
  }
  auto file_size = static_cast<uint64_t>(input_stream.tellg());
  input_stream.seekg(0);

  uint64_t pages = (file_size + page_size_ - 1) / page_size_;
  if (pages > max_pages_) {
    return MakeUnexpected(MakeError(ErrorCode::kStableMemoryGrowFailed,
                                    "Region file " + path + " exceeds " + std::to_string(max_pages_) + " pages"));
  }
  std::vector<uint8_t> loaded(pages * page_size_, 0);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  input_stream.read(reinterpret_cast<char*>(loaded.data()), static_cast<std::streamsize>(file_size));
  if (static_cast<uint64_t>(input_stream.gcount()) != file_size) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Short read from region file " + path));
  }

  std::unique_lock lock(mutex_);
  bytes_ = std::move(loaded);
  utils::LogStorageInfo("region_load", "Loaded " + std::to_string(pages) + " pages from " + path);
  return {};
}

utils::Expected<void, utils::Error> StableMemory::SaveToFile(const std::string& path) const {
  std::string temp_path = path + ".tmp";
  std::ofstream output_stream(temp_path, std::ios::binary | std::ios::trunc);
  if (!output_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to open region file for writing: " + temp_path +
                                                             " (" + std::strerror(errno) + ")"));
  }

  {
    std::shared_lock lock(mutex_);
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    output_stream.write(reinterpret_cast<const char*>(bytes_.data()), static_cast<std::streamsize>(bytes_.size()));
  }
  output_stream.close();
  if (output_stream.fail()) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to write region file " + temp_path));
  }

  std::error_code rename_error;
  std::filesystem::rename(temp_path, path, rename_error);
  if (rename_error) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to rename " + temp_path + " to " + path + ": " +
                                                             rename_error.message()));
  }
  utils::LogStorageInfo("region_save", "Region written to " + path);
  return {};
}

// ============================================================================
// StableMemoryBuf
// ============================================================================

StableMemoryBuf::int_type StableMemoryBuf::underflow() {
  uint8_t byte = 0;
  auto read = memory_.Read(pos_, 1);
  if (!read) {
    return traits_type::eof();
  }
  byte = (*read)[0];
  return traits_type::to_int_type(static_cast<char>(byte));
}

StableMemoryBuf::int_type StableMemoryBuf::uflow() {
  int_type chr = underflow();
  if (!traits_type::eq_int_type(chr, traits_type::eof())) {
    ++pos_;
  }
  return chr;
}

std::streamsize StableMemoryBuf::xsgetn(char* data, std::streamsize count) {
  uint64_t size = memory_.SizeBytes();
  if (count <= 0 || pos_ >= size) {
    return 0;
  }
  uint64_t available = std::min<uint64_t>(static_cast<uint64_t>(count), size - pos_);
  auto read = memory_.Read(pos_, available);
  if (!read) {
    return 0;
  }
  std::memcpy(data, read->data(), read->size());
  pos_ += read->size();
  return static_cast<std::streamsize>(read->size());
}

StableMemoryBuf::int_type StableMemoryBuf::overflow(int_type chr) {
  if (traits_type::eq_int_type(chr, traits_type::eof())) {
    return traits_type::not_eof(chr);
  }
  char byte = traits_type::to_char_type(chr);
  if (xsputn(&byte, 1) != 1) {
    return traits_type::eof();
  }
  return chr;
}

std::streamsize StableMemoryBuf::xsputn(const char* data, std::streamsize count) {
  if (count <= 0) {
    return 0;
  }
  auto len = static_cast<uint64_t>(count);
  if (!memory_.EnsureCapacity(pos_ + len)) {
    return 0;
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  if (!memory_.Write(pos_, reinterpret_cast<const uint8_t*>(data), len)) {
    return 0;
  }
  pos_ += len;
  return count;
}

StableMemoryBuf::pos_type StableMemoryBuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                                   std::ios_base::openmode /*which*/) {
  off_type base = 0;
  if (dir == std::ios_base::cur) {
    base = static_cast<off_type>(pos_);
  } else if (dir == std::ios_base::end) {
    base = static_cast<off_type>(memory_.SizeBytes());
  }
  off_type target = base + off;
  if (target < 0) {
    return pos_type(off_type(-1));
  }
  pos_ = static_cast<uint64_t>(target);
  return pos_type(target);
}

StableMemoryBuf::pos_type StableMemoryBuf::seekpos(pos_type pos, std::ios_base::openmode which) {
  return seekoff(off_type(pos), std::ios_base::beg, which);
}

}  // namespace stashd::storage
