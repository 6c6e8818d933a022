/**
 * @file stable_memory.h
 * @brief Page-granular, grow-only byte region that snapshots live in
 */

#pragma once

#include <cstdint>
#include <iostream>
#include <shared_mutex>
#include <streambuf>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::storage {

/**
 * @brief Addressable byte region made of fixed-size pages
 *
 * Thread-safe: reads share a lock, writes and growth take it exclusively.
 * The region never shrinks.
 */
class StableMemory {
 public:
  static constexpr uint64_t kDefaultPageSize = 64 * 1024;
  static constexpr uint64_t kDefaultMaxPages = 1ULL << 20;  ///< 64 GiB with 64 KiB pages

  explicit StableMemory(uint64_t page_size = kDefaultPageSize, uint64_t max_pages = kDefaultMaxPages);

  StableMemory(const StableMemory&) = delete;
  StableMemory& operator=(const StableMemory&) = delete;

  /// Size in pages
  uint64_t Size() const;

  uint64_t SizeBytes() const;

  uint64_t PageSize() const { return page_size_; }

  /// Largest size the region may grow to
  uint64_t MaxBytes() const { return max_pages_ * page_size_; }

  /**
   * @brief Add @p pages zeroed pages
   * @return Previous size in pages
   */
  utils::Expected<uint64_t, utils::Error> Grow(uint64_t pages);

  /**
   * @brief Copy @p len bytes starting at @p offset; the range must be in bounds
   */
  utils::Expected<std::vector<uint8_t>, utils::Error> Read(uint64_t offset, uint64_t len) const;

  /**
   * @brief Like Read(), but bytes beyond the region read as zero
   */
  std::vector<uint8_t> ReadZeroFilled(uint64_t offset, uint64_t len) const;

  /**
   * @brief Overwrite bytes at @p offset; the range must be in bounds
   */
  utils::Expected<void, utils::Error> Write(uint64_t offset, const uint8_t* data, uint64_t len);

  utils::Expected<void, utils::Error> Write(uint64_t offset, const std::vector<uint8_t>& data) {
    return Write(offset, data.data(), data.size());
  }

  /**
   * @brief Grow so that [0, end) is addressable
   */
  utils::Expected<void, utils::Error> EnsureCapacity(uint64_t end);

  /**
   * @brief Replace the region with a file's contents (padded to whole pages)
   */
  utils::Expected<void, utils::Error> LoadFromFile(const std::string& path);

  /**
   * @brief Persist the whole region (tmp file + rename)
   */
  utils::Expected<void, utils::Error> SaveToFile(const std::string& path) const;

 private:
  utils::Expected<uint64_t, utils::Error> GrowLocked(uint64_t pages);

  mutable std::shared_mutex mutex_;
  std::vector<uint8_t> bytes_;
  const uint64_t page_size_;
  const uint64_t max_pages_;
};

/**
 * @brief Unbuffered streambuf over a StableMemory
 *
 * Get and put share one position, like a file. Writing past the end grows
 * the region; reading past the end hits EOF.
 */
class StableMemoryBuf : public std::streambuf {
 public:
  explicit StableMemoryBuf(StableMemory& memory, uint64_t offset = 0) : memory_(memory), pos_(offset) {}

 protected:
  int_type underflow() override;
  int_type uflow() override;
  std::streamsize xsgetn(char* data, std::streamsize count) override;
  int_type overflow(int_type chr) override;
  std::streamsize xsputn(const char* data, std::streamsize count) override;
  pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode which) override;
  pos_type seekpos(pos_type pos, std::ios_base::openmode which) override;

 private:
  StableMemory& memory_;
  uint64_t pos_;
};

/**
 * @brief std::iostream over a StableMemory region
 */
class StableMemoryStream : public std::iostream {
 public:
  explicit StableMemoryStream(StableMemory& memory, uint64_t offset = 0)
      : std::iostream(nullptr), buf_(memory, offset) {
    rdbuf(&buf_);
  }

 private:
  StableMemoryBuf buf_;
};

}  // namespace stashd::storage
