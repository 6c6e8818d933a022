/**
 * @file chunk_sink.h
 * @brief Destinations for backup chunks
 *
 * Backup windows complete in any order. Every sink receives the absolute
 * offset of each chunk and is responsible for placing it.
 */

#pragma once

#include <cstdint>
#include <map>
#include <ostream>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::transfer {

using Bytes = std::vector<uint8_t>;

class ChunkSink {
 public:
  virtual ~ChunkSink() = default;

  virtual utils::Expected<void, utils::Error> WriteChunk(uint64_t offset, const Bytes& bytes) = 0;

  virtual utils::Expected<void, utils::Error> Flush() = 0;
};

/**
 * @brief Offset-addressed writes into a seekable stream
 *
 * Offsets are relative to the stream position at construction. The stream
 * must allow seeking past its current end (a file stream does).
 */
class StreamChunkSink : public ChunkSink {
 public:
  explicit StreamChunkSink(std::ostream& out);

  utils::Expected<void, utils::Error> WriteChunk(uint64_t offset, const Bytes& bytes) override;
  utils::Expected<void, utils::Error> Flush() override;

 private:
  std::ostream& out_;
  std::streamoff base_;
};

/**
 * @brief In-memory sink, grown to fit
 */
class MemoryChunkSink : public ChunkSink {
 public:
  utils::Expected<void, utils::Error> WriteChunk(uint64_t offset, const Bytes& bytes) override;
  utils::Expected<void, utils::Error> Flush() override { return {}; }

  const Bytes& Data() const { return data_; }

 private:
  Bytes data_;
};

/**
 * @brief Sequential writes for non-seekable outputs (pipes, stdout)
 *
 * Chunks that arrive ahead of the write position are held until the gap
 * before them is filled. Flush() fails if a gap remains.
 */
class AppendingChunkSink : public ChunkSink {
 public:
  explicit AppendingChunkSink(std::ostream& out) : out_(out) {}

  utils::Expected<void, utils::Error> WriteChunk(uint64_t offset, const Bytes& bytes) override;
  utils::Expected<void, utils::Error> Flush() override;

  uint64_t BytesWritten() const { return next_offset_; }
  size_t HeldChunks() const { return held_.size(); }

 private:
  utils::Expected<void, utils::Error> Append(const Bytes& bytes);

  std::ostream& out_;
  uint64_t next_offset_ = 0;
  std::map<uint64_t, Bytes> held_;
};

}  // namespace stashd::transfer
