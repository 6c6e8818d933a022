/**
 * @file chunk_sink.cpp
 * @brief Chunk sink implementations
 */

#include "transfer/chunk_sink.h"

#include <algorithm>
#include <string>

namespace stashd::transfer {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

StreamChunkSink::StreamChunkSink(std::ostream& out) : out_(out), base_(0) {
  auto pos = out_.tellp();
  if (pos != std::ostream::pos_type(-1)) {
    base_ = static_cast<std::streamoff>(pos);
  }
}

utils::Expected<void, utils::Error> StreamChunkSink::WriteChunk(uint64_t offset, const Bytes& bytes) {
  if (bytes.empty()) {
    return {};
  }
  out_.seekp(base_ + static_cast<std::streamoff>(offset));
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIoError, "Failed to write backup chunk", "offset " + std::to_string(offset)));
  }
  return {};
}

utils::Expected<void, utils::Error> StreamChunkSink::Flush() {
  out_.flush();
  if (!out_) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to flush backup output"));
  }
  return {};
}

utils::Expected<void, utils::Error> MemoryChunkSink::WriteChunk(uint64_t offset, const Bytes& bytes) {
  uint64_t end = offset + bytes.size();
  if (data_.size() < end) {
    data_.resize(end);
  }
  std::copy(bytes.begin(), bytes.end(), data_.begin() + static_cast<std::ptrdiff_t>(offset));
  return {};
}

utils::Expected<void, utils::Error> AppendingChunkSink::Append(const Bytes& bytes) {
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to write backup chunk",
                                    "offset " + std::to_string(next_offset_)));
  }
  next_offset_ += bytes.size();
  return {};
}

utils::Expected<void, utils::Error> AppendingChunkSink::WriteChunk(uint64_t offset, const Bytes& bytes) {
  if (bytes.empty()) {
    return {};
  }
  if (offset < next_offset_ || held_.count(offset) != 0) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Chunk overlaps bytes already received",
                                    "offset " + std::to_string(offset)));
  }
  if (offset > next_offset_) {
    held_.emplace(offset, bytes);
    return {};
  }

  auto appended = Append(bytes);
  if (!appended) {
    return appended;
  }
  // Release held chunks that are now contiguous
  auto it = held_.begin();
  while (it != held_.end() && it->first == next_offset_) {
    appended = Append(it->second);
    if (!appended) {
      return appended;
    }
    it = held_.erase(it);
  }
  return {};
}

utils::Expected<void, utils::Error> AppendingChunkSink::Flush() {
  if (!held_.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError,
                                    "Missing backup bytes at offset " + std::to_string(next_offset_),
                                    std::to_string(held_.size()) + " chunks held"));
  }
  out_.flush();
  if (!out_) {
    return MakeUnexpected(MakeError(ErrorCode::kIoError, "Failed to flush backup output"));
  }
  return {};
}

}  // namespace stashd::transfer
