/**
 * @file gzip.cpp
 * @brief gzip compression via zlib's deflate/inflate
 */

#include "utils/gzip.h"

#include <zlib.h>

#include <string>

namespace stashd::utils {

namespace {

// windowBits + 16 selects the gzip wrapper instead of the zlib one
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel = 8;
constexpr size_t kChunkSize = 64 * 1024;

}  // namespace

Expected<std::vector<uint8_t>, Error> GzipCompress(const std::vector<uint8_t>& data, int level) {
  if (level < Z_NO_COMPRESSION || level > Z_BEST_COMPRESSION) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid gzip level " + std::to_string(level)));
  }

  z_stream stream{};
  if (deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
    return MakeUnexpected(MakeError(ErrorCode::kCompressionError, "deflateInit2 failed"));
  }

  std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(data.size())));
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast) - zlib API is not const-correct
  stream.next_in = const_cast<Bytef*>(data.data());
  stream.avail_in = static_cast<uInt>(data.size());
  stream.next_out = out.data();
  stream.avail_out = static_cast<uInt>(out.size());

  int ret = deflate(&stream, Z_FINISH);
  if (ret != Z_STREAM_END) {
    deflateEnd(&stream);
    return MakeUnexpected(MakeError(ErrorCode::kCompressionError, "deflate failed with code " + std::to_string(ret)));
  }
  out.resize(stream.total_out);
  deflateEnd(&stream);
  return out;
}

Expected<std::vector<uint8_t>, Error> GzipDecompress(const std::vector<uint8_t>& data, size_t max_output) {
  z_stream stream{};
  if (inflateInit2(&stream, kGzipWindowBits) != Z_OK) {
    return MakeUnexpected(MakeError(ErrorCode::kDecompressionError, "inflateInit2 failed"));
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast) - zlib API is not const-correct
  stream.next_in = const_cast<Bytef*>(data.data());
  stream.avail_in = static_cast<uInt>(data.size());

  std::vector<uint8_t> out;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    size_t old_size = out.size();
    out.resize(old_size + kChunkSize);
    stream.next_out = out.data() + old_size;
    stream.avail_out = static_cast<uInt>(kChunkSize);

    ret = inflate(&stream, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&stream);
      std::string reason = stream.msg != nullptr ? stream.msg : "inflate failed";
      return MakeUnexpected(MakeError(ErrorCode::kDecompressionError, reason));
    }
    out.resize(old_size + kChunkSize - stream.avail_out);
    if (out.size() > max_output) {
      inflateEnd(&stream);
      return MakeUnexpected(MakeError(ErrorCode::kDecompressionError,
                                      "Decompressed size exceeds " + std::to_string(max_output) + " bytes"));
    }
    if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      inflateEnd(&stream);
      return MakeUnexpected(MakeError(ErrorCode::kDecompressionError, "Truncated gzip stream"));
    }
  }
  inflateEnd(&stream);
  return out;
}

}  // namespace stashd::utils
