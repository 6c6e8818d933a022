/**
 * @file call_codec.h
 * @brief Encoding of remote call arguments and results
 *
 * Arguments are a tuple of values written back to back with the bincode
 * archive. Decoding requires the whole buffer to be consumed, so a call made
 * with the wrong argument list is rejected instead of half-read.
 */

#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "migration/decode_context.h"
#include "storage/bincode_archive.h"
#include "storage/format_error.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::service {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Encode an argument list (possibly empty)
 */
template <typename... Args>
utils::Expected<Bytes, utils::Error> EncodeArgs(const Args&... args) {
  std::ostringstream out;
  migration::DecodeContext ctx;
  try {
    storage::BincodeOutputArchive archive(out, ctx);
    (archive.Write(args), ...);
  } catch (const storage::FormatError& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kCallArgumentError, std::string("Failed to encode arguments: ") + e.what()));
  }
  const std::string buffer = out.str();
  return Bytes(buffer.begin(), buffer.end());
}

/**
 * @brief Decode an argument list of exactly the given types
 */
template <typename... Args>
utils::Expected<std::tuple<Args...>, utils::Error> DecodeArgs(const Bytes& bytes) {
  std::istringstream in(std::string(bytes.begin(), bytes.end()));
  migration::DecodeContext ctx;
  std::tuple<Args...> values{};
  try {
    storage::BincodeInputArchive archive(in, ctx);
    std::apply([&archive](auto&... value) { (archive.Read(value), ...); }, values);
  } catch (const storage::FormatError& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kCallArgumentError, std::string("Failed to decode arguments: ") + e.what()));
  }
  if (in.peek() != std::char_traits<char>::eof()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kCallArgumentError,
                                                  "Trailing bytes after arguments"));
  }
  return values;
}

/**
 * @brief Decode a single value
 */
template <typename T>
utils::Expected<T, utils::Error> DecodeOne(const Bytes& bytes) {
  auto decoded = DecodeArgs<T>(bytes);
  if (!decoded) {
    return utils::MakeUnexpected(decoded.error());
  }
  return std::move(std::get<0>(*decoded));
}

}  // namespace stashd::service
