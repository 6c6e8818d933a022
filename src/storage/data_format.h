/**
 * @file data_format.h
 * @brief Content format tags and the two data-format adapters
 *
 * A snapshot's content is encoded with one of two adapters. The header records
 * which one through its content_format tag:
 *   - MsgPackAdapter: self-describing, field names on the wire
 *   - BincodeAdapter: positional, compact
 *
 * A type opts in by providing, in its own namespace:
 * @code
 * template <typename Archive>
 * void Serialize(Archive& ar, MyState& s) {
 *   ar("id", s.id);
 *   ar("items", s.items);
 * }
 * @endcode
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

#include "migration/decode_context.h"
#include "storage/bincode_archive.h"
#include "storage/format_error.h"
#include "storage/msgpack_archive.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::storage {

/**
 * @brief Content format tag stored in the header
 */
enum class DataFormatType : uint64_t {
  kUnknown = 0,
  kMsgPack = 1,
  kBincode = 2,
};

/**
 * @brief Map a raw header tag to a format; unrecognised tags map to kUnknown
 */
DataFormatType DataFormatTypeFromU64(uint64_t tag);

/**
 * @brief "Unknown", "MsgPack" or "Bincode"
 */
const char* DataFormatTypeToString(DataFormatType format);

/**
 * @brief Parse a configuration name ("msgpack" / "bincode", case-insensitive)
 */
utils::Expected<DataFormatType, utils::Error> ParseDataFormatType(const std::string& name);

namespace detail {

template <typename Fn>
auto CatchFormatErrors(utils::ErrorCode code, Fn&& body) -> decltype(body()) {
  using utils::MakeError;
  using utils::MakeUnexpected;
  try {
    return body();
  } catch (const MigrationFieldError& e) {
    return MakeUnexpected(MakeError(utils::ErrorCode::kMigrationError, e.what()));
  } catch (const FormatError& e) {
    return MakeUnexpected(MakeError(code, e.what()));
  } catch (const nlohmann::json::exception& e) {
    return MakeUnexpected(MakeError(code, e.what()));
  }
}

}  // namespace detail

/**
 * @brief MessagePack adapter
 */
class MsgPackAdapter {
 public:
  static constexpr DataFormatType Format() { return DataFormatType::kMsgPack; }

  template <typename T>
  static utils::Expected<void, utils::Error> Serialize(std::ostream& out, const T& value,
                                                       const migration::DecodeContext& ctx) {
    return detail::CatchFormatErrors(utils::ErrorCode::kMsgPackEncodeError,
                                     [&]() -> utils::Expected<void, utils::Error> {
                                       MsgPackOutputArchive archive(ctx);
                                       std::vector<uint8_t> bytes = json::to_msgpack(archive.ToJson(value));
                                       out.write(reinterpret_cast<const char*>(bytes.data()),
                                                 static_cast<std::streamsize>(bytes.size()));
                                       if (!out) {
                                         throw FormatError("write failed");
                                       }
                                       return {};
                                     });
  }

  /**
   * @brief Decode exactly one msgpack value from the stream
   */
  template <typename T>
  static utils::Expected<T, utils::Error> Deserialize(std::istream& in, const migration::DecodeContext& ctx) {
    return detail::CatchFormatErrors(utils::ErrorCode::kMsgPackDecodeError, [&]() -> utils::Expected<T, utils::Error> {
      // strict=false stops after the first complete value
      json tree = json::from_msgpack(in, /*strict=*/false);
      MsgPackInputArchive archive(ctx);
      T value{};
      archive.FromJson(tree, value);
      return value;
    });
  }

  template <typename T>
  static utils::Expected<std::vector<uint8_t>, utils::Error> SerializeToBytes(const T& value,
                                                                             const migration::DecodeContext& ctx) {
    return detail::CatchFormatErrors(utils::ErrorCode::kMsgPackEncodeError,
                                     [&]() -> utils::Expected<std::vector<uint8_t>, utils::Error> {
                                       MsgPackOutputArchive archive(ctx);
                                       return json::to_msgpack(archive.ToJson(value));
                                     });
  }

  template <typename T>
  static utils::Expected<T, utils::Error> DeserializeFromBytes(const std::vector<uint8_t>& bytes,
                                                               const migration::DecodeContext& ctx) {
    return detail::CatchFormatErrors(utils::ErrorCode::kMsgPackDecodeError, [&]() -> utils::Expected<T, utils::Error> {
      json tree = json::from_msgpack(bytes, /*strict=*/true);
      MsgPackInputArchive archive(ctx);
      T value{};
      archive.FromJson(tree, value);
      return value;
    });
  }
};

/**
 * @brief Bincode adapter
 */
class BincodeAdapter {
 public:
  static constexpr DataFormatType Format() { return DataFormatType::kBincode; }

  template <typename T>
  static utils::Expected<void, utils::Error> Serialize(std::ostream& out, const T& value,
                                                       const migration::DecodeContext& ctx) {
    return detail::CatchFormatErrors(utils::ErrorCode::kBincodeEncodeError,
                                     [&]() -> utils::Expected<void, utils::Error> {
                                       BincodeOutputArchive archive(out, ctx);
                                       archive.Write(value);
                                       return {};
                                     });
  }

  template <typename T>
  static utils::Expected<T, utils::Error> Deserialize(std::istream& in, const migration::DecodeContext& ctx) {
    return detail::CatchFormatErrors(utils::ErrorCode::kBincodeDecodeError, [&]() -> utils::Expected<T, utils::Error> {
      BincodeInputArchive archive(in, ctx);
      T value{};
      archive.Read(value);
      return value;
    });
  }

  template <typename T>
  static utils::Expected<std::vector<uint8_t>, utils::Error> SerializeToBytes(const T& value,
                                                                             const migration::DecodeContext& ctx) {
    std::ostringstream out;
    auto result = Serialize(out, value, ctx);
    if (!result) {
      return utils::MakeUnexpected(result.error());
    }
    const std::string buffer = out.str();
    return std::vector<uint8_t>(buffer.begin(), buffer.end());
  }

  template <typename T>
  static utils::Expected<T, utils::Error> DeserializeFromBytes(const std::vector<uint8_t>& bytes,
                                                               const migration::DecodeContext& ctx) {
    return detail::CatchFormatErrors(utils::ErrorCode::kBincodeDecodeError, [&]() -> utils::Expected<T, utils::Error> {
      std::istringstream in(std::string(bytes.begin(), bytes.end()));
      BincodeInputArchive archive(in, ctx);
      T value{};
      archive.Read(value);
      if (in.peek() != std::char_traits<char>::eof()) {
        throw FormatError("trailing bytes after value");
      }
      return value;
    });
  }
};

namespace detail {

inline utils::Error IncompatibleFormat(DataFormatType format) {
  return utils::MakeError(utils::ErrorCode::kInvalidContentFormat,
                          std::string("Incompatible format ") + DataFormatTypeToString(format));
}

}  // namespace detail

/**
 * @brief Encode with the adapter selected by @p format
 */
template <typename T>
utils::Expected<void, utils::Error> SerdeSerialize(DataFormatType format, std::ostream& out, const T& value,
                                                   const migration::DecodeContext& ctx) {
  switch (format) {
    case DataFormatType::kMsgPack:
      return MsgPackAdapter::Serialize(out, value, ctx);
    case DataFormatType::kBincode:
      return BincodeAdapter::Serialize(out, value, ctx);
    default:
      return utils::MakeUnexpected(detail::IncompatibleFormat(format));
  }
}

/**
 * @brief Decode with the adapter selected by @p format
 */
template <typename T>
utils::Expected<T, utils::Error> SerdeDeserialize(DataFormatType format, std::istream& in,
                                                  const migration::DecodeContext& ctx) {
  switch (format) {
    case DataFormatType::kMsgPack:
      return MsgPackAdapter::Deserialize<T>(in, ctx);
    case DataFormatType::kBincode:
      return BincodeAdapter::Deserialize<T>(in, ctx);
    default:
      return utils::MakeUnexpected(detail::IncompatibleFormat(format));
  }
}

template <typename T>
utils::Expected<std::vector<uint8_t>, utils::Error> SerdeSerializeBytes(DataFormatType format, const T& value,
                                                                        const migration::DecodeContext& ctx) {
  switch (format) {
    case DataFormatType::kMsgPack:
      return MsgPackAdapter::SerializeToBytes(value, ctx);
    case DataFormatType::kBincode:
      return BincodeAdapter::SerializeToBytes(value, ctx);
    default:
      return utils::MakeUnexpected(detail::IncompatibleFormat(format));
  }
}

template <typename T>
utils::Expected<T, utils::Error> SerdeDeserializeBytes(DataFormatType format, const std::vector<uint8_t>& bytes,
                                                       const migration::DecodeContext& ctx) {
  switch (format) {
    case DataFormatType::kMsgPack:
      return MsgPackAdapter::DeserializeFromBytes<T>(bytes, ctx);
    case DataFormatType::kBincode:
      return BincodeAdapter::DeserializeFromBytes<T>(bytes, ctx);
    default:
      return utils::MakeUnexpected(detail::IncompatibleFormat(format));
  }
}

}  // namespace stashd::storage
