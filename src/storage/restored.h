/**
 * @file restored.h
 * @brief Result of restoring a snapshot
 */

#pragma once

#include <cstdint>
#include <ios>
#include <istream>

#include "storage/header.h"
#include "storage/transient.h"

namespace stashd::storage {

/**
 * @brief Layout a snapshot was read with
 */
enum class LayoutVersion : uint8_t {
  kV1 = 1,  ///< Headerless MsgPack content
  kV2 = 2,  ///< Header followed by content
};

inline const char* LayoutVersionToString(LayoutVersion version) {
  return version == LayoutVersion::kV1 ? "V1" : "V2";
}

template <typename T>
struct Restored {
  Header header;
  Transient transient;
  T value;
  LayoutVersion layout = LayoutVersion::kV2;
};

namespace detail {

/**
 * @brief Current read position, or -1 if the stream cannot report it
 *
 * A decoder that stopped exactly at end of input leaves eofbit set, which
 * would make tellg() fail; only that bit is cleared.
 */
inline std::streamoff ReadPosition(std::istream& in) {
  if (in.eof() && !in.fail()) {
    in.clear();
  }
  auto pos = in.tellg();
  return pos == std::streampos(-1) ? -1 : static_cast<std::streamoff>(pos);
}

}  // namespace detail

}  // namespace stashd::storage
