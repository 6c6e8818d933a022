/**
 * @file layout.h
 * @brief Restore that accepts both snapshot layouts
 */

#pragma once

#include <istream>

#include "storage/layout_v1.h"
#include "storage/layout_v2.h"
#include "storage/restored.h"

namespace stashd::storage {

/**
 * @brief Try the V2 layout, fall back to V1 from the same start position
 *
 * Restored<T>::layout reports which layout succeeded. If both fail the V1
 * error is returned (the V2 error has been logged).
 */
template <typename T>
utils::Expected<Restored<T>, utils::Error> RestoreV1V2(const system::SystemInterface& system, std::istream& in) {
  auto start = in.tellg();
  if (start == std::streampos(-1)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIoError, "Failed to get stream position"));
  }

  auto restored = layout_v2::Restore<T>(system, in);
  if (restored) {
    return restored;
  }

  utils::StructuredLog()
      .Event("layout_fallback")
      .Field("from", "V2")
      .Field("to", "V1")
      .Field("error", restored.error().to_string())
      .Warn();

  in.clear();
  in.seekg(start);
  if (!in.good()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kIoError, "Failed to rewind stream"));
  }
  return layout_v1::Restore<T>(system, in);
}

}  // namespace stashd::storage
