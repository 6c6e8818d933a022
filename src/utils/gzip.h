/**
 * @file gzip.h
 * @brief gzip framing over zlib for compressed restore windows
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace stashd::utils {

/// zlib's default level
inline constexpr int kDefaultGzipLevel = 6;

/**
 * @brief Compress into a single gzip member
 * @param level 0 (store) to 9 (best)
 */
Expected<std::vector<uint8_t>, Error> GzipCompress(const std::vector<uint8_t>& data, int level = kDefaultGzipLevel);

/**
 * @brief Decompress one gzip member
 *
 * Truncated or corrupt input is a kDecompressionError, and so is output
 * growing past @p max_output bytes.
 */
Expected<std::vector<uint8_t>, Error> GzipDecompress(const std::vector<uint8_t>& data,
                                                     size_t max_output = std::numeric_limits<size_t>::max());

}  // namespace stashd::utils
