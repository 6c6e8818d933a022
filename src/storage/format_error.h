/**
 * @file format_error.h
 * @brief Exceptions raised inside archives while encoding/decoding
 *
 * Archives recurse through arbitrary user types, so they report failures by
 * throwing. The data-format adapters are the only place these are caught;
 * they convert them into Expected<T, Error> before returning to callers.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace stashd::storage {

/**
 * @brief Encode/decode failure inside an archive
 */
class FormatError : public std::runtime_error {
 public:
  explicit FormatError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Decode failure inside a versioned field, already tagged
 */
class MigrationFieldError : public FormatError {
 public:
  explicit MigrationFieldError(const std::string& message) : FormatError(message) {}
};

}  // namespace stashd::storage
