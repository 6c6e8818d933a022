/**
 * @file version.h
 * @brief stashd version information
 */

#pragma once

#include <string>

namespace stashd {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "0.1.0")
   */
  static std::string String() { return "0.1.0"; }

  static int Major() { return 0; }
  static int Minor() { return 1; }
  static int Patch() { return 0; }
};

}  // namespace stashd
