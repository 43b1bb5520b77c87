/**
 * @file version.h
 * @brief errdedup version information
 */

#pragma once

#include <string>

namespace errdedup {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "1.0.0")
   */
  static std::string String() {
    return std::to_string(Major()) + "." + std::to_string(Minor()) + "." + std::to_string(Patch());
  }

  static int Major() { return 1; }

  static int Minor() { return 0; }

  static int Patch() { return 0; }
};

}  // namespace errdedup
