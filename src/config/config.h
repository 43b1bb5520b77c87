/**
 * @file config.h
 * @brief Configuration structures and YAML parser for errdedup
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace errdedup::config {

// Default values for configuration
namespace defaults {

// Deduplication defaults
constexpr int64_t kTtlMs = 300000;             // 5 minutes
constexpr int64_t kMaxSize = 1000;
constexpr double kSimilarityThreshold = 0.8;
constexpr int64_t kCleanupIntervalMs = 60000;  // 0 = disabled
constexpr int64_t kMaxContextDepth = 16;

}  // namespace defaults

/**
 * @brief Deduplication configuration
 */
struct DedupConfig {
  bool enabled = true;                                       ///< Process signals (false = pass-through)
  int64_t ttl_ms = defaults::kTtlMs;                         ///< Entry lifetime from first occurrence
  int64_t max_size = defaults::kMaxSize;                     ///< Maximum distinct signatures retained
  double similarity_threshold = defaults::kSimilarityThreshold;  ///< Near-duplicate threshold (0.0-1.0)
  int64_t cleanup_interval_ms = defaults::kCleanupIntervalMs;    ///< Background sweep period (0 = disabled)
  int64_t max_context_depth = defaults::kMaxContextDepth;        ///< Context comparison depth bound
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";  ///< Log level: trace, debug, info, warn, error
  bool json = true;            ///< Use structured JSON logging
  std::string file;            ///< Log file path (empty = stderr)
};

/**
 * @brief Root configuration
 */
struct Config {
  DedupConfig dedup;      ///< Deduplication configuration
  LoggingConfig logging;  ///< Logging configuration
};

/**
 * @brief Load configuration from YAML file
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Load configuration from a YAML string
 *
 * Same validation as LoadConfig().
 */
utils::Expected<Config, utils::Error> LoadConfigFromString(const std::string& yaml);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

}  // namespace errdedup::config
