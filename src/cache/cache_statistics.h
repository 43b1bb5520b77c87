/**
 * @file cache_statistics.h
 * @brief Read-side aggregate statistics over cached entries
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "cache/cache_entry.h"
#include "utils/clock.h"

namespace errdedup::cache {

/**
 * @brief Cache statistics snapshot (copyable)
 */
struct CacheStatisticsSnapshot {
  uint64_t total_errors = 0;      ///< Sum of entry counts
  uint64_t unique_errors = 0;     ///< Number of entries
  uint64_t duplicate_errors = 0;  ///< total_errors - unique_errors
  double hit_rate = 0.0;          ///< duplicate_errors / total_errors (0 when empty)
  std::optional<utils::Timestamp> oldest_error;  ///< Min first_seen
  std::optional<utils::Timestamp> newest_error;  ///< Max first_seen

  // Lifetime counters of the owning cache
  uint64_t evictions = 0;
  uint64_t expirations = 0;
};

/**
 * @brief Aggregate entries present at call time
 *
 * Pure function; the caller supplies the entries it read under its own lock.
 */
CacheStatisticsSnapshot ComputeStatistics(const std::vector<CachedEntry>& entries);

}  // namespace errdedup::cache
