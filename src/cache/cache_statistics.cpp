/**
 * @file cache_statistics.cpp
 * @brief Statistics aggregation
 */

#include "cache/cache_statistics.h"

namespace errdedup::cache {

CacheStatisticsSnapshot ComputeStatistics(const std::vector<CachedEntry>& entries) {
  CacheStatisticsSnapshot snapshot;

  for (const auto& entry : entries) {
    snapshot.total_errors += entry.count;
    if (!snapshot.oldest_error || entry.first_seen < *snapshot.oldest_error) {
      snapshot.oldest_error = entry.first_seen;
    }
    if (!snapshot.newest_error || entry.first_seen > *snapshot.newest_error) {
      snapshot.newest_error = entry.first_seen;
    }
  }

  snapshot.unique_errors = entries.size();
  snapshot.duplicate_errors = snapshot.total_errors - snapshot.unique_errors;
  snapshot.hit_rate = snapshot.total_errors > 0 ? static_cast<double>(snapshot.duplicate_errors) /
                                                      static_cast<double>(snapshot.total_errors)
                                                : 0.0;
  return snapshot;
}

}  // namespace errdedup::cache
