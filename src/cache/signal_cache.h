/**
 * @file signal_cache.h
 * @brief Capacity- and TTL-bounded store of error signatures
 *
 * Design:
 * - Key: exact-match key from signal::DeriveKey(), or a caller-supplied
 *   KeyGenerator
 * - Value: CachedEntry (count, first/last seen, retained signal)
 * - Exact lookup O(1); on miss, a similarity scan over cached signals,
 *   newest insertion first
 * - Eviction: insertion order (oldest first_seen goes first). Repeats do not
 *   refresh an entry's position, so a long-running noisy error is still
 *   evicted once it is the oldest signature in a full cache.
 * - Expiry: entries older than ttl (by first_seen) are swept on every new
 *   insertion and by ClearExpired()
 * - Thread-safe with shared_mutex (reader-writer lock)
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "cache/cache_entry.h"
#include "cache/cache_statistics.h"
#include "signal/signal.h"
#include "similarity/signal_similarity.h"
#include "utils/clock.h"

namespace errdedup::cache {

namespace defaults {

constexpr std::chrono::milliseconds kTtl{300000};  // 5 minutes
constexpr size_t kMaxSize = 1000;

}  // namespace defaults

/**
 * @brief Maps a signal to its exact-match key
 *
 * Must be deterministic and must not throw.
 */
using KeyGenerator = std::function<std::string(const signal::Signal&)>;

/**
 * @brief Store configuration
 */
struct SignalCacheOptions {
  std::chrono::milliseconds ttl = defaults::kTtl;  ///< Age (from first_seen) after which an entry expires
  size_t max_size = defaults::kMaxSize;            ///< Maximum number of entries
  double similarity_threshold = similarity::kDefaultSimilarityThreshold;  ///< Fold threshold
  size_t max_context_depth = similarity::kDefaultMaxContextDepth;        ///< Context comparison depth bound
  KeyGenerator key_generator;  ///< Exact-match key (empty = signal::DeriveKey)
};

/**
 * @brief Outcome of AddOccurrence()
 */
struct AddResult {
  bool is_duplicate = false;             ///< Folded into an existing entry
  CachedEntry entry;                     ///< Entry state after the update
  utils::Timestamp previous_last_seen;  ///< Entry's last_seen before this call (first_seen when new)
};

/**
 * @brief Error signature cache
 *
 * Example:
 * @code
 * SignalCache cache(SignalCacheOptions{}, std::make_shared<utils::SystemClock>());
 * auto result = cache.AddOccurrence(signal);
 * if (result.is_duplicate) {
 *   // result.entry.count occurrences so far
 * }
 * @endcode
 */
class SignalCache {
 public:
  /**
   * @brief Construct cache
   * @param options Store configuration (max_size must be > 0)
   * @param clock Time source (shared with the owner)
   */
  SignalCache(const SignalCacheOptions& options, std::shared_ptr<const utils::Clock> clock);

  ~SignalCache() = default;

  SignalCache(const SignalCache&) = delete;
  SignalCache& operator=(const SignalCache&) = delete;
  SignalCache(SignalCache&&) = delete;
  SignalCache& operator=(SignalCache&&) = delete;

  /**
   * @brief Record one occurrence
   *
   * 1. Exact key hit: count++, last_seen = now, duplicate
   * 2. Similar entry (score >= threshold), newest first: same update, duplicate
   * 3. Otherwise insert a new entry, sweep expired entries, evict the oldest
   *    insertions until size <= max_size
   */
  AddResult AddOccurrence(const signal::Signal& signal);

  /**
   * @brief Check for a match without recording (exact or similar)
   */
  [[nodiscard]] bool IsDuplicate(const signal::Signal& signal) const;

  /**
   * @brief Exact-match key of signal under this store's key generator
   */
  [[nodiscard]] std::string KeyFor(const signal::Signal& signal) const;

  /**
   * @brief Lookup by exact key
   * @return Entry snapshot or nullopt when unknown
   */
  [[nodiscard]] std::optional<CachedEntry> Get(const std::string& key) const;

  /**
   * @brief Remove by exact key
   * @return true if an entry was removed
   */
  bool Remove(const std::string& key);

  /**
   * @brief All entries in insertion order
   */
  [[nodiscard]] std::vector<CachedEntry> GetAll() const;

  [[nodiscard]] std::vector<CachedEntry> GetByCode(const std::string& code) const;

  [[nodiscard]] std::vector<CachedEntry> GetBySeverity(signal::Severity severity) const;

  /**
   * @brief Entries by count descending; ties keep insertion order
   */
  [[nodiscard]] std::vector<CachedEntry> GetMostFrequent(size_t limit) const;

  /**
   * @brief Entries by last_seen descending; ties favour later insertions
   */
  [[nodiscard]] std::vector<CachedEntry> GetMostRecent(size_t limit) const;

  /**
   * @brief Remove every entry with now - first_seen > ttl
   * @return Number of entries removed
   */
  size_t ClearExpired();

  /**
   * @brief Remove all entries (lifetime counters are kept)
   */
  void Clear();

  [[nodiscard]] size_t Size() const;

  /**
   * @brief Aggregate statistics over the current entries
   */
  [[nodiscard]] CacheStatisticsSnapshot GetStatistics() const;

  [[nodiscard]] const SignalCacheOptions& options() const { return options_; }

 private:
  // Insertion order: front = oldest
  using OrderList = std::list<std::string>;
  using OrderIterator = OrderList::iterator;

  struct Slot {
    CachedEntry entry;
    OrderIterator order_iter;
  };

  SignalCacheOptions options_;
  std::shared_ptr<const utils::Clock> clock_;
  similarity::SignalSimilarity similarity_;

  mutable std::shared_mutex mutex_;                 ///< Reader-writer lock
  OrderList order_;                                 ///< Insertion order
  std::unordered_map<std::string, Slot> entries_;  ///< Key -> slot
  uint64_t next_sequence_ = 0;

  std::atomic<uint64_t> evictions_{0};
  std::atomic<uint64_t> expirations_{0};

  /**
   * @brief Find the newest entry similar to signal
   * @pre mutex_ is locked
   */
  const Slot* FindSimilarLocked(const signal::Signal& signal) const;

  /**
   * @brief Count a repeat on slot
   * @pre mutex_ is locked for writing
   */
  AddResult RecordRepeatLocked(Slot& slot, utils::Timestamp now);

  /**
   * @brief Remove expired entries
   * @pre mutex_ is locked for writing
   */
  size_t ClearExpiredLocked(utils::Timestamp now);

  /**
   * @brief Evict oldest insertions until size <= max_size
   * @pre mutex_ is locked for writing
   */
  void EvictOverflowLocked();

  /**
   * @brief Entries in insertion order
   * @pre mutex_ is locked
   */
  std::vector<CachedEntry> SnapshotLocked() const;
};

}  // namespace errdedup::cache
