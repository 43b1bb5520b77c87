/**
 * @file deduplication_service.h
 * @brief Deduplication policy on top of SignalCache
 *
 * Turns the cache's duplicate verdict into should-log / should-alert
 * decisions and notifies optional observers. The service also owns the
 * periodic expiry sweep.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "cache/signal_cache.h"
#include "config/config.h"
#include "scheduler/scheduler.h"
#include "signal/signal.h"
#include "utils/clock.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace errdedup::dedup {

namespace defaults {

constexpr std::chrono::milliseconds kCleanupInterval{60000};
constexpr size_t kQueryLimit = 10;

// Log cadence for duplicates
constexpr uint64_t kLogEveryN = 10;
constexpr std::chrono::milliseconds kLogQuietPeriod{300000};  // 5 minutes

// Alert cadence for duplicates
constexpr uint64_t kAlertEveryN = 50;

}  // namespace defaults

using DuplicateCallback = std::function<void(const signal::Signal&, const cache::CachedEntry&)>;
using NewErrorCallback = std::function<void(const signal::Signal&)>;

/**
 * @brief Service configuration
 */
struct DeduplicationOptions {
  bool enabled = true;                                                    ///< false = pass-through
  std::chrono::milliseconds ttl = cache::defaults::kTtl;                  ///< Entry lifetime from first_seen
  size_t max_size = cache::defaults::kMaxSize;                            ///< Maximum entries
  double similarity_threshold = similarity::kDefaultSimilarityThreshold;  ///< Near-duplicate threshold
  std::chrono::milliseconds cleanup_interval = defaults::kCleanupInterval;  ///< Sweep period (0 = off)
  size_t max_context_depth = similarity::kDefaultMaxContextDepth;          ///< Context comparison bound
  cache::KeyGenerator key_generator;  ///< Exact-match key (empty = signal::DeriveKey)

  DuplicateCallback on_duplicate;  ///< Called with the updated entry (optional)
  NewErrorCallback on_new_error;   ///< Called for a first occurrence (optional)

  /**
   * @brief Map the dedup section of a loaded config (callbacks and key_generator left empty)
   */
  static DeduplicationOptions FromConfig(const config::DedupConfig& config);

  [[nodiscard]] cache::SignalCacheOptions ToCacheOptions() const;
};

/**
 * @brief Check option ranges
 * @return kInvalidArgument naming the first offending field
 */
utils::Expected<void, utils::Error> ValidateOptions(const DeduplicationOptions& options);

/**
 * @brief Decision for one processed signal
 */
struct DeduplicationResult {
  bool is_duplicate = false;
  std::optional<cache::CachedEntry> entry;  ///< Updated entry (duplicates only)
  bool should_log = true;
  bool should_alert = true;
  std::string deduplication_key;  ///< Exact-match key of the processed signal (per key_generator)
};

/**
 * @brief Error deduplication service
 *
 * Example:
 * @code
 * auto service = DeduplicationService::Create(DeduplicationOptions{});
 * if (!service) { ... }
 * auto result = (*service)->Process(signal);
 * if (result.should_log) {
 *   // forward to the logging sink
 * }
 * @endcode
 *
 * Thread-safe. Observer callbacks run on the calling thread without any
 * service lock held; an exception escaping a callback is logged and does
 * not change the result.
 */
class DeduplicationService {
 public:
  /**
   * @brief Validate options and start the service
   *
   * @param options Service configuration
   * @param clock Time source (nullptr = SystemClock)
   * @param task_scheduler Runs the expiry sweep (nullptr = ThreadScheduler)
   * @return Service or kInvalidArgument
   */
  static utils::Expected<std::unique_ptr<DeduplicationService>, utils::Error> Create(
      DeduplicationOptions options, std::shared_ptr<const utils::Clock> clock = nullptr,
      std::shared_ptr<scheduler::Scheduler> task_scheduler = nullptr);

  /**
   * @brief Destructor - calls Shutdown()
   */
  ~DeduplicationService();

  DeduplicationService(const DeduplicationService&) = delete;
  DeduplicationService& operator=(const DeduplicationService&) = delete;
  DeduplicationService(DeduplicationService&&) = delete;
  DeduplicationService& operator=(DeduplicationService&&) = delete;

  /**
   * @brief Record a signal and decide whether to log / alert
   *
   * Disabled: reported as new, store untouched, no callbacks.
   * New: on_new_error fires; log and alert.
   * Duplicate: on_duplicate fires; log on every 10th occurrence or when the
   * previous occurrence is more than 5 minutes old; alert on every 50th.
   */
  DeduplicationResult Process(const signal::Signal& signal);

  /**
   * @brief Check for a match without recording
   */
  [[nodiscard]] bool IsDuplicate(const signal::Signal& signal) const;

  [[nodiscard]] cache::CacheStatisticsSnapshot GetStats() const;

  [[nodiscard]] std::vector<cache::CachedEntry> GetMostFrequentErrors(size_t limit = defaults::kQueryLimit) const;

  [[nodiscard]] std::vector<cache::CachedEntry> GetRecentErrors(size_t limit = defaults::kQueryLimit) const;

  /**
   * @brief Sweep expired entries now
   * @return Number of entries removed
   */
  size_t ClearExpired();

  void Clear();

  void Enable() { enabled_.store(true); }
  void Disable() { enabled_.store(false); }
  [[nodiscard]] bool IsEnabled() const { return enabled_.load(); }

  /**
   * @brief Replace the options
   *
   * Rebuilds the store (existing entries are dropped) and reschedules the
   * sweep with the new interval. The enabled flag is taken from options.
   *
   * @return kInvalidArgument if options are out of range (nothing changes)
   */
  utils::Expected<void, utils::Error> UpdateOptions(DeduplicationOptions options);

  /**
   * @brief Copy of the current options
   */
  [[nodiscard]] DeduplicationOptions GetOptions() const;

  /**
   * @brief Cancel the sweep and release all entries
   *
   * Idempotent. The service still answers calls afterwards, without
   * autonomous expiry.
   */
  void Shutdown();

  [[nodiscard]] bool IsShutdown() const { return shutdown_.load(); }

 private:
  DeduplicationService(DeduplicationOptions options, std::shared_ptr<const utils::Clock> clock,
                       std::shared_ptr<scheduler::Scheduler> task_scheduler);

  std::shared_ptr<const utils::Clock> clock_;
  std::shared_ptr<scheduler::Scheduler> scheduler_;

  // Guards options_ and store_; both are swapped whole by UpdateOptions()
  mutable std::mutex mutex_;
  std::shared_ptr<const DeduplicationOptions> options_;
  std::shared_ptr<cache::SignalCache> store_;

  // Serializes UpdateOptions() and Shutdown() (the sweep handle lifecycle)
  std::mutex lifecycle_mutex_;
  std::unique_ptr<scheduler::TaskHandle> sweep_handle_;

  std::atomic<bool> enabled_{true};
  std::atomic<bool> shutdown_{false};

  /**
   * @brief Current store
   */
  std::shared_ptr<cache::SignalCache> CurrentStore() const;

  /**
   * @brief Schedule the periodic sweep (nullptr when interval is 0)
   */
  std::unique_ptr<scheduler::TaskHandle> ScheduleSweep(std::chrono::milliseconds interval);

  static bool ShouldLogDuplicate(const cache::AddResult& added, utils::Timestamp now);
  static bool ShouldAlertDuplicate(const cache::CachedEntry& entry);
};

}  // namespace errdedup::dedup
