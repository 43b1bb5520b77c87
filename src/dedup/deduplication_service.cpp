/**
 * @file deduplication_service.cpp
 * @brief Deduplication policy implementation
 */

#include "dedup/deduplication_service.h"

#include <exception>
#include <utility>

#include "scheduler/thread_scheduler.h"
#include "utils/structured_log.h"

namespace errdedup::dedup {

DeduplicationOptions DeduplicationOptions::FromConfig(const config::DedupConfig& config) {
  DeduplicationOptions options;
  options.enabled = config.enabled;
  options.ttl = std::chrono::milliseconds(config.ttl_ms);
  options.max_size = static_cast<size_t>(config.max_size);
  options.similarity_threshold = config.similarity_threshold;
  options.cleanup_interval = std::chrono::milliseconds(config.cleanup_interval_ms);
  options.max_context_depth = static_cast<size_t>(config.max_context_depth);
  return options;
}

cache::SignalCacheOptions DeduplicationOptions::ToCacheOptions() const {
  cache::SignalCacheOptions cache_options;
  cache_options.ttl = ttl;
  cache_options.max_size = max_size;
  cache_options.similarity_threshold = similarity_threshold;
  cache_options.max_context_depth = max_context_depth;
  cache_options.key_generator = key_generator;
  return cache_options;
}

utils::Expected<void, utils::Error> ValidateOptions(const DeduplicationOptions& options) {
  if (options.ttl.count() <= 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "ttl must be greater than 0"));
  }
  if (options.max_size == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "max_size must be greater than 0"));
  }
  if (options.similarity_threshold < 0.0 || options.similarity_threshold > 1.0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "similarity_threshold must be between 0.0 and 1.0"));
  }
  if (options.cleanup_interval.count() < 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "cleanup_interval must be >= 0 (0 = disabled)"));
  }
  if (options.max_context_depth == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kInvalidArgument, "max_context_depth must be greater than 0"));
  }
  return {};
}

utils::Expected<std::unique_ptr<DeduplicationService>, utils::Error> DeduplicationService::Create(
    DeduplicationOptions options, std::shared_ptr<const utils::Clock> clock,
    std::shared_ptr<scheduler::Scheduler> task_scheduler) {
  auto valid = ValidateOptions(options);
  if (!valid) {
    return utils::MakeUnexpected(valid.error());
  }

  if (!clock) {
    clock = std::make_shared<utils::SystemClock>();
  }
  if (!task_scheduler) {
    task_scheduler = std::make_shared<scheduler::ThreadScheduler>("dedup_sweep");
  }

  const auto interval = options.cleanup_interval;
  std::unique_ptr<DeduplicationService> service(
      new DeduplicationService(std::move(options), std::move(clock), std::move(task_scheduler)));

  std::lock_guard<std::mutex> lifecycle_lock(service->lifecycle_mutex_);
  service->sweep_handle_ = service->ScheduleSweep(interval);
  return service;
}

DeduplicationService::DeduplicationService(DeduplicationOptions options, std::shared_ptr<const utils::Clock> clock,
                                           std::shared_ptr<scheduler::Scheduler> task_scheduler)
    : clock_(std::move(clock)), scheduler_(std::move(task_scheduler)), enabled_(options.enabled) {
  store_ = std::make_shared<cache::SignalCache>(options.ToCacheOptions(), clock_);
  options_ = std::make_shared<const DeduplicationOptions>(std::move(options));
}

DeduplicationService::~DeduplicationService() {
  Shutdown();
}

DeduplicationResult DeduplicationService::Process(const signal::Signal& signal) {
  std::shared_ptr<const DeduplicationOptions> options;
  std::shared_ptr<cache::SignalCache> store;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    options = options_;
    store = store_;
  }

  DeduplicationResult result;
  result.deduplication_key = store->KeyFor(signal);

  if (!enabled_.load()) {
    return result;
  }

  cache::AddResult added = store->AddOccurrence(signal);

  if (added.is_duplicate) {
    if (options->on_duplicate) {
      try {
        options->on_duplicate(signal, added.entry);
      } catch (const std::exception& e) {
        utils::LogCallbackError("on_duplicate", result.deduplication_key, e.what());
      }
    }

    result.is_duplicate = true;
    result.should_log = ShouldLogDuplicate(added, clock_->Now());
    result.should_alert = ShouldAlertDuplicate(added.entry);

    utils::StructuredLog()
        .Event("dedup_duplicate")
        .Field("key", added.entry.key)
        .Field("count", added.entry.count)
        .Field("should_log", result.should_log)
        .Field("should_alert", result.should_alert)
        .Debug();

    result.entry = std::move(added.entry);
    return result;
  }

  if (options->on_new_error) {
    try {
      options->on_new_error(signal);
    } catch (const std::exception& e) {
      utils::LogCallbackError("on_new_error", result.deduplication_key, e.what());
    }
  }

  utils::StructuredLog()
      .Event("dedup_new_error")
      .Field("key", result.deduplication_key)
      .Field("code", signal.code())
      .Field("severity", signal::SeverityToString(signal.severity()))
      .Debug();

  return result;
}

bool DeduplicationService::IsDuplicate(const signal::Signal& signal) const {
  return CurrentStore()->IsDuplicate(signal);
}

cache::CacheStatisticsSnapshot DeduplicationService::GetStats() const {
  return CurrentStore()->GetStatistics();
}

std::vector<cache::CachedEntry> DeduplicationService::GetMostFrequentErrors(size_t limit) const {
  return CurrentStore()->GetMostFrequent(limit);
}

std::vector<cache::CachedEntry> DeduplicationService::GetRecentErrors(size_t limit) const {
  return CurrentStore()->GetMostRecent(limit);
}

size_t DeduplicationService::ClearExpired() {
  return CurrentStore()->ClearExpired();
}

void DeduplicationService::Clear() {
  CurrentStore()->Clear();
}

utils::Expected<void, utils::Error> DeduplicationService::UpdateOptions(DeduplicationOptions options) {
  auto valid = ValidateOptions(options);
  if (!valid) {
    return utils::MakeUnexpected(valid.error());
  }

  std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);

  const auto interval = options.cleanup_interval;
  const auto ttl_ms = static_cast<int64_t>(options.ttl.count());
  const auto max_size = static_cast<uint64_t>(options.max_size);
  const double threshold = options.similarity_threshold;

  auto store = std::make_shared<cache::SignalCache>(options.ToCacheOptions(), clock_);
  enabled_.store(options.enabled);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    options_ = std::make_shared<const DeduplicationOptions>(std::move(options));
    store_ = std::move(store);
  }

  // Cancel joins the sweep worker; the sweep takes mutex_, so do it unlocked
  if (sweep_handle_) {
    sweep_handle_->Cancel();
    sweep_handle_.reset();
  }
  if (!shutdown_.load()) {
    sweep_handle_ = ScheduleSweep(interval);
  }

  utils::StructuredLog()
      .Event("dedup_options_updated")
      .Field("ttl_ms", ttl_ms)
      .Field("max_size", max_size)
      .Field("similarity_threshold", threshold)
      .Field("cleanup_interval_ms", static_cast<int64_t>(interval.count()))
      .Info();

  return {};
}

DeduplicationOptions DeduplicationService::GetOptions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  DeduplicationOptions copy = *options_;
  copy.enabled = enabled_.load();
  return copy;
}

void DeduplicationService::Shutdown() {
  bool expected = false;
  if (!shutdown_.compare_exchange_strong(expected, true)) {
    return;  // Already shut down
  }

  std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
  if (sweep_handle_) {
    sweep_handle_->Cancel();
    sweep_handle_.reset();
  }

  auto store = CurrentStore();
  const auto released = static_cast<uint64_t>(store->Size());
  store->Clear();

  utils::StructuredLog().Event("dedup_shutdown").Field("released", released).Info();
}

std::shared_ptr<cache::SignalCache> DeduplicationService::CurrentStore() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_;
}

std::unique_ptr<scheduler::TaskHandle> DeduplicationService::ScheduleSweep(std::chrono::milliseconds interval) {
  if (interval.count() <= 0) {
    return nullptr;
  }
  // The handle is cancelled in Shutdown() before this object goes away
  return scheduler_->ScheduleRepeating(interval, [this]() { ClearExpired(); });
}

bool DeduplicationService::ShouldLogDuplicate(const cache::AddResult& added, utils::Timestamp now) {
  return added.entry.count % defaults::kLogEveryN == 0 || now - added.previous_last_seen > defaults::kLogQuietPeriod;
}

bool DeduplicationService::ShouldAlertDuplicate(const cache::CachedEntry& entry) {
  // count == 1 never holds for a duplicate; kept so a first occurrence would alert
  return entry.count == 1 || entry.count % defaults::kAlertEveryN == 0;
}

}  // namespace errdedup::dedup
