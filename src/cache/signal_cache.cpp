/**
 * @file signal_cache.cpp
 * @brief Error signature cache implementation
 */

#include "cache/signal_cache.h"

#include <algorithm>
#include <iterator>
#include <mutex>

#include "signal/signal_key.h"
#include "utils/structured_log.h"

namespace errdedup::cache {

SignalCache::SignalCache(const SignalCacheOptions& options, std::shared_ptr<const utils::Clock> clock)
    : options_(options),
      clock_(std::move(clock)),
      similarity_(options.similarity_threshold, options.max_context_depth) {}

std::string SignalCache::KeyFor(const signal::Signal& signal) const {
  return options_.key_generator ? options_.key_generator(signal) : signal::DeriveKey(signal);
}

AddResult SignalCache::AddOccurrence(const signal::Signal& signal) {
  std::string key = KeyFor(signal);
  const utils::Timestamp now = clock_->Now();

  std::unique_lock lock(mutex_);

  // Exact match
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    return RecordRepeatLocked(it->second, now);
  }

  // Near-duplicate
  if (const Slot* similar = FindSimilarLocked(signal); similar != nullptr) {
    return RecordRepeatLocked(entries_.at(similar->entry.key), now);
  }

  // New signature
  order_.push_back(key);
  auto order_iter = std::prev(order_.end());
  auto inserted = entries_.emplace(key, Slot{CachedEntry(key, signal, now, next_sequence_++), order_iter}).first;
  AddResult result{false, inserted->second.entry, now};

  ClearExpiredLocked(now);
  EvictOverflowLocked();

  return result;
}

bool SignalCache::IsDuplicate(const signal::Signal& signal) const {
  const std::string key = KeyFor(signal);

  std::shared_lock lock(mutex_);
  return entries_.count(key) > 0 || FindSimilarLocked(signal) != nullptr;
}

std::optional<CachedEntry> SignalCache::Get(const std::string& key) const {
  std::shared_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second.entry;
}

bool SignalCache::Remove(const std::string& key) {
  std::unique_lock lock(mutex_);

  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return false;
  }
  order_.erase(it->second.order_iter);
  entries_.erase(it);
  return true;
}

std::vector<CachedEntry> SignalCache::GetAll() const {
  std::shared_lock lock(mutex_);
  return SnapshotLocked();
}

std::vector<CachedEntry> SignalCache::GetByCode(const std::string& code) const {
  std::shared_lock lock(mutex_);

  std::vector<CachedEntry> result;
  for (const auto& key : order_) {
    const auto& entry = entries_.at(key).entry;
    if (entry.signal.code() == code) {
      result.push_back(entry);
    }
  }
  return result;
}

std::vector<CachedEntry> SignalCache::GetBySeverity(signal::Severity severity) const {
  std::shared_lock lock(mutex_);

  std::vector<CachedEntry> result;
  for (const auto& key : order_) {
    const auto& entry = entries_.at(key).entry;
    if (entry.signal.severity() == severity) {
      result.push_back(entry);
    }
  }
  return result;
}

std::vector<CachedEntry> SignalCache::GetMostFrequent(size_t limit) const {
  std::vector<CachedEntry> result;
  {
    std::shared_lock lock(mutex_);
    result = SnapshotLocked();
  }

  // Stable: equal counts keep insertion order
  std::stable_sort(result.begin(), result.end(),
                   [](const CachedEntry& lhs, const CachedEntry& rhs) { return lhs.count > rhs.count; });
  if (result.size() > limit) {
    result.erase(result.begin() + static_cast<std::ptrdiff_t>(limit), result.end());
  }
  return result;
}

std::vector<CachedEntry> SignalCache::GetMostRecent(size_t limit) const {
  std::vector<CachedEntry> result;
  {
    std::shared_lock lock(mutex_);
    result = SnapshotLocked();
  }

  std::sort(result.begin(), result.end(), [](const CachedEntry& lhs, const CachedEntry& rhs) {
    if (lhs.last_seen != rhs.last_seen) {
      return lhs.last_seen > rhs.last_seen;
    }
    return lhs.sequence > rhs.sequence;
  });
  if (result.size() > limit) {
    result.erase(result.begin() + static_cast<std::ptrdiff_t>(limit), result.end());
  }
  return result;
}

size_t SignalCache::ClearExpired() {
  const utils::Timestamp now = clock_->Now();

  std::unique_lock lock(mutex_);
  return ClearExpiredLocked(now);
}

void SignalCache::Clear() {
  std::unique_lock lock(mutex_);
  entries_.clear();
  order_.clear();
}

size_t SignalCache::Size() const {
  std::shared_lock lock(mutex_);
  return entries_.size();
}

CacheStatisticsSnapshot SignalCache::GetStatistics() const {
  std::vector<CachedEntry> entries;
  {
    std::shared_lock lock(mutex_);
    entries = SnapshotLocked();
  }

  CacheStatisticsSnapshot snapshot = ComputeStatistics(entries);
  snapshot.evictions = evictions_.load(std::memory_order_relaxed);
  snapshot.expirations = expirations_.load(std::memory_order_relaxed);
  return snapshot;
}

const SignalCache::Slot* SignalCache::FindSimilarLocked(const signal::Signal& signal) const {
  // Newest insertion first; any match will do
  for (auto rit = order_.rbegin(); rit != order_.rend(); ++rit) {
    const Slot& slot = entries_.at(*rit);
    if (similarity_.IsSimilar(signal, slot.entry.signal)) {
      return &slot;
    }
  }
  return nullptr;
}

AddResult SignalCache::RecordRepeatLocked(Slot& slot, utils::Timestamp now) {
  CachedEntry& entry = slot.entry;
  const utils::Timestamp previous_last_seen = entry.last_seen;

  ++entry.count;
  entry.last_seen = std::max(now, entry.last_seen);

  return AddResult{true, entry, previous_last_seen};
}

size_t SignalCache::ClearExpiredLocked(utils::Timestamp now) {
  size_t removed = 0;
  for (auto it = order_.begin(); it != order_.end();) {
    auto slot_it = entries_.find(*it);
    if (now - slot_it->second.entry.first_seen > options_.ttl) {
      entries_.erase(slot_it);
      it = order_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }

  if (removed > 0) {
    expirations_.fetch_add(removed, std::memory_order_relaxed);
    utils::StructuredLog()
        .Event("cache_expired")
        .Field("removed", static_cast<uint64_t>(removed))
        .Field("remaining", static_cast<uint64_t>(entries_.size()))
        .Info();
  }
  return removed;
}

void SignalCache::EvictOverflowLocked() {
  while (entries_.size() > options_.max_size && !order_.empty()) {
    const std::string& oldest_key = order_.front();
    auto slot_it = entries_.find(oldest_key);

    utils::StructuredLog()
        .Event("cache_eviction")
        .Field("key", oldest_key)
        .Field("count", slot_it->second.entry.count)
        .Debug();

    entries_.erase(slot_it);
    order_.pop_front();
    evictions_.fetch_add(1, std::memory_order_relaxed);
  }
}

std::vector<CachedEntry> SignalCache::SnapshotLocked() const {
  std::vector<CachedEntry> result;
  result.reserve(entries_.size());
  for (const auto& key : order_) {
    result.push_back(entries_.at(key).entry);
  }
  return result;
}

}  // namespace errdedup::cache
