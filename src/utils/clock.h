/**
 * @file clock.h
 * @brief Injectable wall clock
 *
 * The cache stamps entries with wall-clock time. Production code uses
 * SystemClock; tests drive a ManualClock to make TTL and cadence rules
 * deterministic.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace errdedup::utils {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Source of the current time
 */
class Clock {
 public:
  virtual ~Clock() = default;

  [[nodiscard]] virtual Timestamp Now() const = 0;
};

/**
 * @brief std::chrono::system_clock
 */
class SystemClock : public Clock {
 public:
  [[nodiscard]] Timestamp Now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Clock that only moves when told to
 *
 * Thread-safe: the current time is stored atomically as milliseconds.
 */
class ManualClock : public Clock {
 public:
  explicit ManualClock(int64_t start_ms = 0) : now_ms_(start_ms) {}

  [[nodiscard]] Timestamp Now() const override {
    return Timestamp(std::chrono::milliseconds(now_ms_.load(std::memory_order_relaxed)));
  }

  void Advance(std::chrono::milliseconds delta) { now_ms_.fetch_add(delta.count(), std::memory_order_relaxed); }

  void Set(int64_t now_ms) { now_ms_.store(now_ms, std::memory_order_relaxed); }

 private:
  std::atomic<int64_t> now_ms_;
};

/**
 * @brief Milliseconds since the Unix epoch
 */
inline int64_t ToEpochMillis(Timestamp timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
}

}  // namespace errdedup::utils
