/**
 * @file scheduler.h
 * @brief Cancellable repeating task abstraction
 *
 * The cache's autonomous TTL sweep is scheduled through this interface so
 * that production code can use a background thread (ThreadScheduler) while
 * tests fire sweeps deterministically (ManualScheduler).
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace errdedup::scheduler {

/**
 * @brief Handle to a scheduled repeating task
 *
 * Destroying the handle cancels the task.
 */
class TaskHandle {
 public:
  virtual ~TaskHandle() = default;

  /**
   * @brief Stop future runs
   *
   * Idempotent. When it returns, the task is not running and will not run
   * again. Must not be called from inside the task itself.
   */
  virtual void Cancel() = 0;

  /**
   * @brief True until Cancel() has been called
   */
  [[nodiscard]] virtual bool IsActive() const = 0;
};

/**
 * @brief Source of repeating tasks
 */
class Scheduler {
 public:
  using Task = std::function<void()>;

  virtual ~Scheduler() = default;

  /**
   * @brief Run task every interval until the handle is cancelled
   * @param interval Period between runs (must be > 0)
   * @param task Work to run; exceptions are caught and logged by the scheduler
   * @return Handle owning the schedule
   */
  virtual std::unique_ptr<TaskHandle> ScheduleRepeating(std::chrono::milliseconds interval, Task task) = 0;
};

}  // namespace errdedup::scheduler
