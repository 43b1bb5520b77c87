/**
 * @file manual_scheduler.h
 * @brief Scheduler driven explicitly by the caller
 *
 * Nothing runs on its own: Advance() moves the scheduler's notion of time
 * forward and runs every task that came due, on the calling thread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "scheduler/scheduler.h"

namespace errdedup::scheduler {

class ManualScheduler : public Scheduler {
 public:
  ManualScheduler() = default;

  ManualScheduler(const ManualScheduler&) = delete;
  ManualScheduler& operator=(const ManualScheduler&) = delete;

  std::unique_ptr<TaskHandle> ScheduleRepeating(std::chrono::milliseconds interval, Task task) override;

  /**
   * @brief Move time forward and run due tasks
   *
   * A task whose interval elapsed several times runs once per elapsed
   * interval, in due-time order.
   *
   * @return Number of task runs
   */
  size_t Advance(std::chrono::milliseconds delta);

  /**
   * @brief Run every active task once, regardless of due time
   * @return Number of task runs
   */
  size_t RunAll();

  /**
   * @brief Number of schedules not yet cancelled
   */
  [[nodiscard]] size_t ActiveCount() const;

 private:
  struct Schedule {
    std::chrono::milliseconds interval;
    std::chrono::milliseconds next_due;
    Task task;
    std::atomic<bool> active{true};

    Schedule(std::chrono::milliseconds interval_, std::chrono::milliseconds next_due_, Task task_)
        : interval(interval_), next_due(next_due_), task(std::move(task_)) {}
  };

  class Handle : public TaskHandle {
   public:
    explicit Handle(std::shared_ptr<Schedule> schedule) : schedule_(std::move(schedule)) {}
    ~Handle() override { Cancel(); }

    void Cancel() override { schedule_->active.store(false); }
    [[nodiscard]] bool IsActive() const override { return schedule_->active.load(); }

   private:
    std::shared_ptr<Schedule> schedule_;
  };

  mutable std::mutex mutex_;
  std::chrono::milliseconds now_{0};
  std::vector<std::shared_ptr<Schedule>> schedules_;

  /**
   * @brief Earliest due active schedule at or before limit
   * @pre mutex_ is locked
   */
  std::shared_ptr<Schedule> NextDueLocked(std::chrono::milliseconds limit) const;
};

}  // namespace errdedup::scheduler
