/**
 * @file manual_scheduler.cpp
 * @brief Manually driven scheduler implementation
 */

#include "scheduler/manual_scheduler.h"

#include <algorithm>
#include <exception>

#include "utils/structured_log.h"

namespace errdedup::scheduler {

namespace {

void RunTask(const Scheduler::Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    utils::StructuredLog().Event("scheduler_task_error").Field("task", "manual").Field("error", e.what()).Error();
  }
}

}  // namespace

std::unique_ptr<TaskHandle> ManualScheduler::ScheduleRepeating(std::chrono::milliseconds interval, Task task) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto schedule = std::make_shared<Schedule>(interval, now_ + interval, std::move(task));
  schedules_.push_back(schedule);
  return std::make_unique<Handle>(std::move(schedule));
}

size_t ManualScheduler::Advance(std::chrono::milliseconds delta) {
  std::chrono::milliseconds target;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    target = now_ + delta;
  }

  size_t runs = 0;
  while (true) {
    std::shared_ptr<Schedule> due;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      due = NextDueLocked(target);
      if (!due) {
        now_ = target;
        break;
      }
      now_ = due->next_due;
      due->next_due += due->interval;
    }
    // Run outside the lock so the task may cancel or schedule
    RunTask(due->task);
    ++runs;
  }
  return runs;
}

size_t ManualScheduler::RunAll() {
  std::vector<std::shared_ptr<Schedule>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot = schedules_;
  }

  size_t runs = 0;
  for (const auto& schedule : snapshot) {
    if (schedule->active.load()) {
      RunTask(schedule->task);
      ++runs;
    }
  }
  return runs;
}

size_t ManualScheduler::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(schedules_.begin(), schedules_.end(),
                                           [](const auto& schedule) { return schedule->active.load(); }));
}

std::shared_ptr<ManualScheduler::Schedule> ManualScheduler::NextDueLocked(std::chrono::milliseconds limit) const {
  std::shared_ptr<Schedule> best;
  for (const auto& schedule : schedules_) {
    if (!schedule->active.load() || schedule->next_due > limit) {
      continue;
    }
    if (!best || schedule->next_due < best->next_due) {
      best = schedule;
    }
  }
  return best;
}

}  // namespace errdedup::scheduler
