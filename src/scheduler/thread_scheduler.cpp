/**
 * @file thread_scheduler.cpp
 * @brief Thread-backed scheduler implementation
 */

#include "scheduler/thread_scheduler.h"

#include <exception>

#include "utils/structured_log.h"

namespace errdedup::scheduler {

ThreadTaskHandle::ThreadTaskHandle(std::string name, std::chrono::milliseconds interval, Scheduler::Task task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {
  running_.store(true);
  worker_thread_ = std::thread(&ThreadTaskHandle::WorkerLoop, this);
}

ThreadTaskHandle::~ThreadTaskHandle() {
  Cancel();
}

void ThreadTaskHandle::Cancel() {
  // Atomically check and clear running_ to prevent concurrent Cancel() calls
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;  // Already cancelled
  }

  {
    // Pairs with the predicate check in WorkerLoop so the wakeup is not lost
    std::lock_guard<std::mutex> lock(mutex_);
  }
  cv_.notify_all();

  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }
}

void ThreadTaskHandle::WorkerLoop() {
  while (running_.load()) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
    }

    if (!running_.load()) {
      break;
    }

    try {
      task_();
    } catch (const std::exception& e) {
      utils::StructuredLog()
          .Event("scheduler_task_error")
          .Field("task", name_)
          .Field("error", e.what())
          .Error();
    }
    run_count_.fetch_add(1);
  }
}

std::unique_ptr<TaskHandle> ThreadScheduler::ScheduleRepeating(std::chrono::milliseconds interval, Task task) {
  utils::StructuredLog()
      .Event("scheduler_task_started")
      .Field("task", name_)
      .Field("interval_ms", static_cast<int64_t>(interval.count()))
      .Debug();
  return std::make_unique<ThreadTaskHandle>(name_, interval, std::move(task));
}

}  // namespace errdedup::scheduler
