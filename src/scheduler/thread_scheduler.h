/**
 * @file thread_scheduler.h
 * @brief Scheduler backed by one worker thread per task
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "scheduler/scheduler.h"

namespace errdedup::scheduler {

/**
 * @brief Repeating task running on its own thread
 *
 * The worker waits on a condition variable for the interval, so Cancel()
 * wakes it immediately instead of waiting for the next tick.
 */
class ThreadTaskHandle : public TaskHandle {
 public:
  ThreadTaskHandle(std::string name, std::chrono::milliseconds interval, Scheduler::Task task);

  /**
   * @brief Destructor - cancels and joins the worker
   */
  ~ThreadTaskHandle() override;

  ThreadTaskHandle(const ThreadTaskHandle&) = delete;
  ThreadTaskHandle& operator=(const ThreadTaskHandle&) = delete;
  ThreadTaskHandle(ThreadTaskHandle&&) = delete;
  ThreadTaskHandle& operator=(ThreadTaskHandle&&) = delete;

  void Cancel() override;

  [[nodiscard]] bool IsActive() const override { return running_.load(); }

  /**
   * @brief Number of completed runs
   */
  [[nodiscard]] uint64_t GetRunCount() const { return run_count_.load(); }

 private:
  std::string name_;
  std::chrono::milliseconds interval_;
  Scheduler::Task task_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> run_count_{0};
  std::thread worker_thread_;

  /**
   * @brief Worker thread main loop
   */
  void WorkerLoop();
};

/**
 * @brief Scheduler that spawns a ThreadTaskHandle per schedule
 */
class ThreadScheduler : public Scheduler {
 public:
  /**
   * @param name Label used in log lines
   */
  explicit ThreadScheduler(std::string name = "scheduler") : name_(std::move(name)) {}

  std::unique_ptr<TaskHandle> ScheduleRepeating(std::chrono::milliseconds interval, Task task) override;

 private:
  std::string name_;
};

}  // namespace errdedup::scheduler
