#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace Feedwise {
namespace Util {

/**
 * TaskScheduler - Fixed-size thread pool for background work
 *
 * The preference registry runs its store writes here so that mutations
 * return without waiting on disk.
 *
 * Usage:
 *   TaskScheduler scheduler(2);
 *
 *   // Schedule a task and wait for its result
 *   auto future = scheduler.schedule<int>([]() { return expensiveComputation(); });
 *   int result = future.get();
 *
 *   // Fire and forget; exceptions are logged by the worker
 *   scheduler.scheduleBackground([]() { writeFile(); });
 *
 * Thread safety:
 * - Safe to call from any thread
 * - shutdown() drains the queue before joining workers
 */
class TaskScheduler {
public:
  explicit TaskScheduler(size_t threadCount = defaultThreadCount());
  ~TaskScheduler();

  static size_t defaultThreadCount();

  /**
   * Schedule a task to run on the thread pool
   *
   * @param task Function to execute
   * @return std::future for retrieving result (or the exception it threw)
   */
  template <typename Result> std::future<Result> schedule(std::function<Result()> task) {
    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    auto wrappedTask = [task = std::move(task), promise]() {
      try {
        if constexpr (std::is_same_v<Result, void>) {
          task();
          promise->set_value();
        } else {
          promise->set_value(task());
        }
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    };

    enqueue(std::move(wrappedTask));
    return future;
  }

  /**
   * Schedule a task whose result is not needed.
   * Returns false if the scheduler has already shut down.
   */
  bool scheduleBackground(std::function<void()> task) {
    return enqueue(std::move(task));
  }

  size_t getWorkerCount() const {
    return workers_.size();
  }

  size_t getPendingTaskCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return taskQueue_.size();
  }

  /**
   * Wait for the queue to drain and all running tasks to finish
   *
   * @param timeoutMs Timeout in milliseconds (0 = infinite)
   * @return true if all tasks completed, false if timeout
   */
  bool waitForAll(int timeoutMs = 0);

  /** Runs pending tasks to completion, then joins the workers. Idempotent. */
  void shutdown();

private:
  bool enqueue(std::function<void()> task);
  void workerThread();

  std::vector<std::thread> workers_;

  std::queue<std::function<void()>> taskQueue_;
  mutable std::mutex queueMutex_;
  std::condition_variable conditionVariable_;
  std::condition_variable idleCondition_;

  std::atomic<bool> shutdown_{false};
  int activeTaskCount_ = 0; // guarded by queueMutex_

  TaskScheduler(const TaskScheduler &) = delete;
  TaskScheduler &operator=(const TaskScheduler &) = delete;
};

} // namespace Util
} // namespace Feedwise
