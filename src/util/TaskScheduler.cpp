#include "TaskScheduler.h"
#include "logging/Logger.h"
#include <algorithm>
#include <chrono>

namespace Feedwise {
namespace Util {

size_t TaskScheduler::defaultThreadCount() {
  size_t numCores = std::thread::hardware_concurrency();
  if (numCores == 0)
    numCores = 2;

  // Store writes are short and I/O bound; a couple of workers is plenty
  return std::min(static_cast<size_t>(2), numCores);
}

TaskScheduler::TaskScheduler(size_t threadCount) {
  size_t poolSize = std::max(static_cast<size_t>(1), threadCount);

  for (size_t i = 0; i < poolSize; ++i) {
    workers_.emplace_back([this]() { workerThread(); });
  }

  logDebug("TaskScheduler", "Started worker pool", "threads=" + juce::String(static_cast<int>(poolSize)));
}

TaskScheduler::~TaskScheduler() {
  shutdown();
}

bool TaskScheduler::enqueue(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (shutdown_) {
      logWarning("TaskScheduler", "Task rejected, scheduler is shut down");
      return false;
    }
    taskQueue_.push(std::move(task));
  }
  conditionVariable_.notify_one();
  return true;
}

void TaskScheduler::workerThread() {
  while (true) {
    std::unique_lock<std::mutex> lock(queueMutex_);

    conditionVariable_.wait(lock, [this]() { return !taskQueue_.empty() || shutdown_; });

    if (taskQueue_.empty()) {
      if (shutdown_)
        break;
      continue;
    }

    auto task = std::move(taskQueue_.front());
    taskQueue_.pop();
    activeTaskCount_++;

    lock.unlock();

    try {
      task();
    } catch (const std::exception &e) {
      logError("TaskScheduler", "Background task threw", e.what());
    } catch (...) {
      logError("TaskScheduler", "Background task threw a non-standard exception");
    }

    lock.lock();
    activeTaskCount_--;
    if (taskQueue_.empty() && activeTaskCount_ == 0)
      idleCondition_.notify_all();
  }
}

bool TaskScheduler::waitForAll(int timeoutMs) {
  std::unique_lock<std::mutex> lock(queueMutex_);
  auto idle = [this]() { return taskQueue_.empty() && activeTaskCount_ == 0; };

  if (timeoutMs <= 0) {
    idleCondition_.wait(lock, idle);
    return true;
  }

  return idleCondition_.wait_for(lock, std::chrono::milliseconds(timeoutMs), idle);
}

void TaskScheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(queueMutex_);
    if (shutdown_.exchange(true))
      return;
  }

  conditionVariable_.notify_all();

  for (auto &worker : workers_) {
    if (worker.joinable())
      worker.join();
  }

  workers_.clear();
}

} // namespace Util
} // namespace Feedwise
