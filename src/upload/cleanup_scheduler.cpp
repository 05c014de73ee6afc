#include "chunkforge/upload/cleanup_scheduler.hpp"
#include "chunkforge/utilities/logger.h"

#include <algorithm>

namespace chunkforge {

CleanupScheduler::~CleanupScheduler() { stop(); }

void CleanupScheduler::start() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (running_)
    return;
  running_ = true;
  worker_ = std::thread(&CleanupScheduler::threadFunc, this);
}

void CleanupScheduler::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable())
    worker_.join();
  flush();
}

void CleanupScheduler::schedule(std::chrono::milliseconds delay,
                                const std::string &label, Task task) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    queue_.push_back(Entry{Clock::now() + delay, label, std::move(task)});
  }
  cv_.notify_all();
}

void CleanupScheduler::flush() {
  std::vector<Entry> batch;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    batch.swap(queue_);
  }
  for (const auto &entry : batch) {
    runTask(entry);
  }
}

std::size_t CleanupScheduler::pending() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return queue_.size();
}

void CleanupScheduler::runTask(const Entry &entry) {
  try {
    entry.task();
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::WARN, "Cleanup task '" + entry.label +
                                                  "' failed: " + e.what());
  }
}

void CleanupScheduler::threadFunc() {
  std::unique_lock<std::mutex> lk(mtx_);
  while (running_) {
    if (queue_.empty()) {
      cv_.wait(lk, [this] { return !running_ || !queue_.empty(); });
      continue;
    }
    auto next = std::min_element(
        queue_.begin(), queue_.end(),
        [](const Entry &a, const Entry &b) { return a.due < b.due; });
    if (next->due > Clock::now()) {
      cv_.wait_until(lk, next->due);
      continue;
    }
    Entry entry = std::move(*next);
    queue_.erase(next);
    lk.unlock();
    runTask(entry);
    lk.lock();
  }
}

} // namespace chunkforge
