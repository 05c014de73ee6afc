#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace chunkforge {

/**
 * @brief Runs delayed housekeeping tasks on a background thread.
 *
 * Tasks are advisory: an exception thrown by a task is logged and
 * discarded. Pending tasks run on flush() and when the scheduler stops.
 */
class CleanupScheduler {
public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;

  CleanupScheduler() = default;
  ~CleanupScheduler();

  CleanupScheduler(const CleanupScheduler &) = delete;
  CleanupScheduler &operator=(const CleanupScheduler &) = delete;

  /** Start the background thread. */
  void start();
  /** Run every pending task, then stop the background thread. */
  void stop();

  /**
   * @brief Queue @p task to run once @p delay has elapsed.
   *
   * If the scheduler is not running the task is kept until start() or
   * flush().
   */
  void schedule(std::chrono::milliseconds delay, const std::string &label,
                Task task);

  /** Run every pending task now, regardless of its due time. */
  void flush();

  /** Number of tasks still waiting. */
  std::size_t pending() const;

private:
  struct Entry {
    Clock::time_point due;
    std::string label;
    Task task;
  };

  void threadFunc();
  static void runTask(const Entry &entry);

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::vector<Entry> queue_;
  bool running_ = false;
  std::thread worker_;
};

} // namespace chunkforge
