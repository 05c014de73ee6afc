#include "chunkforge/upload/cleanup_scheduler.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace chunkforge;
using namespace std::chrono_literals;

TEST(CleanupScheduler, RunsTaskAfterDelay) {
  CleanupScheduler scheduler;
  scheduler.start();
  std::atomic<int> runs{0};
  scheduler.schedule(50ms, "count", [&] { ++runs; });
  EXPECT_EQ(runs.load(), 0);
  EXPECT_EQ(scheduler.pending(), 1u);

  for (int i = 0; i < 200 && runs.load() == 0; ++i)
    std::this_thread::sleep_for(10ms);
  EXPECT_EQ(runs.load(), 1);
  EXPECT_EQ(scheduler.pending(), 0u);
  scheduler.stop();
}

TEST(CleanupScheduler, EarlierDeadlineRunsFirst) {
  CleanupScheduler scheduler;
  std::vector<int> order;
  std::mutex m;
  scheduler.schedule(200ms, "late", [&] {
    std::lock_guard<std::mutex> lk(m);
    order.push_back(2);
  });
  scheduler.schedule(20ms, "early", [&] {
    std::lock_guard<std::mutex> lk(m);
    order.push_back(1);
  });
  scheduler.start();
  std::this_thread::sleep_for(400ms);
  scheduler.stop();
  ASSERT_EQ(order.size(), 2u);
  EXPECT_EQ(order[0], 1);
  EXPECT_EQ(order[1], 2);
}

TEST(CleanupScheduler, StopFlushesPendingTasks) {
  CleanupScheduler scheduler;
  scheduler.start();
  std::atomic<int> runs{0};
  scheduler.schedule(std::chrono::hours(1), "far", [&] { ++runs; });
  scheduler.stop();
  EXPECT_EQ(runs.load(), 1);
  EXPECT_EQ(scheduler.pending(), 0u);
}

TEST(CleanupScheduler, FailingTaskDoesNotStopWorker) {
  CleanupScheduler scheduler;
  scheduler.start();
  std::atomic<int> runs{0};
  scheduler.schedule(0ms, "boom", [] { throw std::runtime_error("disk gone"); });
  scheduler.schedule(10ms, "after", [&] { ++runs; });
  for (int i = 0; i < 200 && runs.load() == 0; ++i)
    std::this_thread::sleep_for(10ms);
  EXPECT_EQ(runs.load(), 1);
  scheduler.stop();
}

TEST(CleanupScheduler, FlushWithoutStart) {
  CleanupScheduler scheduler;
  std::atomic<int> runs{0};
  scheduler.schedule(1h, "a", [&] { ++runs; });
  scheduler.schedule(1h, "b", [&] { ++runs; });
  EXPECT_EQ(scheduler.pending(), 2u);
  scheduler.flush();
  EXPECT_EQ(runs.load(), 2);
}
