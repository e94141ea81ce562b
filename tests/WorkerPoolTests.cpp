#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>

#include "../WorkerPool.hpp"

TEST(WorkerCountTest, DisabledMeansOneWorker) {
  ParallelConfig config;
  config.enabled = false;
  config.max_workers = 8;
  EXPECT_EQ(resolve_worker_count(config, 32), 1u);
}

TEST(WorkerCountTest, ExplicitCountIsCapped) {
  ParallelConfig config;
  config.max_workers = 6;
  EXPECT_EQ(resolve_worker_count(config, 2), 6u);
  config.max_workers = 40;
  EXPECT_EQ(resolve_worker_count(config, 2), 16u);
}

TEST(WorkerCountTest, AutoUsesCoresTimesMultiplier) {
  ParallelConfig config;
  config.cpu_multiplier = 2;
  EXPECT_EQ(resolve_worker_count(config, 4), 8u);
  EXPECT_EQ(resolve_worker_count(config, 64), 16u);
  // Unknown core count.
  EXPECT_EQ(resolve_worker_count(config, 0), 8u);
}

TEST(WorkerPoolTest, RunsEveryTaskBeforeDrainReturns) {
  std::atomic<int> done = 0;
  WorkerPool pool(4, 8);
  for (int i = 0; i < 200; ++i) {
    ASSERT_TRUE(pool.submit([&](std::stop_token) { ++done; }));
  }
  pool.drain();
  EXPECT_EQ(done.load(), 200);
  EXPECT_EQ(pool.worker_count(), 4u);
  EXPECT_FALSE(pool.submit([](std::stop_token) {}));
}

TEST(WorkerPoolTest, StopDropsQueuedWorkAndSignalsRunningTasks) {
  std::atomic<int> ran = 0;
  std::atomic<bool> saw_stop = false;
  std::promise<void> started;
  std::promise<void> release;
  std::shared_future<void> released = release.get_future().share();

  WorkerPool pool(1, 16);
  ASSERT_TRUE(pool.submit([&](std::stop_token stoken) {
    ++ran;
    started.set_value();
    released.wait();
    saw_stop = stoken.stop_requested();
  }));
  started.get_future().wait();

  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(pool.submit([&](std::stop_token) { ++ran; }));
  }
  pool.request_stop();
  EXPECT_TRUE(pool.stop_requested());
  EXPECT_FALSE(pool.submit([&](std::stop_token) { ++ran; }));

  release.set_value();
  pool.drain();

  EXPECT_EQ(ran.load(), 1);
  EXPECT_TRUE(saw_stop);
  EXPECT_EQ(pool.dropped(), 10u);
}

TEST(WorkerPoolTest, ThrowingTaskDoesNotKillItsWorker) {
  std::atomic<int> done = 0;
  WorkerPool pool(1, 4);
  pool.submit([](std::stop_token) { throw std::runtime_error("boom"); });
  pool.submit([&](std::stop_token) { ++done; });
  pool.drain();
  EXPECT_EQ(done.load(), 1);
}

TEST(WorkerPoolTest, DestructorDrains) {
  std::atomic<int> done = 0;
  {
    WorkerPool pool(2, 2);
    for (int i = 0; i < 20; ++i) {
      pool.submit([&](std::stop_token) { ++done; });
    }
  }
  EXPECT_EQ(done.load(), 20);
}
