#include <lark/worker_pool.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

namespace {

using namespace std::chrono_literals;

TEST(WorkerPool, RunsJobs) {
  lark::WorkerPool pool{2, 16};
  std::atomic<int> count {0};
  std::promise<void> done;

  for (int i = 0; i < 10; i++) {
    ASSERT_TRUE(pool.submit([&](std::stop_token) {
      if (++count == 10) done.set_value();
    }));
  }
  ASSERT_EQ(done.get_future().wait_for(10s), std::future_status::ready);
  pool.shutdown();
  EXPECT_EQ(count, 10);
}

TEST(WorkerPool, RejectsWhenFull) {
  lark::WorkerPool pool{1, 2};
  std::promise<void> release;
  auto gate = release.get_future().share();

  EXPECT_TRUE(pool.submit([gate](std::stop_token) { gate.wait(); }));
  EXPECT_TRUE(pool.submit([gate](std::stop_token) { gate.wait(); }));
  EXPECT_FALSE(pool.submit([](std::stop_token) {}));
  EXPECT_EQ(pool.pending(), 2u);

  release.set_value();
  pool.shutdown();
}

TEST(WorkerPool, ShutdownSignalsStopToken) {
  lark::WorkerPool pool{1, 4};
  std::promise<void> started;
  std::atomic<bool> saw_stop {false};

  ASSERT_TRUE(pool.submit([&](std::stop_token const stop) {
    started.set_value();
    while (not stop.stop_requested()) {
      std::this_thread::sleep_for(1ms);
    }
    saw_stop = true;
  }));

  ASSERT_EQ(started.get_future().wait_for(10s), std::future_status::ready);
  pool.shutdown();
  EXPECT_TRUE(saw_stop);
  EXPECT_TRUE(pool.token().stop_requested());
}

TEST(WorkerPool, RejectsAfterShutdown) {
  lark::WorkerPool pool{1, 4};
  pool.shutdown();
  pool.shutdown();
  EXPECT_FALSE(pool.submit([](std::stop_token) {}));
}

TEST(WorkerPool, JobExceptionDoesNotLeakSlot) {
  lark::WorkerPool pool{1, 1};
  std::promise<void> done;

  ASSERT_TRUE(pool.submit([](std::stop_token) { throw std::runtime_error{"job failed"}; }));
  // the single slot frees up once the failing job finishes
  bool queued = false;
  for (int i = 0; i < 1000 && not queued; i++) {
    queued = pool.submit([&done](std::stop_token) { done.set_value(); });
    if (not queued) std::this_thread::sleep_for(1ms);
  }
  ASSERT_TRUE(queued);
  EXPECT_EQ(done.get_future().wait_for(10s), std::future_status::ready);
  pool.shutdown();
}

TEST(WorkerPool, NonStandardExceptionIsContained) {
  lark::WorkerPool pool{1, 4};
  std::promise<void> done;

  ASSERT_TRUE(pool.submit([](std::stop_token) { throw 42; }));
  ASSERT_TRUE(pool.submit([&done](std::stop_token) { done.set_value(); }));
  EXPECT_EQ(done.get_future().wait_for(10s), std::future_status::ready);
  pool.shutdown();
}

TEST(WorkerPool, Capacity) {
  lark::WorkerPool pool{0, 0};
  EXPECT_EQ(pool.capacity(), 1u);
}

}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
