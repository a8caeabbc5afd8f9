#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include "docqa_core/async/job_queue.hpp"
#include "docqa_core/async/worker.hpp"
#include "docqa_core/async/worker_pool.hpp"

namespace docqa_tests {

using namespace docqa_core::async;

TEST(JobQueueTest, PopReturnsJobsInOrder) {
  JobQueue queue;
  std::vector<int> seen;
  queue.push([&] { seen.push_back(1); });
  queue.push([&] { seen.push_back(2); });
  EXPECT_EQ(queue.size(), 2u);

  (*queue.pop())();
  (*queue.pop())();
  EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST(JobQueueTest, ClosedQueueDrainsThenReturnsNullopt) {
  JobQueue queue;
  queue.push([] {});
  queue.close();

  EXPECT_TRUE(queue.closed());
  EXPECT_FALSE(queue.push([] {}));
  EXPECT_TRUE(queue.pop().has_value());
  EXPECT_FALSE(queue.pop().has_value());
}

TEST(JobQueueTest, CloseWakesBlockedConsumer) {
  JobQueue queue;
  auto consumer = std::async(std::launch::async, [&] { return queue.pop().has_value(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(25));
  queue.close();
  EXPECT_FALSE(consumer.get());
}

TEST(WorkerTest, RunsJobsUntilQueueCloses) {
  JobQueue queue;
  std::atomic<int> counter{0};
  for (int i = 0; i < 5; ++i) {
    queue.push([&] { counter.fetch_add(1); });
  }
  // A throwing job does not stop the loop.
  queue.push([] { throw std::runtime_error("boom"); });

  Worker worker(0, queue);
  worker.start();
  EXPECT_THROW(worker.start(), std::runtime_error);
  queue.close();
  worker.join();

  EXPECT_EQ(counter.load(), 5);
  EXPECT_EQ(worker.jobs_completed(), 6u);
}

TEST(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0); }, std::invalid_argument);
}

TEST(WorkerPoolTest, StopWithoutStartIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(2);
    pool.stop();
  });
}

TEST(WorkerPoolTest, SubmitReturnsResultThroughFuture) {
  WorkerPool pool(3);
  pool.start();

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 10; ++i) {
    futures.push_back(pool.submit([i] { return i * i; }));
  }
  int total = 0;
  for (auto& future : futures) total += future.get();

  EXPECT_EQ(total, 285);
  EXPECT_EQ(pool.size(), 3u);
}

TEST(WorkerPoolTest, ExceptionsSurfaceFromFuture) {
  WorkerPool pool(1);
  pool.start();
  auto future = pool.submit([]() -> int { throw std::runtime_error("embedding failed"); });
  EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(WorkerPoolTest, StopRunsQueuedJobsThenRejectsNewOnes) {
  WorkerPool pool(1);
  std::atomic<int> counter{0};
  for (int i = 0; i < 4; ++i) {
    pool.submit([&] { counter.fetch_add(1); });
  }
  pool.start();
  pool.stop();

  EXPECT_EQ(counter.load(), 4);
  EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

TEST(WorkerPoolTest, StartTwiceShowsWarningAndNoThrow) {
  EXPECT_NO_THROW({
    WorkerPool pool(1);
    pool.start();
    pool.start();
    pool.stop();
  });
}

}  // namespace docqa_tests
