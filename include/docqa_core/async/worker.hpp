#pragma once

#include <atomic>
#include <thread>

#include "docqa_core/async/job_queue.hpp"

namespace docqa_core::async {

/**
 * @class Worker
 * @brief A single background thread that runs jobs from a shared JobQueue.
 *
 * Managed by a WorkerPool. Non-copyable and non-movable so the thread has a
 * single owner.
 */
class Worker {
 public:
  Worker(int worker_id, JobQueue& queue);

  /**
   * @brief Joins the thread. The loop exits once the queue is closed and
   * drained, so queued jobs still run.
   */
  ~Worker();

  /**
   * @brief Starts the run loop in a new thread. Throws if already running.
   */
  void start();

  void join();

  size_t jobs_completed() const { return jobs_completed_.load(); }

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  JobQueue& queue_;
  std::atomic<size_t> jobs_completed_{0};
  std::thread thread_;
};

}  // namespace docqa_core::async
