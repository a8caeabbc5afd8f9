#pragma once

#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include "docqa_core/async/job_queue.hpp"
#include "docqa_core/async/worker.hpp"

namespace docqa_core::async {

/**
 * @class WorkerPool
 * @brief Fixed set of Worker threads draining one shared JobQueue.
 *
 * Owns the whole thread lifecycle: workers start with start(), and stop()
 * (or the destructor) closes the queue and joins them once queued jobs have
 * run.
 */
class WorkerPool {
 public:
  /**
   * @throws std::invalid_argument when num_threads is 0.
   */
  explicit WorkerPool(size_t num_threads);

  ~WorkerPool();

  void start();

  /**
   * @brief Closes the queue and blocks until every worker has exited.
   */
  void stop();

  /**
   * @brief Queues a callable. Exceptions it throws surface from the future.
   * @throws std::runtime_error if the pool has been stopped.
   */
  template <typename Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> future = task->get_future();
    if (!m_queue.push([task] { (*task)(); })) {
      throw std::runtime_error("WorkerPool is stopped.");
    }
    return future;
  }

  size_t size() const { return m_workers.size(); }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  JobQueue m_queue;
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace docqa_core::async
