#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace docqa_core::async {

using Job = std::function<void()>;

// Multi-producer, multi-consumer FIFO shared by the workers of a pool.
// After close(), pop() keeps returning queued jobs and then std::nullopt.
class JobQueue {
 public:
  // Returns false once the queue is closed.
  bool push(Job job);

  // Blocks until a job is available or the queue is closed and drained.
  std::optional<Job> pop();

  void close();
  bool closed() const;
  size_t size() const;

 private:
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<Job> m_jobs;
  bool m_closed = false;
};

}  // namespace docqa_core::async
