#include "docqa_core/async/job_queue.hpp"

namespace docqa_core::async {

bool JobQueue::push(Job job) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
      return false;
    }
    m_jobs.push_back(std::move(job));
  }
  m_cv.notify_one();
  return true;
}

std::optional<Job> JobQueue::pop() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_cv.wait(lock, [this] { return m_closed || !m_jobs.empty(); });
  if (m_jobs.empty()) {
    return std::nullopt;
  }
  Job job = std::move(m_jobs.front());
  m_jobs.pop_front();
  return job;
}

void JobQueue::close() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
  }
  m_cv.notify_all();
}

bool JobQueue::closed() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_closed;
}

size_t JobQueue::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_jobs.size();
}

}  // namespace docqa_core::async
