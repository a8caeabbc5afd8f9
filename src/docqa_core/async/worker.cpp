#include "docqa_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

namespace docqa_core::async {

Worker::Worker(int worker_id, JobQueue& queue) : worker_id_(worker_id), queue_(queue) {}

Worker::~Worker() {
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  while (auto job = queue_.pop()) {
    try {
      (*job)();
    } catch (const std::exception& e) {
      // Jobs submitted through the pool report through their future; this
      // only catches raw jobs that throw.
      std::cerr << "Worker [" << worker_id_ << "] ERROR running job: " << e.what() << std::endl;
    }
    jobs_completed_.fetch_add(1);
  }
}

}  // namespace docqa_core::async
