#include "internal/uniq/worker_pool.hpp"

#include <stdexcept>

namespace mc3d::uniq {

WorkerPool::WorkerPool(size_t workers) {
  if (workers == 0) {
    throw std::invalid_argument("worker pool needs at least one worker");
  }

  threads_.reserve(workers);
  for (size_t i = 0; i < workers; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Stop() {
  queue_.Shutdown();
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
}

void WorkerPool::Run() {
  while (true) {
    auto task = queue_.Dequeue();
    if (!task) break;

    // packaged_task stores exceptions in the future
    (*task)();
  }
}

} // namespace mc3d::uniq
