#pragma once

#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

#include "internal/uniq/task_queue.hpp"

namespace mc3d::uniq {

/*
  Fixed-size pool of worker threads.

  Each submitted task runs on exactly one worker; its result or exception
  is delivered through the returned future.
*/
class WorkerPool {
 public:
  explicit WorkerPool(size_t workers);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename Fn>
  std::future<std::invoke_result_t<Fn>> Submit(Fn&& fn) {
    using Result = std::invoke_result_t<Fn>;

    auto task   = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    queue_.Enqueue([task] { (*task)(); });
    return future;
  }

  // Finishes queued tasks, then joins the workers.
  void Stop();

  size_t Size() const {
    return threads_.size();
  }

 private:
  void Run();

  TaskQueue                queue_;
  std::vector<std::thread> threads_;
};

} // namespace mc3d::uniq
