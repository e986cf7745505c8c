#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>

namespace mc3d::uniq {

/*
  Thread-safe blocking queue feeding the worker pool.
*/
class TaskQueue {
 public:
  using Task = std::function<void()>;

  void Enqueue(Task task);

  // blocking wait; nullopt once shut down and drained
  std::optional<Task> Dequeue();

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::queue<Task>        queue_;
  bool                    shutdown_ = false;
};

} // namespace mc3d::uniq
