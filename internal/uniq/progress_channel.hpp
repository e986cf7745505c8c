#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace mc3d::uniq {

/*
  Bounded one-way channel from workers to the coordinator.

  Workers announce the bucket they start; the coordinator drains without
  blocking. Send blocks while the channel is full.
*/
class ProgressChannel {
 public:
  explicit ProgressChannel(size_t capacity = 1024);

  // Returns false once the channel is closed.
  bool Send(std::string bucket_key);

  // Never blocks.
  std::vector<std::string> Drain();

  // Wakes blocked senders; later sends are dropped.
  void Close();

  size_t Capacity() const {
    return capacity_;
  }

 private:
  const size_t capacity_;

  std::mutex              mutex_;
  std::condition_variable not_full_;
  std::deque<std::string> queue_;
  bool                    closed_ = false;
};

} // namespace mc3d::uniq
