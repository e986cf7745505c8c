#include "internal/uniq/progress_channel.hpp"

#include <stdexcept>

namespace mc3d::uniq {

ProgressChannel::ProgressChannel(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("progress channel capacity must be positive");
  }
}

bool ProgressChannel::Send(std::string bucket_key) {
  std::unique_lock lock(mutex_);

  not_full_.wait(lock, [&] { return closed_ || queue_.size() < capacity_; });

  if (closed_) return false;

  queue_.push_back(std::move(bucket_key));
  return true;
}

std::vector<std::string> ProgressChannel::Drain() {
  std::vector<std::string> out;
  {
    std::lock_guard lock(mutex_);
    out.assign(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
    queue_.clear();
  }
  not_full_.notify_all();
  return out;
}

void ProgressChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_full_.notify_all();
}

} // namespace mc3d::uniq
