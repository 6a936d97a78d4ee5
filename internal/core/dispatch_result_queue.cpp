#include "dispatch_result_queue.hpp"

#include <iterator>

namespace transfer::core {

void DispatchResultQueue::Push(DispatchOutcome outcome) {
  {
    std::lock_guard lock(mutex_);
    queue_.push_back(std::move(outcome));
  }
  cv_.notify_all();
}

std::vector<DispatchOutcome> DispatchResultQueue::Drain() {
  std::lock_guard lock(mutex_);
  std::vector<DispatchOutcome> out(std::make_move_iterator(queue_.begin()), std::make_move_iterator(queue_.end()));
  queue_.clear();
  return out;
}

void DispatchResultQueue::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return woken_ || !queue_.empty(); });

  woken_ = false;
}

void DispatchResultQueue::Wake() {
  {
    std::lock_guard lock(mutex_);
    woken_ = true;
  }
  cv_.notify_all();
}

std::size_t DispatchResultQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace transfer::core
