#include "wait_strategy.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace transfer::core {

FixedWaitStrategy::FixedWaitStrategy(std::chrono::milliseconds wait) : wait_(wait) {
  if (wait_.count() < 0) {
    throw util::ConfigurationError("wait duration must not be negative");
  }
}

ExponentialWaitStrategy::ExponentialWaitStrategy(std::chrono::milliseconds initial, std::chrono::milliseconds max)
    : initial_(initial), max_(max), next_(initial) {
  if (initial_.count() <= 0) {
    throw util::ConfigurationError("exponential wait needs a positive initial duration");
  }
  if (max_ < initial_) {
    throw util::ConfigurationError("exponential wait max must be >= initial");
  }
}

std::chrono::milliseconds ExponentialWaitStrategy::WaitFor() {
  std::lock_guard lock(mutex_);
  const auto current = next_;
  next_ = std::min(next_ * 2, max_);
  return current;
}

void ExponentialWaitStrategy::Success() {
  std::lock_guard lock(mutex_);
  next_ = initial_;
}

} // namespace transfer::core
