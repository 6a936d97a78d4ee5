#pragma once

#include <chrono>
#include <mutex>

namespace transfer::core {

/*
  Decides how long the manager loop idles after an iteration that found no
  work. Success() is reported after every iteration that did.
*/
class WaitStrategy {
 public:
  virtual ~WaitStrategy() = default;

  virtual std::chrono::milliseconds WaitFor() = 0;

  virtual void Success() {}
};

class FixedWaitStrategy final : public WaitStrategy {
 public:
  static constexpr std::chrono::milliseconds kDefaultWait{5000};

  explicit FixedWaitStrategy(std::chrono::milliseconds wait = kDefaultWait);

  std::chrono::milliseconds WaitFor() override { return wait_; }

 private:
  std::chrono::milliseconds wait_;
};

// Doubles on every consecutive idle iteration up to max; Success() resets.
class ExponentialWaitStrategy final : public WaitStrategy {
 public:
  ExponentialWaitStrategy(std::chrono::milliseconds initial, std::chrono::milliseconds max);

  std::chrono::milliseconds WaitFor() override;
  void                      Success() override;

 private:
  const std::chrono::milliseconds initial_;
  const std::chrono::milliseconds max_;

  std::mutex                mutex_;
  std::chrono::milliseconds next_;
};

} // namespace transfer::core
