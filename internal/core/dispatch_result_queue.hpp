#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "internal/dispatch/remote_message_dispatcher.hpp"

namespace transfer::core {

struct DispatchOutcome {
  std::string              process_id;
  dispatch::DispatchResult result;
};

/*
  Hands dispatch completions from transport threads back to the manager loop.

  Also serves as the loop's interruptible sleep: WaitFor returns early when a
  result arrives or Wake() is called.
*/
class DispatchResultQueue {
 public:
  void Push(DispatchOutcome outcome);

  std::vector<DispatchOutcome> Drain();

  void WaitFor(std::chrono::milliseconds timeout);

  // Cuts the current (or next) WaitFor short.
  void Wake();

  std::size_t Size() const;

 private:
  mutable std::mutex          mutex_;
  std::condition_variable     cv_;
  std::deque<DispatchOutcome> queue_;
  bool                        woken_ = false;
};

} // namespace transfer::core
