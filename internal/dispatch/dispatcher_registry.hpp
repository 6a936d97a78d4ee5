#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "remote_message_dispatcher.hpp"

namespace transfer::dispatch {

/*
  Picks the dispatcher for a request by its protocol.

  Registering a protocol twice replaces the earlier dispatcher.
*/
class RemoteMessageDispatcherRegistry {
 public:
  virtual ~RemoteMessageDispatcherRegistry() = default;

  void Register(std::shared_ptr<RemoteMessageDispatcher> dispatcher);

  bool Supports(const std::string& protocol) const;

  // Unknown protocols complete with a failure instead of throwing.
  virtual void Send(const transfer::manager::core::v1::DataRequest& request, DispatchCallback done);

 private:
  std::shared_ptr<RemoteMessageDispatcher> Find(const std::string& protocol) const;

  mutable std::mutex                                                        mutex_;
  std::unordered_map<std::string, std::shared_ptr<RemoteMessageDispatcher>> dispatchers_;
};

} // namespace transfer::dispatch
