#include "dispatcher_registry.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace transfer::dispatch {

void RemoteMessageDispatcherRegistry::Register(std::shared_ptr<RemoteMessageDispatcher> dispatcher) {
  if (!dispatcher) {
    throw std::invalid_argument("dispatcher is null");
  }
  auto protocol = dispatcher->Protocol();
  if (protocol.empty()) {
    throw std::invalid_argument("dispatcher protocol is empty");
  }

  std::lock_guard lock(mutex_);
  dispatchers_[protocol] = std::move(dispatcher);
}

bool RemoteMessageDispatcherRegistry::Supports(const std::string& protocol) const {
  return Find(protocol) != nullptr;
}

std::shared_ptr<RemoteMessageDispatcher> RemoteMessageDispatcherRegistry::Find(const std::string& protocol) const {
  std::lock_guard lock(mutex_);
  auto it = dispatchers_.find(protocol);
  return it == dispatchers_.end() ? nullptr : it->second;
}

void RemoteMessageDispatcherRegistry::Send(const transfer::manager::core::v1::DataRequest& request, DispatchCallback done) {
  auto dispatcher = Find(request.protocol());
  if (!dispatcher) {
    TRANSFER_LOG_WARN("No dispatcher for protocol", {observability::StringField("protocol", request.protocol()),
                                                    observability::StringField("process_id", request.process_id())});
    done(DispatchResult::Failed("no dispatcher registered for protocol '" + request.protocol() + "'"));
    return;
  }
  dispatcher->Send(request, std::move(done));
}

} // namespace transfer::dispatch
