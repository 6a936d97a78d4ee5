#pragma once

#include <functional>
#include <string>

#include "transfer/manager/core/v1/types.pb.h"

namespace transfer::dispatch {

struct DispatchResult {
  bool                                                  ok = false;
  std::string                                           error;
  transfer::manager::core::v1::TransferInitiateResponse response;

  static DispatchResult Ok(transfer::manager::core::v1::TransferInitiateResponse response) {
    return {true, {}, std::move(response)};
  }

  static DispatchResult Failed(std::string error) {
    return {false, std::move(error), {}};
  }
};

// Invoked exactly once per Send, possibly on a transport thread.
using DispatchCallback = std::function<void(DispatchResult)>;

/*
  Delivers a data request to the remote connector named in it over one
  protocol. Send must not block on the remote side.
*/
class RemoteMessageDispatcher {
 public:
  virtual ~RemoteMessageDispatcher() = default;

  virtual std::string Protocol() const = 0;

  virtual void Send(const transfer::manager::core::v1::DataRequest& request, DispatchCallback done) = 0;
};

} // namespace transfer::dispatch
