#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "remote_message_dispatcher.hpp"
#include "transfer/manager/services/v1/transfer_service.grpc.pb.h"

namespace transfer::dispatch {

inline constexpr const char* kGrpcProtocol = "grpc";

/*
  Sends the data request to the remote connector's
  TransferService.InitiateProviderRequest using the callback API.

  One channel is kept per connector address. A non-OK remote status is
  reported as a failure.
*/
class GrpcRemoteMessageDispatcher final : public RemoteMessageDispatcher {
 public:
  explicit GrpcRemoteMessageDispatcher(std::chrono::milliseconds deadline);

  std::string Protocol() const override { return kGrpcProtocol; }

  void Send(const transfer::manager::core::v1::DataRequest& request, DispatchCallback done) override;

 private:
  using Stub = transfer::manager::services::v1::TransferService::Stub;

  std::shared_ptr<Stub> StubFor(const std::string& address);

  std::chrono::milliseconds deadline_;

  std::mutex                                             mutex_;
  std::unordered_map<std::string, std::shared_ptr<Stub>> stubs_;
};

} // namespace transfer::dispatch
