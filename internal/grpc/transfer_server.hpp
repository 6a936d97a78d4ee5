#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/transfer_service.hpp"
#include "transfer/manager/services/v1/transfer_service.grpc.pb.h"

namespace transfer::grpc {

class TransferServer final : public transfer::manager::services::v1::TransferService::Service {
 public:
  explicit TransferServer(std::shared_ptr<transfer::service::TransferService> svc);

  ::grpc::Status InitiateClientRequest(::grpc::ServerContext*, const transfer::manager::v1::InitiateTransferRequest*,
                                       transfer::manager::v1::TransferInitiateResponse*) override;

  ::grpc::Status InitiateProviderRequest(::grpc::ServerContext*, const transfer::manager::v1::InitiateTransferRequest*,
                                         transfer::manager::v1::TransferInitiateResponse*) override;

  ::grpc::Status GetTransferProcess(::grpc::ServerContext*, const transfer::manager::v1::GetTransferProcessRequest*,
                                    transfer::manager::v1::GetTransferProcessResponse*) override;

  ::grpc::Status ListTransferProcesses(::grpc::ServerContext*, const transfer::manager::v1::ListTransferProcessesRequest*,
                                       transfer::manager::v1::ListTransferProcessesResponse*) override;

 private:
  std::shared_ptr<transfer::service::TransferService> service_;
};

} // namespace transfer::grpc
