#pragma once

#include "service_context.hpp"
#include "transfer/manager/v1.hpp"

namespace transfer::service {

/*
  Transport-independent operations behind the TransferService RPCs.

  Errors surface as util exceptions; the gRPC adapter maps them to status codes.
*/
class TransferService {
 public:
  explicit TransferService(ServiceContext ctx);

  transfer::manager::v1::TransferInitiateResponse InitiateClientRequest(const transfer::manager::v1::InitiateTransferRequest& req);

  transfer::manager::v1::TransferInitiateResponse InitiateProviderRequest(const transfer::manager::v1::InitiateTransferRequest& req);

  transfer::manager::v1::GetTransferProcessResponse GetTransferProcess(const transfer::manager::v1::GetTransferProcessRequest& req);

  transfer::manager::v1::ListTransferProcessesResponse ListTransferProcesses(
      const transfer::manager::v1::ListTransferProcessesRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace transfer::service
