#include "transfer_server.hpp"

#include "grpc_error.hpp"

namespace transfer::grpc {

using namespace transfer::manager::v1;

TransferServer::TransferServer(std::shared_ptr<transfer::service::TransferService> svc) : service_(std::move(svc)) {
}

::grpc::Status TransferServer::InitiateClientRequest(::grpc::ServerContext*, const InitiateTransferRequest* req,
                                                     TransferInitiateResponse* resp) {
  try {
    *resp = service_->InitiateClientRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::InitiateProviderRequest(::grpc::ServerContext*, const InitiateTransferRequest* req,
                                                       TransferInitiateResponse* resp) {
  try {
    *resp = service_->InitiateProviderRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::GetTransferProcess(::grpc::ServerContext*, const GetTransferProcessRequest* req,
                                                  GetTransferProcessResponse* resp) {
  try {
    *resp = service_->GetTransferProcess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TransferServer::ListTransferProcesses(::grpc::ServerContext*, const ListTransferProcessesRequest* req,
                                                     ListTransferProcessesResponse* resp) {
  try {
    *resp = service_->ListTransferProcesses(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace transfer::grpc
