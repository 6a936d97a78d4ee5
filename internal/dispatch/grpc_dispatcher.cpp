#include "grpc_dispatcher.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace transfer::dispatch {

using namespace transfer::manager::core::v1;
using transfer::manager::services::v1::InitiateTransferRequest;
using transfer::manager::services::v1::TransferService;

namespace {

// Owns everything the async call touches until its completion fires.
struct PendingCall {
  ::grpc::ClientContext                   context;
  InitiateTransferRequest                 request;
  TransferInitiateResponse                response;
  std::shared_ptr<TransferService::Stub>  stub;
  DispatchCallback                        done;
};

} // namespace

GrpcRemoteMessageDispatcher::GrpcRemoteMessageDispatcher(std::chrono::milliseconds deadline) : deadline_(deadline) {
  if (deadline_.count() <= 0) {
    throw util::ConfigurationError("grpc dispatch deadline must be positive");
  }
}

std::shared_ptr<GrpcRemoteMessageDispatcher::Stub> GrpcRemoteMessageDispatcher::StubFor(const std::string& address) {
  std::lock_guard lock(mutex_);
  auto it = stubs_.find(address);
  if (it != stubs_.end()) {
    return it->second;
  }
  auto channel = ::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials());
  std::shared_ptr<Stub> stub = TransferService::NewStub(channel);
  stubs_.emplace(address, stub);
  return stub;
}

void GrpcRemoteMessageDispatcher::Send(const DataRequest& request, DispatchCallback done) {
  if (request.connector_address().empty()) {
    done(DispatchResult::Failed("data request has no connector address"));
    return;
  }

  auto call  = std::make_shared<PendingCall>();
  call->stub = StubFor(request.connector_address());
  call->done = std::move(done);
  *call->request.mutable_data_request() = request;
  call->context.set_deadline(std::chrono::system_clock::now() + deadline_);

  TRANSFER_LOG_DEBUG("Dispatching data request", {observability::StringField("process_id", request.process_id()),
                                                 observability::StringField("address", request.connector_address())});

  call->stub->async()->InitiateProviderRequest(&call->context, &call->request, &call->response,
                                               [call](::grpc::Status status) {
                                                 if (!status.ok()) {
                                                   call->done(DispatchResult::Failed("grpc " + std::to_string(status.error_code()) +
                                                                                     ": " + status.error_message()));
                                                   return;
                                                 }
                                                 if (call->response.status() != RESPONSE_STATUS_OK) {
                                                   std::string detail = call->response.error().empty()
                                                                            ? ResponseStatus_Name(call->response.status())
                                                                            : call->response.error();
                                                   call->done(DispatchResult::Failed("remote rejected request: " + detail));
                                                   return;
                                                 }
                                                 call->done(DispatchResult::Ok(call->response));
                                               });
}

} // namespace transfer::dispatch
