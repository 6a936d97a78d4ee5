#include "transfer_service.hpp"

#include <chrono>

#include "internal/core/transfer_process_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/transfer_process_store.hpp"
#include "internal/util/errors.hpp"

namespace transfer::service {

using namespace transfer::manager::v1;

namespace {

// Runs one RPC body, logging failures with the route and elapsed time before rethrowing.
template <typename Fn>
auto Traced(const char* route, Fn&& fn) -> decltype(fn()) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    return fn();
  } catch (const std::exception& ex) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at);
    TRANSFER_LOG_ERROR("RPC failed", {transfer::observability::StringField("route", route),
                                      transfer::observability::StringField("error", ex.what()),
                                      transfer::observability::IntField("elapsed_ms", elapsed.count())});
    throw;
  }
}

} // namespace

TransferService::TransferService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.manager || !ctx_.store) {
    throw util::ConfigurationError("transfer service requires a manager and a store");
  }
}

TransferInitiateResponse TransferService::InitiateClientRequest(const InitiateTransferRequest& req) {
  return Traced("TransferService.InitiateClientRequest", [&] { return ctx_.manager->InitiateClientRequest(req.data_request()); });
}

TransferInitiateResponse TransferService::InitiateProviderRequest(const InitiateTransferRequest& req) {
  return Traced("TransferService.InitiateProviderRequest", [&] { return ctx_.manager->InitiateProviderRequest(req.data_request()); });
}

GetTransferProcessResponse TransferService::GetTransferProcess(const GetTransferProcessRequest& req) {
  return Traced("TransferService.GetTransferProcess", [&] {
    if (req.id().empty()) {
      throw util::InvalidState("transfer process id is required");
    }
    auto process = ctx_.store->Find(req.id());
    if (!process) {
      throw util::NotFound("transfer process " + req.id());
    }
    GetTransferProcessResponse resp;
    *resp.mutable_process() = process->ToDescriptor();
    return resp;
  });
}

ListTransferProcessesResponse TransferService::ListTransferProcesses(const ListTransferProcessesRequest& req) {
  return Traced("TransferService.ListTransferProcesses", [&] {
    ListTransferProcessesResponse resp;
    for (const auto& process : ctx_.store->List()) {
      if (req.has_state() && process.State() != req.state()) {
        continue;
      }
      if (req.limit() > 0 && static_cast<uint32_t>(resp.processes_size()) >= req.limit()) {
        break;
      }
      *resp.add_processes() = process.ToDescriptor();
    }
    return resp;
  });
}

} // namespace transfer::service
