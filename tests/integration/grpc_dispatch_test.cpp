#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "internal/core/transfer_process_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/dispatcher_registry.hpp"
#include "internal/dispatch/grpc_dispatcher.hpp"
#include "internal/flow/data_flow_manager.hpp"
#include "internal/grpc/transfer_server.hpp"
#include "internal/observability/monitor.hpp"
#include "internal/provision/manifest_generator.hpp"
#include "internal/provision/provision_manager.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/transfer_service.hpp"
#include "internal/store/repository_store.hpp"
#include "transfer/manager/v1.hpp"

namespace {

using namespace transfer::manager::v1;

struct Connector {
  std::shared_ptr<transfer::store::RepositoryTransferProcessStore> store;
  std::shared_ptr<transfer::core::TransferProcessManager>          manager;
};

Connector BuildConnector(std::chrono::milliseconds deadline) {
  auto store   = std::make_shared<transfer::store::RepositoryTransferProcessStore>(std::make_shared<transfer::db::memory::MemoryRepository>());
  auto monitor = std::make_shared<transfer::observability::LogMonitor>();

  auto registry = std::make_shared<transfer::dispatch::RemoteMessageDispatcherRegistry>();
  registry->Register(std::make_shared<transfer::dispatch::GrpcRemoteMessageDispatcher>(deadline));

  transfer::core::TransferProcessManagerConfig config;
  config.manifest_generator  = std::make_shared<transfer::provision::RegistryManifestGenerator>();
  config.provision_manager   = std::make_shared<transfer::provision::ProvisionManagerImpl>(store, monitor);
  config.dispatcher_registry = registry;
  config.data_flow_manager   = std::make_shared<transfer::flow::DataFlowManagerImpl>();
  config.monitor             = monitor;

  Connector connector;
  connector.store   = store;
  connector.manager = std::make_shared<transfer::core::TransferProcessManager>(config);
  connector.manager->AttachStore(store);
  return connector;
}

std::unique_ptr<transfer::runtime::Server> StartProviderServer(const Connector& provider) {
  transfer::service::ServiceContext ctx;
  ctx.manager = provider.manager;
  ctx.store   = provider.store;

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<transfer::grpc::TransferServer>(std::make_shared<transfer::service::TransferService>(ctx)));

  auto server = std::make_unique<transfer::runtime::Server>("127.0.0.1:0", std::move(services));
  server->Start();
  assert(server->SelectedPort() > 0);
  return server;
}

bool WaitForResults(const transfer::core::TransferProcessManager& manager, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (manager.PendingDispatchResults() > 0) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

DataRequest ClientRequest(const std::string& connector_address) {
  DataRequest request;
  request.set_id("request-" + connector_address);
  request.set_connector_address(connector_address);
  request.set_protocol(transfer::dispatch::kGrpcProtocol);
  request.mutable_data_entry()->set_id("entry-1");
  request.mutable_data_entry()->mutable_catalog_address()->set_type("file");
  request.mutable_data_destination()->set_type("file");
  return request;
}

void TestClientRequestReachesRemoteConnector() {
  auto provider = BuildConnector(std::chrono::milliseconds(5000));
  auto server   = StartProviderServer(provider);

  auto client   = BuildConnector(std::chrono::milliseconds(5000));
  auto address  = "127.0.0.1:" + std::to_string(server->SelectedPort());
  auto response = client.manager->InitiateClientRequest(ClientRequest(address));
  assert(response.status() == RESPONSE_STATUS_OK);

  assert(client.manager->ProvisionInitialProcesses() == 1);
  assert(client.manager->SendOrProcessProvisionedRequests() == 1);
  assert(client.store->Find(response.id())->State() == TRANSFER_PROCESS_STATE_REQUESTED);

  assert(WaitForResults(*client.manager, std::chrono::seconds(10)));
  assert(client.manager->ApplyDispatchResults() == 1);
  assert(client.store->Find(response.id())->State() == TRANSFER_PROCESS_STATE_REQUESTED_ACK);

  auto remote = provider.store->List();
  assert(remote.size() == 1);
  assert(remote[0].IsProvider());
  assert(remote[0].State() == TRANSFER_PROCESS_STATE_INITIAL);
  assert(remote[0].Request().data_entry().id() == "entry-1");

  server->Stop();
}

void TestUnreachableConnectorMovesProcessToError() {
  auto client = BuildConnector(std::chrono::milliseconds(300));

  // reserved port with nothing listening
  auto response = client.manager->InitiateClientRequest(ClientRequest("127.0.0.1:1"));
  assert(client.manager->ProvisionInitialProcesses() == 1);
  assert(client.manager->SendOrProcessProvisionedRequests() == 1);

  assert(WaitForResults(*client.manager, std::chrono::seconds(10)));
  assert(client.manager->ApplyDispatchResults() == 1);

  auto process = client.store->Find(response.id());
  assert(process->State() == TRANSFER_PROCESS_STATE_ERROR);
  assert(!process->ErrorDetail().empty());
}

} // namespace

int main() {
  TestClientRequestReachesRemoteConnector();
  TestUnreachableConnectorMovesProcessToError();

  std::cout << "transfer_manager_integration_grpc_dispatch: pass\n";
  return 0;
}
