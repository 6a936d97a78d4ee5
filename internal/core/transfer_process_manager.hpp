#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>
#include <vector>

#include "dispatch_result_queue.hpp"
#include "internal/model/transfer_process.hpp"
#include "wait_strategy.hpp"
#include "transfer/manager/core/v1/types.pb.h"

namespace transfer::store {
class TransferProcessStore;
}
namespace transfer::provision {
class ResourceManifestGenerator;
class ProvisionManager;
} // namespace transfer::provision
namespace transfer::dispatch {
class RemoteMessageDispatcherRegistry;
}
namespace transfer::flow {
class DataFlowManager;
}
namespace transfer::observability {
class Monitor;
}

namespace transfer::core {

struct TransferProcessManagerConfig {
  std::shared_ptr<provision::ResourceManifestGenerator>      manifest_generator;
  std::shared_ptr<provision::ProvisionManager>               provision_manager;
  std::shared_ptr<dispatch::RemoteMessageDispatcherRegistry> dispatcher_registry;
  std::shared_ptr<flow::DataFlowManager>                     data_flow_manager;
  std::shared_ptr<observability::Monitor>                    monitor;

  std::size_t batch_size = 5;

  // Null means FixedWaitStrategy with its default delay.
  std::shared_ptr<WaitStrategy> wait_strategy;

  // Unset disables the stuck-provisioning check.
  std::optional<std::chrono::milliseconds> provisioning_timeout;
};

enum class Lifecycle { kStopped, kRunning, kFailed };

/*
  Drives transfer processes through provisioning and dispatch.

  One background worker owns every state transition after intake:

      INITIAL      -> PROVISIONING   (manifest generated, provisioning started)
      PROVISIONED  -> REQUESTED      (client: request sent to the remote side)
      REQUESTED    -> REQUESTED_ACK | ERROR   (client: send completed)
      PROVISIONED  -> IN_PROGRESS    (provider: data flow started)

  PROVISIONING -> PROVISIONED is written by the provisioning subsystem and
  picked up by polling the store.

  Send completions arrive on transport threads and are queued; the worker
  applies them at the start of its next iteration.

  A failure on one process moves that process to ERROR and the pass carries
  on. util::FatalError and std::bad_alloc stop the worker (Lifecycle::kFailed).
*/
class TransferProcessManager {
 public:
  // Throws util::ConfigurationError on a missing collaborator or zero batch size.
  explicit TransferProcessManager(TransferProcessManagerConfig config);
  ~TransferProcessManager();

  TransferProcessManager(const TransferProcessManager&)            = delete;
  TransferProcessManager& operator=(const TransferProcessManager&) = delete;

  // No-op while already running.
  void Start(std::shared_ptr<store::TransferProcessStore> store);

  // Wakes the worker, joins it and applies already queued send results. No-op when stopped.
  void Stop();

  // Binds a store without starting the worker; passes can then be driven directly.
  void AttachStore(std::shared_ptr<store::TransferProcessStore> store);

  Lifecycle State() const { return lifecycle_.load(); }

  transfer::manager::core::v1::TransferInitiateResponse InitiateClientRequest(
      const transfer::manager::core::v1::DataRequest& request);

  transfer::manager::core::v1::TransferInitiateResponse InitiateProviderRequest(
      const transfer::manager::core::v1::DataRequest& request);

  // Each pass returns how many processes it touched.
  std::size_t ProvisionInitialProcesses();
  std::size_t FailStaleProvisioning();
  std::size_t SendOrProcessProvisionedRequests();

  // Send results whose write fails are kept and retried by the next call; they are not counted.
  std::size_t ApplyDispatchResults();

  // Queued plus retained send results.
  std::size_t PendingDispatchResults() const;

 private:
  void Run();
  bool RunIteration();

  template <typename Pass>
  std::size_t RunPass(std::string_view name, Pass pass);

  std::shared_ptr<store::TransferProcessStore> Store() const;

  transfer::manager::core::v1::TransferInitiateResponse Initiate(model::TransferType                             type,
                                                                 const transfer::manager::core::v1::DataRequest& request);

  void ProvisionOne(store::TransferProcessStore& store, model::TransferProcess& process);
  void DispatchOne(store::TransferProcessStore& store, model::TransferProcess& process);
  void ApplyOne(store::TransferProcessStore& store, const DispatchOutcome& outcome);
  void Retain(std::vector<DispatchOutcome> outcomes);

  // Logs the failure and moves the process to ERROR when that is still legal.
  void FailProcess(store::TransferProcessStore& store, model::TransferProcess& process, std::string_view stage,
                   const std::exception& error);

  void MarkFailed(std::string_view reason, const std::exception& error);

  TransferProcessManagerConfig         config_;
  std::shared_ptr<DispatchResultQueue> results_;

  // outcomes whose store write failed, retried before newly queued ones
  mutable std::mutex           retry_mutex_;
  std::vector<DispatchOutcome> retry_;

  mutable std::mutex                           store_mutex_;
  std::shared_ptr<store::TransferProcessStore> store_;

  std::mutex             control_mutex_;
  std::thread            worker_;
  std::atomic<Lifecycle> lifecycle_{Lifecycle::kStopped};
  std::atomic<bool>      stop_requested_{false};
};

} // namespace transfer::core
