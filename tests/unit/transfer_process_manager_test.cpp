#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/transfer_process_manager.hpp"
#include "internal/core/wait_strategy.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/dispatcher_registry.hpp"
#include "internal/flow/data_flow_manager.hpp"
#include "internal/observability/monitor.hpp"
#include "internal/provision/manifest_generator.hpp"
#include "internal/provision/provision_manager.hpp"
#include "internal/store/repository_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "transfer/manager/v1.hpp"

namespace {

using namespace transfer::manager::v1;
using transfer::core::Lifecycle;
using transfer::core::TransferProcessManager;
using transfer::core::TransferProcessManagerConfig;

class FakeManifestGenerator final : public transfer::provision::ResourceManifestGenerator {
 public:
  ResourceManifest GenerateClientManifest(const DataRequest&) override {
    ++client_calls;
    return Manifest("client-resource");
  }

  ResourceManifest GenerateProviderManifest(const DataRequest&) override {
    ++provider_calls;
    return Manifest("provider-resource");
  }

  std::atomic<int> client_calls{0};
  std::atomic<int> provider_calls{0};

 private:
  static ResourceManifest Manifest(const std::string& type) {
    ResourceManifest manifest;
    auto*            definition = manifest.add_definitions();
    definition->set_id(type + "-def");
    definition->set_type(type);
    return manifest;
  }
};

// Optionally completes provisioning the way a real provision manager does: by writing the store.
class FakeProvisionManager final : public transfer::provision::ProvisionManager {
 public:
  void Provision(const transfer::model::TransferProcess& process) override {
    {
      std::lock_guard lock(mutex);
      provisioned_ids.push_back(process.Id());
    }
    if (complete_with) {
      auto stored = complete_with->Find(process.Id());
      stored->TransitionProvisioned();
      complete_with->Update(*stored);
    }
  }

  std::shared_ptr<transfer::store::TransferProcessStore> complete_with;
  std::mutex                                             mutex;
  std::vector<std::string>                               provisioned_ids;
};

class CapturingDispatcherRegistry final : public transfer::dispatch::RemoteMessageDispatcherRegistry {
 public:
  void Send(const DataRequest& request, transfer::dispatch::DispatchCallback done) override {
    std::lock_guard lock(mutex);
    requests.push_back(request);
    callbacks.push_back(std::move(done));
  }

  std::mutex                                         mutex;
  std::vector<DataRequest>                           requests;
  std::vector<transfer::dispatch::DispatchCallback>  callbacks;
};

class FakeDataFlowManager final : public transfer::flow::DataFlowManager {
 public:
  void Initiate(const DataRequest& request) override {
    if (request.data_entry().id() == "fatal") {
      throw transfer::util::FatalError("disk controller gone");
    }
    if (request.data_entry().id() == "broken") {
      throw std::runtime_error("source unreadable");
    }
    std::lock_guard lock(mutex);
    requests.push_back(request);
  }

  std::mutex               mutex;
  std::vector<DataRequest> requests;
};

class RecordingMonitor final : public transfer::observability::Monitor {
 public:
  void Info(std::string_view) override {}
  void Warn(std::string_view) override { ++warnings; }
  void Severe(std::string_view, const std::exception&) override { ++severe; }

  std::atomic<int> warnings{0};
  std::atomic<int> severe{0};
};

// Fails the next `fail_updates` writes, then delegates.
class FlakyStore final : public transfer::store::TransferProcessStore {
 public:
  explicit FlakyStore(std::shared_ptr<transfer::store::TransferProcessStore> inner) : inner_(std::move(inner)) {}

  void Create(const transfer::model::TransferProcess& process) override { inner_->Create(process); }

  void Update(const transfer::model::TransferProcess& process) override {
    FailIfArmed();
    inner_->Update(process);
  }

  bool UpdateIfState(const transfer::model::TransferProcess& process, TransferProcessState expected) override {
    FailIfArmed();
    return inner_->UpdateIfState(process, expected);
  }

  std::optional<transfer::model::TransferProcess> Find(const std::string& id) override { return inner_->Find(id); }

  std::vector<transfer::model::TransferProcess> NextForState(TransferProcessState state, std::size_t limit) override {
    return inner_->NextForState(state, limit);
  }

  std::vector<transfer::model::TransferProcess> List() override { return inner_->List(); }

  std::atomic<int> fail_updates{0};

 private:
  void FailIfArmed() {
    if (fail_updates.load() > 0) {
      --fail_updates;
      throw std::runtime_error("database is locked");
    }
  }

  std::shared_ptr<transfer::store::TransferProcessStore> inner_;
};

// Long idle delay, recording the order in which the loop consults it.
class RecordingWaitStrategy final : public transfer::core::WaitStrategy {
 public:
  std::chrono::milliseconds WaitFor() override {
    std::lock_guard lock(mutex);
    events.push_back("wait");
    return std::chrono::seconds(2);
  }

  void Success() override {
    std::lock_guard lock(mutex);
    events.push_back("success");
  }

  std::vector<std::string> Events() {
    std::lock_guard lock(mutex);
    return events;
  }

  std::mutex               mutex;
  std::vector<std::string> events;
};

struct Fixture {
  std::shared_ptr<transfer::store::TransferProcessStore> store =
      std::make_shared<transfer::store::RepositoryTransferProcessStore>(std::make_shared<transfer::db::memory::MemoryRepository>());
  std::shared_ptr<FakeManifestGenerator>       generator  = std::make_shared<FakeManifestGenerator>();
  std::shared_ptr<FakeProvisionManager>        provision  = std::make_shared<FakeProvisionManager>();
  std::shared_ptr<CapturingDispatcherRegistry> dispatcher = std::make_shared<CapturingDispatcherRegistry>();
  std::shared_ptr<FakeDataFlowManager>         data_flow  = std::make_shared<FakeDataFlowManager>();
  std::shared_ptr<RecordingMonitor>            monitor    = std::make_shared<RecordingMonitor>();

  TransferProcessManagerConfig Config() const {
    TransferProcessManagerConfig config;
    config.manifest_generator  = generator;
    config.provision_manager   = provision;
    config.dispatcher_registry = dispatcher;
    config.data_flow_manager   = data_flow;
    config.monitor             = monitor;
    return config;
  }

  std::unique_ptr<TransferProcessManager> Attached(TransferProcessManagerConfig config) const {
    auto manager = std::make_unique<TransferProcessManager>(std::move(config));
    manager->AttachStore(store);
    return manager;
  }

  std::unique_ptr<TransferProcessManager> Attached() const {
    return Attached(Config());
  }

  TransferProcessState StateOf(const std::string& id) const {
    auto process = store->Find(id);
    assert(process.has_value());
    return process->State();
  }

  void ForceProvisioned(const std::string& id) const {
    auto process = store->Find(id);
    assert(process.has_value());
    process->TransitionProvisioned();
    store->Update(*process);
  }
};

DataRequest Request(const std::string& entry_id = "entry-1") {
  DataRequest request;
  request.set_id("request-" + entry_id);
  request.set_protocol("grpc");
  request.set_connector_address("127.0.0.1:1");
  request.mutable_data_entry()->set_id(entry_id);
  return request;
}

template <typename Predicate>
bool WaitUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

template <typename Fn>
void ExpectConfigurationError(Fn&& fn) {
  bool thrown = false;
  try {
    fn();
  } catch (const transfer::util::ConfigurationError&) {
    thrown = true;
  }
  assert(thrown);
}

void TestConfigRejectsMissingCollaborators() {
  Fixture fx;

  ExpectConfigurationError([&] {
    auto config               = fx.Config();
    config.manifest_generator = nullptr;
    TransferProcessManager manager(config);
  });
  ExpectConfigurationError([&] {
    auto config              = fx.Config();
    config.provision_manager = nullptr;
    TransferProcessManager manager(config);
  });
  ExpectConfigurationError([&] {
    auto config                = fx.Config();
    config.dispatcher_registry = nullptr;
    TransferProcessManager manager(config);
  });
  ExpectConfigurationError([&] {
    auto config              = fx.Config();
    config.data_flow_manager = nullptr;
    TransferProcessManager manager(config);
  });
  ExpectConfigurationError([&] {
    auto config    = fx.Config();
    config.monitor = nullptr;
    TransferProcessManager manager(config);
  });
  ExpectConfigurationError([&] {
    auto config       = fx.Config();
    config.batch_size = 0;
    TransferProcessManager manager(config);
  });
}

void TestIntakeRequiresStore() {
  Fixture                fx;
  TransferProcessManager manager(fx.Config());

  bool thrown = false;
  try {
    manager.InitiateClientRequest(Request());
  } catch (const transfer::util::InvalidState&) {
    thrown = true;
  }
  assert(thrown);
}

void TestIntakePersistsInitialProcess() {
  Fixture fx;
  auto    manager = fx.Attached();

  const auto client   = manager->InitiateClientRequest(Request());
  const auto provider = manager->InitiateProviderRequest(Request());

  assert(client.status() == RESPONSE_STATUS_OK);
  assert(provider.status() == RESPONSE_STATUS_OK);
  assert(!client.id().empty());
  assert(client.id() != provider.id());

  auto stored = fx.store->Find(client.id());
  assert(stored.has_value());
  assert(stored->Id() == client.id());
  assert(stored->State() == TRANSFER_PROCESS_STATE_INITIAL);
  assert(stored->IsClient());
  assert(stored->Request().process_id() == client.id());
  assert(!stored->Manifest().has_value());

  assert(fx.store->Find(provider.id())->IsProvider());
}

void TestProvisioningUsesRoleSpecificGenerator() {
  Fixture fx;
  auto    manager = fx.Attached();

  const auto client   = manager->InitiateClientRequest(Request()).id();
  const auto provider = manager->InitiateProviderRequest(Request()).id();

  assert(manager->ProvisionInitialProcesses() == 2);
  assert(fx.generator->client_calls == 1);
  assert(fx.generator->provider_calls == 1);
  assert(fx.provision->provisioned_ids.size() == 2);

  auto client_process = fx.store->Find(client);
  assert(client_process->State() == TRANSFER_PROCESS_STATE_PROVISIONING);
  assert(client_process->Manifest().has_value());
  assert(client_process->Manifest()->definitions(0).type() == "client-resource");

  auto provider_process = fx.store->Find(provider);
  assert(provider_process->State() == TRANSFER_PROCESS_STATE_PROVISIONING);
  assert(provider_process->Manifest()->definitions(0).type() == "provider-resource");

  // nothing left in INITIAL
  assert(manager->ProvisionInitialProcesses() == 0);
}

void TestBatchSizeLimitsClaims() {
  Fixture fx;
  auto    config    = fx.Config();
  config.batch_size = 2;
  auto manager      = fx.Attached(config);

  for (int i = 0; i < 5; ++i) {
    manager->InitiateProviderRequest(Request("entry-" + std::to_string(i)));
  }

  assert(manager->ProvisionInitialProcesses() == 2);
  assert(fx.store->NextForState(TRANSFER_PROCESS_STATE_PROVISIONING, 100).size() == 2);
  assert(fx.store->NextForState(TRANSFER_PROCESS_STATE_INITIAL, 100).size() == 3);
}

void TestClientScenarioEndsAcknowledged() {
  Fixture fx;
  auto    manager = fx.Attached();

  const auto id = manager->InitiateClientRequest(Request()).id();

  assert(manager->ProvisionInitialProcesses() == 1);
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_PROVISIONING);
  assert(fx.store->Find(id)->Manifest().has_value());

  // still provisioning: not eligible for dispatch
  assert(manager->SendOrProcessProvisionedRequests() == 0);
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_PROVISIONING);

  fx.ForceProvisioned(id);
  assert(manager->SendOrProcessProvisionedRequests() == 1);
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_REQUESTED);
  assert(fx.dispatcher->callbacks.size() == 1);
  assert(fx.dispatcher->requests[0].process_id() == id);

  TransferInitiateResponse ack;
  ack.set_status(RESPONSE_STATUS_OK);
  fx.dispatcher->callbacks[0](transfer::dispatch::DispatchResult::Ok(ack));

  // applied by the loop, not by the callback
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_REQUESTED);
  assert(manager->PendingDispatchResults() == 1);

  assert(manager->ApplyDispatchResults() == 1);
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_REQUESTED_ACK);
  assert(fx.data_flow->requests.empty());
}

void TestClientSendFailureRecordsError() {
  Fixture fx;
  auto    manager = fx.Attached();

  const auto id = manager->InitiateClientRequest(Request()).id();
  manager->ProvisionInitialProcesses();
  fx.ForceProvisioned(id);
  manager->SendOrProcessProvisionedRequests();
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_REQUESTED);

  fx.dispatcher->callbacks[0](transfer::dispatch::DispatchResult::Failed("connection refused"));
  manager->ApplyDispatchResults();

  auto process = fx.store->Find(id);
  assert(process->State() == TRANSFER_PROCESS_STATE_ERROR);
  assert(process->ErrorDetail() == "connection refused");
  assert(fx.monitor->severe == 1);
}

void TestSendResultSurvivesFailedWrite() {
  Fixture fx;
  auto    flaky = std::make_shared<FlakyStore>(fx.store);
  fx.store      = flaky;
  auto manager  = fx.Attached();

  const auto id = manager->InitiateClientRequest(Request()).id();
  manager->ProvisionInitialProcesses();
  fx.ForceProvisioned(id);
  manager->SendOrProcessProvisionedRequests();

  fx.dispatcher->callbacks[0](transfer::dispatch::DispatchResult::Failed("connection refused"));

  flaky->fail_updates = 1;
  assert(manager->ApplyDispatchResults() == 0);
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_REQUESTED);
  assert(manager->PendingDispatchResults() == 1);
  assert(fx.monitor->severe == 1);

  // retried on the next pass
  assert(manager->ApplyDispatchResults() == 1);
  assert(manager->PendingDispatchResults() == 0);
  auto process = fx.store->Find(id);
  assert(process->State() == TRANSFER_PROCESS_STATE_ERROR);
  assert(process->ErrorDetail() == "connection refused");
}

void TestUnknownProtocolFailsProcess() {
  Fixture fx;
  auto    config              = fx.Config();
  config.dispatcher_registry  = std::make_shared<transfer::dispatch::RemoteMessageDispatcherRegistry>();
  auto manager                = fx.Attached(config);

  auto request = Request();
  request.set_protocol("carrier-pigeon");
  const auto id = manager->InitiateClientRequest(request).id();
  manager->ProvisionInitialProcesses();
  fx.ForceProvisioned(id);

  manager->SendOrProcessProvisionedRequests();
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_REQUESTED);

  manager->ApplyDispatchResults();
  auto process = fx.store->Find(id);
  assert(process->State() == TRANSFER_PROCESS_STATE_ERROR);
  assert(process->ErrorDetail().find("carrier-pigeon") != std::string::npos);
}

void TestProviderScenarioStartsDataFlowOnce() {
  Fixture fx;
  auto    manager = fx.Attached();

  const auto id = manager->InitiateProviderRequest(Request()).id();
  manager->ProvisionInitialProcesses();
  fx.ForceProvisioned(id);

  assert(manager->SendOrProcessProvisionedRequests() == 1);
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_IN_PROGRESS);
  assert(fx.data_flow->requests.size() == 1);
  assert(fx.data_flow->requests[0].process_id() == id);
  assert(fx.dispatcher->callbacks.empty());

  // handed off: never picked up again
  assert(manager->SendOrProcessProvisionedRequests() == 0);
  assert(fx.data_flow->requests.size() == 1);
}

void TestFailureIsIsolatedToOneProcess() {
  Fixture fx;
  auto    manager = fx.Attached();

  const auto broken = manager->InitiateProviderRequest(Request("broken")).id();
  const auto good   = manager->InitiateProviderRequest(Request("good")).id();
  manager->ProvisionInitialProcesses();
  fx.ForceProvisioned(broken);
  fx.ForceProvisioned(good);

  assert(manager->SendOrProcessProvisionedRequests() == 2);

  auto failed = fx.store->Find(broken);
  assert(failed->State() == TRANSFER_PROCESS_STATE_ERROR);
  assert(failed->ErrorDetail() == "source unreadable");
  assert(fx.StateOf(good) == TRANSFER_PROCESS_STATE_IN_PROGRESS);
  assert(fx.monitor->severe == 1);
}

void TestStaleProvisioningCheck() {
  Fixture fx;

  {
    auto manager = fx.Attached();
    manager->InitiateClientRequest(Request());
    manager->ProvisionInitialProcesses();
    // disabled by default
    assert(manager->FailStaleProvisioning() == 0);
  }

  auto config                 = fx.Config();
  config.provisioning_timeout = std::chrono::milliseconds(1000);
  auto manager                = fx.Attached(config);

  const auto fresh = fx.store->NextForState(TRANSFER_PROCESS_STATE_PROVISIONING, 10).front().Id();

  const auto stale_id = manager->InitiateClientRequest(Request("stale")).id();
  manager->ProvisionInitialProcesses();
  auto stale = fx.store->Find(stale_id);
  auto aged  = transfer::model::TransferProcess::Restore(stale->Id(), stale->Type(), stale->State(), stale->StateCount(),
                                                         transfer::util::NowMillis() - 60'000, stale->Request(), stale->Manifest(),
                                                         stale->ProvisionedResources(), stale->ErrorDetail());
  fx.store->Update(aged);

  assert(manager->FailStaleProvisioning() == 1);

  auto expired = fx.store->Find(stale_id);
  assert(expired->State() == TRANSFER_PROCESS_STATE_ERROR);
  assert(expired->ErrorDetail() == "provisioning timed out");
  assert(fx.StateOf(fresh) == TRANSFER_PROCESS_STATE_PROVISIONING);
}

void TestStopInterruptsBackoff() {
  Fixture fx;
  auto    config       = fx.Config();
  config.wait_strategy = std::make_shared<transfer::core::FixedWaitStrategy>(std::chrono::seconds(60));
  TransferProcessManager manager(config);

  manager.Start(fx.store);
  assert(manager.State() == Lifecycle::kRunning);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  const auto started = std::chrono::steady_clock::now();
  manager.Stop();
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(elapsed < std::chrono::seconds(2));
  assert(manager.State() == Lifecycle::kStopped);
}

void TestStartAndStopAreIdempotent() {
  Fixture fx;
  auto    config       = fx.Config();
  config.wait_strategy = std::make_shared<transfer::core::FixedWaitStrategy>(std::chrono::milliseconds(10));
  TransferProcessManager manager(config);

  manager.Stop();
  assert(manager.State() == Lifecycle::kStopped);

  manager.Start(fx.store);
  manager.Start(fx.store);
  assert(manager.State() == Lifecycle::kRunning);

  manager.Stop();
  manager.Stop();
  assert(manager.State() == Lifecycle::kStopped);

  // restartable
  manager.Start(fx.store);
  assert(manager.State() == Lifecycle::kRunning);
  manager.Stop();
}

void TestLoopDrivesProcessesInBackground() {
  Fixture fx;
  fx.provision->complete_with = fx.store;
  auto config                 = fx.Config();
  config.wait_strategy        = std::make_shared<transfer::core::FixedWaitStrategy>(std::chrono::milliseconds(10));
  TransferProcessManager manager(config);

  manager.Start(fx.store);
  const auto provider = manager.InitiateProviderRequest(Request()).id();
  const auto client   = manager.InitiateClientRequest(Request()).id();

  assert(WaitUntil([&] { return fx.StateOf(provider) == TRANSFER_PROCESS_STATE_IN_PROGRESS; }));
  assert(WaitUntil([&] {
    std::lock_guard lock(fx.dispatcher->mutex);
    return !fx.dispatcher->callbacks.empty();
  }));

  transfer::dispatch::DispatchCallback callback;
  {
    std::lock_guard lock(fx.dispatcher->mutex);
    callback = fx.dispatcher->callbacks[0];
  }
  TransferInitiateResponse ack;
  ack.set_status(RESPONSE_STATUS_OK);
  // completion from a foreign thread wakes the loop
  std::thread([callback, ack] { callback(transfer::dispatch::DispatchResult::Ok(ack)); }).join();

  assert(WaitUntil([&] { return fx.StateOf(client) == TRANSFER_PROCESS_STATE_REQUESTED_ACK; }));
  manager.Stop();
}

void TestIdleIterationSleepsForWaitStrategyDelay() {
  Fixture fx;
  fx.provision->complete_with = fx.store;
  auto strategy               = std::make_shared<RecordingWaitStrategy>();
  auto config                 = fx.Config();
  config.wait_strategy        = strategy;
  TransferProcessManager manager(config);
  manager.AttachStore(fx.store);

  const auto id = manager.InitiateProviderRequest(Request()).id();
  manager.Start(fx.store);

  assert(WaitUntil([&] { return strategy->Events().size() >= 2; }));
  assert(fx.StateOf(id) == TRANSFER_PROCESS_STATE_IN_PROGRESS);

  // well inside the 2 s delay: no further iteration has consulted the strategy
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  const auto events = strategy->Events();
  assert(events.size() == 2);
  assert(events[0] == "success");
  assert(events[1] == "wait");

  manager.Stop();
}

void TestConcurrentIntakeWhileRunning() {
  Fixture fx;
  fx.provision->complete_with = fx.store;
  auto config                 = fx.Config();
  config.wait_strategy        = std::make_shared<transfer::core::FixedWaitStrategy>(std::chrono::milliseconds(5));
  TransferProcessManager manager(config);
  manager.Start(fx.store);

  constexpr int kThreads   = 8;
  constexpr int kPerThread = 25;

  std::mutex               ids_mutex;
  std::vector<std::string> ids;
  std::vector<std::thread> callers;
  for (int t = 0; t < kThreads; ++t) {
    callers.emplace_back([&, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const auto request  = Request("entry-" + std::to_string(t) + "-" + std::to_string(i));
        const auto response = (i % 2 == 0) ? manager.InitiateClientRequest(request) : manager.InitiateProviderRequest(request);
        assert(response.status() == RESPONSE_STATUS_OK);
        std::lock_guard lock(ids_mutex);
        ids.push_back(response.id());
      }
    });
  }
  for (auto& caller : callers) {
    caller.join();
  }
  manager.Stop();

  const std::set<std::string> distinct(ids.begin(), ids.end());
  assert(distinct.size() == static_cast<std::size_t>(kThreads * kPerThread));
  for (const auto& id : ids) {
    assert(fx.store->Find(id).has_value());
  }
  assert(fx.store->List().size() == distinct.size());
}

void TestFatalErrorStopsWorker() {
  Fixture fx;
  fx.provision->complete_with = fx.store;
  auto config                 = fx.Config();
  config.wait_strategy        = std::make_shared<transfer::core::FixedWaitStrategy>(std::chrono::milliseconds(10));
  TransferProcessManager manager(config);

  manager.Start(fx.store);
  manager.InitiateProviderRequest(Request("fatal"));

  assert(WaitUntil([&] { return manager.State() == Lifecycle::kFailed; }));
  assert(fx.monitor->severe >= 1);

  // no further iterations once failed
  const auto later = manager.InitiateProviderRequest(Request("later")).id();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  assert(fx.StateOf(later) == TRANSFER_PROCESS_STATE_INITIAL);

  manager.Stop();
  assert(manager.State() == Lifecycle::kFailed);
}

} // namespace

int main() {
  TestConfigRejectsMissingCollaborators();
  TestIntakeRequiresStore();
  TestIntakePersistsInitialProcess();
  TestProvisioningUsesRoleSpecificGenerator();
  TestBatchSizeLimitsClaims();
  TestClientScenarioEndsAcknowledged();
  TestClientSendFailureRecordsError();
  TestSendResultSurvivesFailedWrite();
  TestUnknownProtocolFailsProcess();
  TestProviderScenarioStartsDataFlowOnce();
  TestFailureIsIsolatedToOneProcess();
  TestStaleProvisioningCheck();
  TestStopInterruptsBackoff();
  TestStartAndStopAreIdempotent();
  TestLoopDrivesProcessesInBackground();
  TestIdleIterationSleepsForWaitStrategyDelay();
  TestConcurrentIntakeWhileRunning();
  TestFatalErrorStopsWorker();

  std::cout << "transfer_manager_unit_transfer_process_manager: pass\n";
  return 0;
}
