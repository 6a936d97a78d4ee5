#include "transfer_process_manager.hpp"

#include <cstddef>
#include <iterator>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/dispatch/dispatcher_registry.hpp"
#include "internal/flow/data_flow_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/monitor.hpp"
#include "internal/provision/manifest_generator.hpp"
#include "internal/provision/provision_manager.hpp"
#include "internal/store/transfer_process_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace transfer::core {

using namespace transfer::manager::core::v1;

TransferProcessManager::TransferProcessManager(TransferProcessManagerConfig config)
    : config_(std::move(config)), results_(std::make_shared<DispatchResultQueue>()) {
  if (!config_.manifest_generator) {
    throw util::ConfigurationError("transfer process manager: manifest_generator is required");
  }
  if (!config_.provision_manager) {
    throw util::ConfigurationError("transfer process manager: provision_manager is required");
  }
  if (!config_.dispatcher_registry) {
    throw util::ConfigurationError("transfer process manager: dispatcher_registry is required");
  }
  if (!config_.data_flow_manager) {
    throw util::ConfigurationError("transfer process manager: data_flow_manager is required");
  }
  if (!config_.monitor) {
    throw util::ConfigurationError("transfer process manager: monitor is required");
  }
  if (config_.batch_size == 0) {
    throw util::ConfigurationError("transfer process manager: batch_size must be positive");
  }
  if (config_.provisioning_timeout && config_.provisioning_timeout->count() <= 0) {
    throw util::ConfigurationError("transfer process manager: provisioning_timeout must be positive when set");
  }
  if (!config_.wait_strategy) {
    config_.wait_strategy = std::make_shared<FixedWaitStrategy>();
  }
}

TransferProcessManager::~TransferProcessManager() {
  try {
    Stop();
  } catch (const std::exception& e) {
    TRANSFER_LOG_ERROR("Transfer process manager shutdown failed", {observability::StringField("error", e.what())});
  }
}

void TransferProcessManager::AttachStore(std::shared_ptr<store::TransferProcessStore> store) {
  if (!store) {
    throw util::ConfigurationError("transfer process manager: store is required");
  }
  std::lock_guard lock(store_mutex_);
  store_ = std::move(store);
}

std::shared_ptr<store::TransferProcessStore> TransferProcessManager::Store() const {
  std::lock_guard lock(store_mutex_);
  if (!store_) {
    throw util::InvalidState("transfer process manager has no store; call Start first");
  }
  return store_;
}

void TransferProcessManager::Start(std::shared_ptr<store::TransferProcessStore> store) {
  std::lock_guard lock(control_mutex_);

  if (lifecycle_.load() == Lifecycle::kRunning) {
    return;
  }
  // a failed worker has exited on its own; reap it before restarting
  if (worker_.joinable()) {
    worker_.join();
  }

  AttachStore(std::move(store));
  stop_requested_ = false;
  lifecycle_      = Lifecycle::kRunning;
  worker_         = std::thread(&TransferProcessManager::Run, this);
}

void TransferProcessManager::Stop() {
  std::lock_guard lock(control_mutex_);

  if (!worker_.joinable()) {
    return;
  }

  stop_requested_ = true;
  results_->Wake();
  worker_.join();

  auto expected = Lifecycle::kRunning;
  lifecycle_.compare_exchange_strong(expected, Lifecycle::kStopped);

  try {
    ApplyDispatchResults();
  } catch (const std::exception& e) {
    config_.monitor->Severe("Error applying dispatch results during shutdown", e);
  }
}

TransferInitiateResponse TransferProcessManager::InitiateClientRequest(const DataRequest& request) {
  return Initiate(TRANSFER_TYPE_CLIENT, request);
}

TransferInitiateResponse TransferProcessManager::InitiateProviderRequest(const DataRequest& request) {
  return Initiate(TRANSFER_TYPE_PROVIDER, request);
}

TransferInitiateResponse TransferProcessManager::Initiate(model::TransferType type, const DataRequest& request) {
  auto store = Store();

  auto        id    = util::GenerateUUIDString();
  DataRequest owned = request;
  owned.set_process_id(id);

  model::TransferProcess process(id, type, std::move(owned));
  process.TransitionInitial();
  store->Create(process);

  TRANSFER_LOG_INFO("Transfer process initiated", {observability::StringField("process_id", id),
                                                  observability::StringField("type", model::ToString(type))});

  TransferInitiateResponse response;
  response.set_id(id);
  response.set_status(RESPONSE_STATUS_OK);
  return response;
}

void TransferProcessManager::Run() {
  TRANSFER_LOG_INFO("Transfer process manager started",
                    {observability::IntField("batch_size", static_cast<std::int64_t>(config_.batch_size))});

  try {
    while (!stop_requested_.load()) {
      if (RunIteration()) {
        config_.wait_strategy->Success();
        continue;
      }
      if (stop_requested_.load()) {
        break;
      }
      results_->WaitFor(config_.wait_strategy->WaitFor());
    }
  } catch (const util::FatalError& e) {
    MarkFailed("Transfer process manager stopped on fatal error", e);
    return;
  } catch (const std::bad_alloc& e) {
    MarkFailed("Transfer process manager stopped: out of memory", e);
    return;
  }

  TRANSFER_LOG_INFO("Transfer process manager stopped");
}

void TransferProcessManager::MarkFailed(std::string_view reason, const std::exception& error) {
  lifecycle_ = Lifecycle::kFailed;
  config_.monitor->Severe(reason, error);
}

template <typename Pass>
std::size_t TransferProcessManager::RunPass(std::string_view name, Pass pass) {
  try {
    return pass();
  } catch (const util::FatalError&) {
    throw;
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& e) {
    // store query failed; treat the pass as idle so the loop backs off
    config_.monitor->Severe(std::string(name) + " pass failed", e);
    return 0;
  }
}

bool TransferProcessManager::RunIteration() {
  std::size_t touched = 0;
  touched += RunPass("dispatch result", [this] { return ApplyDispatchResults(); });
  touched += RunPass("provisioning", [this] { return ProvisionInitialProcesses(); });
  touched += RunPass("provisioning timeout", [this] { return FailStaleProvisioning(); });
  touched += RunPass("dispatch", [this] { return SendOrProcessProvisionedRequests(); });
  return touched > 0;
}

std::size_t TransferProcessManager::ProvisionInitialProcesses() {
  auto store     = Store();
  auto processes = store->NextForState(TRANSFER_PROCESS_STATE_INITIAL, config_.batch_size);

  for (auto& process : processes) {
    try {
      ProvisionOne(*store, process);
    } catch (const util::FatalError&) {
      throw;
    } catch (const std::bad_alloc&) {
      throw;
    } catch (const std::exception& e) {
      FailProcess(*store, process, "provisioning", e);
    }
  }
  return processes.size();
}

void TransferProcessManager::ProvisionOne(store::TransferProcessStore& store, model::TransferProcess& process) {
  auto manifest = process.IsClient() ? config_.manifest_generator->GenerateClientManifest(process.Request())
                                     : config_.manifest_generator->GenerateProviderManifest(process.Request());

  process.TransitionProvisioning(std::move(manifest));
  store.Update(process);

  TRANSFER_LOG_DEBUG("Provisioning transfer process",
                     {observability::StringField("process_id", process.Id()),
                      observability::IntField("resources", process.Manifest()->definitions_size())});

  config_.provision_manager->Provision(process);
}

std::size_t TransferProcessManager::FailStaleProvisioning() {
  if (!config_.provisioning_timeout) {
    return 0;
  }

  auto       store      = Store();
  const auto now        = util::NowMillis();
  const auto timeout_ms = static_cast<uint64_t>(config_.provisioning_timeout->count());

  std::size_t failed = 0;
  for (auto& process : store->NextForState(TRANSFER_PROCESS_STATE_PROVISIONING, config_.batch_size)) {
    if (now < process.StateTimestampMs() + timeout_ms) {
      continue;
    }
    try {
      process.TransitionError("provisioning timed out");
      // a provisioning callback may have completed it since the query
      if (!store->UpdateIfState(process, TRANSFER_PROCESS_STATE_PROVISIONING)) {
        continue;
      }
      ++failed;
      config_.monitor->Warn("transfer process " + process.Id() + " timed out in provisioning");
    } catch (const util::FatalError&) {
      throw;
    } catch (const std::bad_alloc&) {
      throw;
    } catch (const std::exception& e) {
      config_.monitor->Severe("Error expiring transfer process " + process.Id(), e);
    }
  }
  return failed;
}

std::size_t TransferProcessManager::SendOrProcessProvisionedRequests() {
  auto store     = Store();
  auto processes = store->NextForState(TRANSFER_PROCESS_STATE_PROVISIONED, config_.batch_size);

  for (auto& process : processes) {
    try {
      DispatchOne(*store, process);
    } catch (const util::FatalError&) {
      throw;
    } catch (const std::bad_alloc&) {
      throw;
    } catch (const std::exception& e) {
      FailProcess(*store, process, "dispatching", e);
    }
  }
  return processes.size();
}

void TransferProcessManager::DispatchOne(store::TransferProcessStore& store, model::TransferProcess& process) {
  if (process.IsClient()) {
    // REQUESTED means "send attempted"; the outcome is applied by a later iteration
    process.TransitionRequested();
    store.Update(process);

    auto results    = results_;
    auto process_id = process.Id();
    config_.dispatcher_registry->Send(process.Request(), [results, process_id](dispatch::DispatchResult result) {
      results->Push({process_id, std::move(result)});
    });
    return;
  }

  config_.data_flow_manager->Initiate(process.Request());
  process.TransitionInProgress();
  store.Update(process);
}

std::size_t TransferProcessManager::PendingDispatchResults() const {
  std::lock_guard lock(retry_mutex_);
  return retry_.size() + results_->Size();
}

std::size_t TransferProcessManager::ApplyDispatchResults() {
  auto store = Store();

  std::vector<DispatchOutcome> outcomes;
  {
    std::lock_guard lock(retry_mutex_);
    outcomes.swap(retry_);
  }
  for (auto& outcome : results_->Drain()) {
    outcomes.push_back(std::move(outcome));
  }

  std::vector<DispatchOutcome> retained;
  std::size_t                  applied = 0;
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    try {
      ApplyOne(*store, outcomes[i]);
      ++applied;
    } catch (const util::FatalError&) {
      retained.insert(retained.end(), std::make_move_iterator(outcomes.begin() + static_cast<std::ptrdiff_t>(i)),
                      std::make_move_iterator(outcomes.end()));
      Retain(std::move(retained));
      throw;
    } catch (const std::bad_alloc&) {
      retained.insert(retained.end(), std::make_move_iterator(outcomes.begin() + static_cast<std::ptrdiff_t>(i)),
                      std::make_move_iterator(outcomes.end()));
      Retain(std::move(retained));
      throw;
    } catch (const std::exception& e) {
      config_.monitor->Severe("Error applying send result for transfer process " + outcomes[i].process_id, e);
      retained.push_back(std::move(outcomes[i]));
    }
  }

  Retain(std::move(retained));
  return applied;
}

void TransferProcessManager::Retain(std::vector<DispatchOutcome> outcomes) {
  if (outcomes.empty()) {
    return;
  }
  std::lock_guard lock(retry_mutex_);
  retry_.insert(retry_.end(), std::make_move_iterator(outcomes.begin()), std::make_move_iterator(outcomes.end()));
}

void TransferProcessManager::ApplyOne(store::TransferProcessStore& store, const DispatchOutcome& outcome) {
  auto process = store.Find(outcome.process_id);
  if (!process) {
    config_.monitor->Warn("send result for unknown transfer process " + outcome.process_id);
    return;
  }
  if (process->State() != TRANSFER_PROCESS_STATE_REQUESTED) {
    config_.monitor->Warn("ignoring send result for transfer process " + outcome.process_id + " in state " +
                          std::string(model::ToString(process->State())));
    return;
  }

  if (outcome.result.ok) {
    process->TransitionRequestAck();
    store.Update(*process);
    return;
  }

  process->TransitionError(outcome.result.error);
  store.Update(*process);
  config_.monitor->Severe("Error sending request for transfer process " + outcome.process_id,
                          std::runtime_error(outcome.result.error));
}

void TransferProcessManager::FailProcess(store::TransferProcessStore& store, model::TransferProcess& process,
                                         std::string_view stage, const std::exception& error) {
  config_.monitor->Severe("Error " + std::string(stage) + " transfer process " + process.Id(), error);

  if (!model::CanTransition(process.State(), TRANSFER_PROCESS_STATE_ERROR)) {
    return;
  }
  try {
    process.TransitionError(error.what());
    store.Update(process);
  } catch (const util::FatalError&) {
    throw;
  } catch (const std::bad_alloc&) {
    throw;
  } catch (const std::exception& e) {
    config_.monitor->Severe("Could not record failure of transfer process " + process.Id(), e);
  }
}

} // namespace transfer::core
