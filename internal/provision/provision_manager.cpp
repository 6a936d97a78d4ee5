#include "provision_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/monitor.hpp"
#include "internal/store/transfer_process_store.hpp"
#include "internal/util/errors.hpp"

namespace transfer::provision {

using namespace transfer::manager::core::v1;

ProvisionManagerImpl::ProvisionManagerImpl(std::shared_ptr<store::TransferProcessStore> store,
                                           std::shared_ptr<observability::Monitor>      monitor)
    : store_(std::move(store)), monitor_(std::move(monitor)) {
  if (!store_) {
    throw util::ConfigurationError("provision manager requires a transfer process store");
  }
  if (!monitor_) {
    throw util::ConfigurationError("provision manager requires a monitor");
  }
}

void ProvisionManagerImpl::Register(std::shared_ptr<Provisioner> provisioner) {
  if (!provisioner) {
    throw std::invalid_argument("provisioner is null");
  }
  std::lock_guard lock(provisioners_mutex_);
  provisioners_.push_back(std::move(provisioner));
}

std::shared_ptr<Provisioner> ProvisionManagerImpl::Find(const ResourceDefinition& definition) {
  std::lock_guard lock(provisioners_mutex_);
  for (const auto& provisioner : provisioners_) {
    if (provisioner->CanProvision(definition)) {
      return provisioner;
    }
  }
  return nullptr;
}

void ProvisionManagerImpl::Provision(const model::TransferProcess& process) {
  if (!process.Manifest()) {
    throw util::InvalidState("transfer process " + process.Id() + " has no resource manifest");
  }

  const auto& definitions = process.Manifest()->definitions();
  if (definitions.empty()) {
    CompleteEmpty(process.Id());
    return;
  }

  // Resolve every definition first so an unsupported one fails the process
  // before any infrastructure is touched.
  std::vector<std::shared_ptr<Provisioner>> routed;
  routed.reserve(static_cast<std::size_t>(definitions.size()));
  for (const auto& definition : definitions) {
    auto provisioner = Find(definition);
    if (!provisioner) {
      Fail(process.Id(), "no provisioner for resource type '" + definition.type() + "'");
      return;
    }
    routed.push_back(std::move(provisioner));
  }

  std::weak_ptr<ProvisionManagerImpl> weak_self = weak_from_this();
  for (int i = 0; i < definitions.size(); ++i) {
    const auto process_id = process.Id();
    routed[static_cast<std::size_t>(i)]->Provision(definitions[i], [weak_self, process_id](ProvisionResult result) {
      if (auto self = weak_self.lock()) {
        self->OnResult(process_id, std::move(result));
      }
    });
  }
}

void ProvisionManagerImpl::OnResult(const std::string& process_id, ProvisionResult result) {
  try {
    std::lock_guard lock(update_mutex_);

    auto process = store_->Find(process_id);
    if (!process) {
      monitor_->Warn("provisioning result for unknown transfer process " + process_id);
      return;
    }
    if (process->State() != TRANSFER_PROCESS_STATE_PROVISIONING) {
      // timed out or failed by another resource in the meantime
      TRANSFER_LOG_WARN("Dropping late provisioning result", {observability::StringField("process_id", process_id),
                                                             observability::StringField("state", model::ToString(process->State()))});
      return;
    }

    if (!result.ok) {
      process->TransitionError(result.error);
      if (Write(*process)) {
        monitor_->Warn("provisioning failed for transfer process " + process_id + ": " + result.error);
      }
      return;
    }

    process->AddProvisionedResource(std::move(result.resource));
    if (process->ProvisioningComplete()) {
      process->TransitionProvisioned();
    }
    Write(*process);
  } catch (const std::exception& e) {
    monitor_->Severe("Error applying provisioning result for transfer process " + process_id, e);
  }
}

void ProvisionManagerImpl::CompleteEmpty(const std::string& process_id) {
  std::lock_guard lock(update_mutex_);

  auto process = store_->Find(process_id);
  if (!process) {
    throw util::NotFound("transfer process " + process_id);
  }
  process->TransitionProvisioned();
  Write(*process);
}

void ProvisionManagerImpl::Fail(const std::string& process_id, const std::string& detail) {
  std::lock_guard lock(update_mutex_);

  auto process = store_->Find(process_id);
  if (!process) {
    throw util::NotFound("transfer process " + process_id);
  }
  process->TransitionError(detail);
  if (!Write(*process)) {
    return;
  }
  monitor_->Warn("provisioning failed for transfer process " + process_id + ": " + detail);
}

bool ProvisionManagerImpl::Write(const model::TransferProcess& process) {
  // the manager may have expired the process since it was read
  if (store_->UpdateIfState(process, TRANSFER_PROCESS_STATE_PROVISIONING)) {
    return true;
  }
  TRANSFER_LOG_WARN("Dropping provisioning update for a process that left PROVISIONING",
                    {observability::StringField("process_id", process.Id())});
  return false;
}

} // namespace transfer::provision
