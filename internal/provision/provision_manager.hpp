#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/model/transfer_process.hpp"
#include "transfer/manager/core/v1/types.pb.h"

namespace transfer::store {
class TransferProcessStore;
}
namespace transfer::observability {
class Monitor;
}

namespace transfer::provision {

/*
  Stands up the resources a process manifest describes.

  Fire-and-forget: completion is reported out of band by moving the stored
  process PROVISIONING -> PROVISIONED (or ERROR), which the manager loop
  picks up on its next poll.
*/
class ProvisionManager {
 public:
  virtual ~ProvisionManager() = default;

  virtual void Provision(const model::TransferProcess& process) = 0;
};

struct ProvisionResult {
  bool                                             ok = false;
  transfer::manager::core::v1::ProvisionedResource resource;
  std::string                                      error;

  static ProvisionResult Ok(transfer::manager::core::v1::ProvisionedResource resource) {
    return {true, std::move(resource), {}};
  }

  static ProvisionResult Failed(std::string error) {
    return {false, {}, std::move(error)};
  }
};

// May be invoked on any thread, at most once per Provision call.
using ProvisionCallback = std::function<void(ProvisionResult)>;

class Provisioner {
 public:
  virtual ~Provisioner() = default;

  virtual bool CanProvision(const transfer::manager::core::v1::ResourceDefinition& definition) const = 0;

  virtual void Provision(const transfer::manager::core::v1::ResourceDefinition& definition, ProvisionCallback done) = 0;
};

/*
  Routes each manifest definition to the first provisioner that accepts it
  and folds the results back into the stored process.
*/
class ProvisionManagerImpl final : public ProvisionManager, public std::enable_shared_from_this<ProvisionManagerImpl> {
 public:
  ProvisionManagerImpl(std::shared_ptr<store::TransferProcessStore> store, std::shared_ptr<observability::Monitor> monitor);

  void Register(std::shared_ptr<Provisioner> provisioner);

  void Provision(const model::TransferProcess& process) override;

 private:
  std::shared_ptr<Provisioner> Find(const transfer::manager::core::v1::ResourceDefinition& definition);

  void OnResult(const std::string& process_id, ProvisionResult result);
  void CompleteEmpty(const std::string& process_id);
  void Fail(const std::string& process_id, const std::string& detail);

  // Guarded write: false when the process is no longer PROVISIONING.
  bool Write(const model::TransferProcess& process);

  std::shared_ptr<store::TransferProcessStore> store_;
  std::shared_ptr<observability::Monitor>      monitor_;

  std::mutex                                provisioners_mutex_;
  std::vector<std::shared_ptr<Provisioner>> provisioners_;

  // Serializes read-modify-write of stored processes from provisioner callbacks.
  std::mutex update_mutex_;
};

} // namespace transfer::provision
