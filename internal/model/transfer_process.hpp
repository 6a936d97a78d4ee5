#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/state_machine.hpp"
#include "transfer/manager/core/v1/types.pb.h"

namespace transfer::model {

/*
  Persistent record of one transfer.

  State only changes through the Transition* members. Each one checks the
  current state against the allowed predecessors and throws
  util::InvalidState, leaving the process untouched, when it does not match.

  Invariants:
    - id and type never change after construction
    - resource_manifest is set from PROVISIONING onward
    - error_detail is set only by TransitionError
*/
class TransferProcess {
 public:
  using DataRequest         = transfer::manager::core::v1::DataRequest;
  using ResourceManifest    = transfer::manager::core::v1::ResourceManifest;
  using ProvisionedResource = transfer::manager::core::v1::ProvisionedResource;

  // New, unsaved process. Call TransitionInitial() before the first persist.
  TransferProcess(std::string id, TransferType type, DataRequest data_request);

  // Rehydrates a stored process. Used by repositories only.
  static TransferProcess Restore(std::string id, TransferType type, TransferProcessState state, uint32_t state_count,
                                 uint64_t state_timestamp_ms, DataRequest data_request,
                                 std::optional<ResourceManifest> resource_manifest,
                                 std::vector<ProvisionedResource> provisioned_resources, std::string error_detail);

  const std::string&                     Id() const { return id_; }
  TransferType                           Type() const { return type_; }
  TransferProcessState                   State() const { return state_; }
  uint32_t                               StateCount() const { return state_count_; }
  uint64_t                               StateTimestampMs() const { return state_timestamp_ms_; }
  const DataRequest&                     Request() const { return data_request_; }
  const std::optional<ResourceManifest>& Manifest() const { return resource_manifest_; }
  const std::vector<ProvisionedResource>& ProvisionedResources() const { return provisioned_resources_; }
  const std::string&                     ErrorDetail() const { return error_detail_; }

  bool IsClient() const;
  bool IsProvider() const;

  void TransitionInitial();
  void TransitionProvisioning(ResourceManifest manifest);
  void TransitionProvisioned();
  void TransitionRequested();
  void TransitionRequestAck();
  void TransitionInProgress();
  void TransitionError(std::string detail);

  // Records a resource stood up for one of the manifest's definitions.
  void AddProvisionedResource(ProvisionedResource resource);

  // True once every manifest definition has a provisioned resource.
  bool ProvisioningComplete() const;

  transfer::manager::core::v1::TransferProcessDescriptor ToDescriptor() const;

 private:
  TransferProcess() = default;

  void Transition(TransferProcessState target);

  std::string                      id_;
  TransferType                     type_  = transfer::manager::core::v1::TRANSFER_TYPE_UNSPECIFIED;
  TransferProcessState             state_ = transfer::manager::core::v1::TRANSFER_PROCESS_STATE_UNSAVED;
  uint32_t                         state_count_        = 0;
  uint64_t                         state_timestamp_ms_ = 0;
  DataRequest                      data_request_;
  std::optional<ResourceManifest>  resource_manifest_;
  std::vector<ProvisionedResource> provisioned_resources_;
  std::string                      error_detail_;
};

} // namespace transfer::model
