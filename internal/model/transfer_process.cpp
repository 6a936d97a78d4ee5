#include "transfer_process.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace transfer::model {

using namespace transfer::manager::core::v1;

std::string_view ToString(TransferProcessState state) {
  switch (state) {
    case TRANSFER_PROCESS_STATE_UNSAVED:
      return "UNSAVED";
    case TRANSFER_PROCESS_STATE_INITIAL:
      return "INITIAL";
    case TRANSFER_PROCESS_STATE_PROVISIONING:
      return "PROVISIONING";
    case TRANSFER_PROCESS_STATE_PROVISIONED:
      return "PROVISIONED";
    case TRANSFER_PROCESS_STATE_REQUESTED:
      return "REQUESTED";
    case TRANSFER_PROCESS_STATE_REQUESTED_ACK:
      return "REQUESTED_ACK";
    case TRANSFER_PROCESS_STATE_IN_PROGRESS:
      return "IN_PROGRESS";
    case TRANSFER_PROCESS_STATE_ERROR:
      return "ERROR";
    default:
      return "UNKNOWN";
  }
}

std::string_view ToString(TransferType type) {
  switch (type) {
    case TRANSFER_TYPE_CLIENT:
      return "CLIENT";
    case TRANSFER_TYPE_PROVIDER:
      return "PROVIDER";
    default:
      return "UNSPECIFIED";
  }
}

TransferProcess::TransferProcess(std::string id, TransferType type, DataRequest data_request)
    : id_(std::move(id)), type_(type), data_request_(std::move(data_request)) {
  if (id_.empty()) {
    throw util::InvalidState("transfer process id must not be empty");
  }
  if (type_ != TRANSFER_TYPE_CLIENT && type_ != TRANSFER_TYPE_PROVIDER) {
    throw util::InvalidState("transfer process " + id_ + " has no type");
  }
}

TransferProcess TransferProcess::Restore(std::string id, TransferType type, TransferProcessState state, uint32_t state_count,
                                         uint64_t state_timestamp_ms, DataRequest data_request,
                                         std::optional<ResourceManifest> resource_manifest,
                                         std::vector<ProvisionedResource> provisioned_resources, std::string error_detail) {
  TransferProcess process;
  process.id_                    = std::move(id);
  process.type_                  = type;
  process.state_                 = state;
  process.state_count_           = state_count;
  process.state_timestamp_ms_    = state_timestamp_ms;
  process.data_request_          = std::move(data_request);
  process.resource_manifest_     = std::move(resource_manifest);
  process.provisioned_resources_ = std::move(provisioned_resources);
  process.error_detail_          = std::move(error_detail);
  return process;
}

bool TransferProcess::IsClient() const {
  return type_ == TRANSFER_TYPE_CLIENT;
}

bool TransferProcess::IsProvider() const {
  return type_ == TRANSFER_TYPE_PROVIDER;
}

void TransferProcess::Transition(TransferProcessState target) {
  if (!CanTransition(state_, target)) {
    throw util::InvalidState("transfer process " + id_ + ": illegal transition " + std::string(ToString(state_)) + " -> " +
                             std::string(ToString(target)));
  }
  state_count_        = state_ == target ? state_count_ + 1 : 1;
  state_              = target;
  state_timestamp_ms_ = util::NowMillis();
}

void TransferProcess::TransitionInitial() {
  Transition(TRANSFER_PROCESS_STATE_INITIAL);
}

void TransferProcess::TransitionProvisioning(ResourceManifest manifest) {
  Transition(TRANSFER_PROCESS_STATE_PROVISIONING);
  resource_manifest_ = std::move(manifest);
}

void TransferProcess::TransitionProvisioned() {
  Transition(TRANSFER_PROCESS_STATE_PROVISIONED);
}

void TransferProcess::TransitionRequested() {
  if (!IsClient()) {
    throw util::InvalidState("transfer process " + id_ + ": only client processes are requested");
  }
  Transition(TRANSFER_PROCESS_STATE_REQUESTED);
}

void TransferProcess::TransitionRequestAck() {
  if (!IsClient()) {
    throw util::InvalidState("transfer process " + id_ + ": only client processes are acknowledged");
  }
  Transition(TRANSFER_PROCESS_STATE_REQUESTED_ACK);
}

void TransferProcess::TransitionInProgress() {
  if (!IsProvider()) {
    throw util::InvalidState("transfer process " + id_ + ": only provider processes start a data flow");
  }
  Transition(TRANSFER_PROCESS_STATE_IN_PROGRESS);
}

void TransferProcess::TransitionError(std::string detail) {
  Transition(TRANSFER_PROCESS_STATE_ERROR);
  error_detail_ = std::move(detail);
}

void TransferProcess::AddProvisionedResource(ProvisionedResource resource) {
  if (state_ != TRANSFER_PROCESS_STATE_PROVISIONING) {
    throw util::InvalidState("transfer process " + id_ + ": resources can only be added while provisioning");
  }
  resource.set_transfer_process_id(id_);
  provisioned_resources_.push_back(std::move(resource));
}

bool TransferProcess::ProvisioningComplete() const {
  if (!resource_manifest_) {
    return false;
  }
  for (const auto& definition : resource_manifest_->definitions()) {
    const bool provisioned =
        std::any_of(provisioned_resources_.begin(), provisioned_resources_.end(),
                    [&](const ProvisionedResource& resource) { return resource.resource_definition_id() == definition.id(); });
    if (!provisioned) {
      return false;
    }
  }
  return true;
}

TransferProcessDescriptor TransferProcess::ToDescriptor() const {
  TransferProcessDescriptor descriptor;
  descriptor.set_id(id_);
  descriptor.set_type(type_);
  descriptor.set_state(state_);
  descriptor.set_state_count(state_count_);
  descriptor.set_state_timestamp_ms(state_timestamp_ms_);
  *descriptor.mutable_data_request() = data_request_;
  if (resource_manifest_) {
    *descriptor.mutable_resource_manifest() = *resource_manifest_;
  }
  for (const auto& resource : provisioned_resources_) {
    *descriptor.add_provisioned_resources() = resource;
  }
  descriptor.set_error_detail(error_detail_);
  return descriptor;
}

} // namespace transfer::model
