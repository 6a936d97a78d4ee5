#include <cassert>
#include <functional>
#include <iostream>
#include <string>

#include "internal/model/transfer_process.hpp"
#include "internal/util/errors.hpp"
#include "transfer/manager/v1.hpp"

namespace {

using namespace transfer::manager::v1;
using transfer::model::TransferProcess;

TransferProcess NewProcess(TransferType type) {
  DataRequest request;
  request.set_id("request-1");
  TransferProcess process("process-1", type, request);
  process.TransitionInitial();
  return process;
}

ResourceManifest TwoDefinitions() {
  ResourceManifest manifest;
  manifest.add_definitions()->set_id("def-a");
  manifest.add_definitions()->set_id("def-b");
  return manifest;
}

bool Rejects(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const transfer::util::InvalidState&) {
    return true;
  }
  return false;
}

void TestConstructionValidatesIdentity() {
  assert(Rejects([] { TransferProcess("", TRANSFER_TYPE_CLIENT, DataRequest{}); }));
  assert(Rejects([] { TransferProcess("p", TRANSFER_TYPE_UNSPECIFIED, DataRequest{}); }));

  TransferProcess process("p", TRANSFER_TYPE_PROVIDER, DataRequest{});
  assert(process.State() == TRANSFER_PROCESS_STATE_UNSAVED);
  assert(process.IsProvider());
}

void TestClientHappyPath() {
  auto process = NewProcess(TRANSFER_TYPE_CLIENT);
  assert(process.State() == TRANSFER_PROCESS_STATE_INITIAL);
  assert(process.StateCount() == 1);
  assert(process.StateTimestampMs() > 0);

  process.TransitionProvisioning(TwoDefinitions());
  assert(process.Manifest().has_value());
  process.TransitionProvisioned();
  process.TransitionRequested();
  process.TransitionRequestAck();
  assert(process.State() == TRANSFER_PROCESS_STATE_REQUESTED_ACK);
  assert(process.ErrorDetail().empty());
}

void TestProviderHappyPath() {
  auto process = NewProcess(TRANSFER_TYPE_PROVIDER);
  process.TransitionProvisioning(ResourceManifest{});
  process.TransitionProvisioned();
  process.TransitionInProgress();
  assert(process.State() == TRANSFER_PROCESS_STATE_IN_PROGRESS);
}

void TestRejectedTransitionLeavesProcessUnchanged() {
  auto       process   = NewProcess(TRANSFER_TYPE_CLIENT);
  const auto timestamp = process.StateTimestampMs();

  assert(Rejects([&] { process.TransitionProvisioned(); }));
  assert(Rejects([&] { process.TransitionRequested(); }));
  assert(Rejects([&] { process.TransitionInitial(); }));
  assert(process.State() == TRANSFER_PROCESS_STATE_INITIAL);
  assert(process.StateTimestampMs() == timestamp);
  assert(!process.Manifest().has_value());
}

void TestRoleSpecificEdges() {
  auto client = NewProcess(TRANSFER_TYPE_CLIENT);
  client.TransitionProvisioning(ResourceManifest{});
  client.TransitionProvisioned();
  assert(Rejects([&] { client.TransitionInProgress(); }));
  assert(client.State() == TRANSFER_PROCESS_STATE_PROVISIONED);

  auto provider = NewProcess(TRANSFER_TYPE_PROVIDER);
  provider.TransitionProvisioning(ResourceManifest{});
  provider.TransitionProvisioned();
  assert(Rejects([&] { provider.TransitionRequested(); }));
  assert(provider.State() == TRANSFER_PROCESS_STATE_PROVISIONED);
}

void TestErrorIsTerminal() {
  auto process = NewProcess(TRANSFER_TYPE_CLIENT);
  process.TransitionError("boom");
  assert(process.State() == TRANSFER_PROCESS_STATE_ERROR);
  assert(process.ErrorDetail() == "boom");

  assert(Rejects([&] { process.TransitionError("again"); }));
  assert(Rejects([&] { process.TransitionProvisioning(ResourceManifest{}); }));
  assert(process.ErrorDetail() == "boom");

  TransferProcess unsaved("p", TRANSFER_TYPE_CLIENT, DataRequest{});
  assert(Rejects([&] { unsaved.TransitionError("too early"); }));
}

void TestProvisioningCompleteTracksDefinitions() {
  auto process = NewProcess(TRANSFER_TYPE_CLIENT);
  assert(!process.ProvisioningComplete());

  ProvisionedResource resource;
  resource.set_resource_definition_id("def-a");
  assert(Rejects([&] { process.AddProvisionedResource(resource); }));

  process.TransitionProvisioning(TwoDefinitions());
  process.AddProvisionedResource(resource);
  assert(!process.ProvisioningComplete());

  resource.set_resource_definition_id("def-b");
  process.AddProvisionedResource(resource);
  assert(process.ProvisioningComplete());
  assert(process.ProvisionedResources().size() == 2);
  assert(process.ProvisionedResources()[0].transfer_process_id() == process.Id());
}

void TestDescriptorProjection() {
  auto process = NewProcess(TRANSFER_TYPE_PROVIDER);
  process.TransitionProvisioning(TwoDefinitions());

  const auto descriptor = process.ToDescriptor();
  assert(descriptor.id() == "process-1");
  assert(descriptor.type() == TRANSFER_TYPE_PROVIDER);
  assert(descriptor.state() == TRANSFER_PROCESS_STATE_PROVISIONING);
  assert(descriptor.resource_manifest().definitions_size() == 2);
  assert(descriptor.data_request().id() == "request-1");
}

} // namespace

int main() {
  TestConstructionValidatesIdentity();
  TestClientHappyPath();
  TestProviderHappyPath();
  TestRejectedTransitionLeavesProcessUnchanged();
  TestRoleSpecificEdges();
  TestErrorIsTerminal();
  TestProvisioningCompleteTracksDefinitions();
  TestDescriptorProjection();

  std::cout << "transfer_manager_unit_transfer_process: pass\n";
  return 0;
}
