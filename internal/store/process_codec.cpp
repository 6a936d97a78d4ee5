#include "process_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

namespace transfer::store {

using namespace transfer::manager::core::v1;

namespace {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return json;
}

void FromJson(const std::string& json, google::protobuf::Message* message, const std::string& id) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("transfer process " + id + ": corrupt " + message->GetTypeName() + ": " + std::string(status.message()));
  }
}

} // namespace

db::model::TransferProcessRecord ToRecord(const model::TransferProcess& process) {
  db::model::TransferProcessRecord record;
  record.id                 = process.Id();
  record.type               = static_cast<int32_t>(process.Type());
  record.state              = static_cast<int32_t>(process.State());
  record.state_count        = process.StateCount();
  record.state_timestamp_ms = process.StateTimestampMs();
  record.data_request_json  = ToJson(process.Request());
  if (process.Manifest()) {
    record.resource_manifest_json = ToJson(*process.Manifest());
  }

  ProvisionedResourceSet resources;
  for (const auto& resource : process.ProvisionedResources()) {
    *resources.add_resources() = resource;
  }
  record.provisioned_resources_json = ToJson(resources);
  record.error_detail               = process.ErrorDetail();
  return record;
}

model::TransferProcess FromRecord(const db::model::TransferProcessRecord& record) {
  DataRequest request;
  FromJson(record.data_request_json, &request, record.id);

  std::optional<ResourceManifest> manifest;
  if (!record.resource_manifest_json.empty()) {
    manifest.emplace();
    FromJson(record.resource_manifest_json, &*manifest, record.id);
  }

  std::vector<ProvisionedResource> provisioned;
  if (!record.provisioned_resources_json.empty()) {
    ProvisionedResourceSet resources;
    FromJson(record.provisioned_resources_json, &resources, record.id);
    provisioned.assign(resources.resources().begin(), resources.resources().end());
  }

  return model::TransferProcess::Restore(record.id, static_cast<TransferType>(record.type),
                                         static_cast<TransferProcessState>(record.state), record.state_count,
                                         record.state_timestamp_ms, std::move(request), std::move(manifest), std::move(provisioned),
                                         record.error_detail);
}

} // namespace transfer::store
