#include "directory_provisioner.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace transfer::provision {

using namespace transfer::manager::core::v1;

namespace {

constexpr const char* kFileType = "file";

bool WantsFile(const DataRequest& request) {
  return request.destination_type() == kFileType || request.data_destination().type() == kFileType;
}

} // namespace

std::optional<ResourceDefinition> DirectoryResourceGenerator::Generate(const DataRequest& request) {
  if (!WantsFile(request)) {
    return std::nullopt;
  }

  ResourceDefinition definition;
  definition.set_type(kDirectoryResourceType);
  const auto& props = request.data_destination().properties();
  if (auto it = props.find("path"); it != props.end()) {
    (*definition.mutable_properties())["destination_path"] = it->second;
  }
  return definition;
}

DirectoryProvisioner::DirectoryProvisioner(std::filesystem::path staging_root) : staging_root_(std::move(staging_root)) {
  if (staging_root_.empty()) {
    throw util::ConfigurationError("directory provisioner requires a staging root");
  }
}

bool DirectoryProvisioner::CanProvision(const ResourceDefinition& definition) const {
  return definition.type() == kDirectoryResourceType;
}

void DirectoryProvisioner::Provision(const ResourceDefinition& definition, ProvisionCallback done) {
  if (definition.transfer_process_id().empty() || definition.id().empty()) {
    done(ProvisionResult::Failed("directory definition is missing its process or definition id"));
    return;
  }

  const auto dir = staging_root_ / definition.transfer_process_id() / definition.id();

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    done(ProvisionResult::Failed("create " + dir.string() + ": " + ec.message()));
    return;
  }

  TRANSFER_LOG_DEBUG("Provisioned staging directory", {observability::StringField("process_id", definition.transfer_process_id()),
                                                       observability::StringField("path", dir.string())});

  ProvisionedResource resource;
  resource.set_id(util::GenerateUUIDString());
  resource.set_resource_definition_id(definition.id());
  resource.set_transfer_process_id(definition.transfer_process_id());
  (*resource.mutable_properties())["path"] = dir.string();
  done(ProvisionResult::Ok(std::move(resource)));
}

} // namespace transfer::provision
