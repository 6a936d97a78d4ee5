#pragma once

#include <filesystem>
#include <optional>

#include "manifest_generator.hpp"
#include "provision_manager.hpp"

namespace transfer::provision {

inline constexpr const char* kDirectoryResourceType = "directory";

// Asks for a local staging directory whenever the client wants the data as a file.
class DirectoryResourceGenerator final : public ClientResourceGenerator {
 public:
  std::optional<transfer::manager::core::v1::ResourceDefinition> Generate(
      const transfer::manager::core::v1::DataRequest& request) override;
};

/*
  Creates <staging_root>/<process id>/<definition id>.

  Completes synchronously on the calling thread. The provisioned resource
  carries the directory in its "path" property.
*/
class DirectoryProvisioner final : public Provisioner {
 public:
  explicit DirectoryProvisioner(std::filesystem::path staging_root);

  bool CanProvision(const transfer::manager::core::v1::ResourceDefinition& definition) const override;

  void Provision(const transfer::manager::core::v1::ResourceDefinition& definition, ProvisionCallback done) override;

 private:
  std::filesystem::path staging_root_;
};

} // namespace transfer::provision
