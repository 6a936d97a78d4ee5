#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "transfer/manager/core/v1/types.pb.h"

namespace transfer::provision {

/*
  Computes the resources a transfer needs before it can run.

  Pure: the same request always yields the same manifest shape. Called only
  from the manager loop.
*/
class ResourceManifestGenerator {
 public:
  virtual ~ResourceManifestGenerator() = default;

  virtual transfer::manager::core::v1::ResourceManifest GenerateClientManifest(
      const transfer::manager::core::v1::DataRequest& request) = 0;

  virtual transfer::manager::core::v1::ResourceManifest GenerateProviderManifest(
      const transfer::manager::core::v1::DataRequest& request) = 0;
};

// Contributes at most one client-side definition for a request.
class ClientResourceGenerator {
 public:
  virtual ~ClientResourceGenerator() = default;

  virtual std::optional<transfer::manager::core::v1::ResourceDefinition> Generate(
      const transfer::manager::core::v1::DataRequest& request) = 0;
};

// Contributes at most one provider-side definition for a request.
class ProviderResourceGenerator {
 public:
  virtual ~ProviderResourceGenerator() = default;

  virtual std::optional<transfer::manager::core::v1::ResourceDefinition> Generate(
      const transfer::manager::core::v1::DataRequest& request) = 0;
};

/*
  Manifest generator that asks every registered generator for its role.

  Definitions get a fresh id and the request's process id stamped on them.
*/
class RegistryManifestGenerator final : public ResourceManifestGenerator {
 public:
  void RegisterClientGenerator(std::shared_ptr<ClientResourceGenerator> generator);
  void RegisterProviderGenerator(std::shared_ptr<ProviderResourceGenerator> generator);

  transfer::manager::core::v1::ResourceManifest GenerateClientManifest(
      const transfer::manager::core::v1::DataRequest& request) override;

  transfer::manager::core::v1::ResourceManifest GenerateProviderManifest(
      const transfer::manager::core::v1::DataRequest& request) override;

 private:
  template <typename Generator>
  static transfer::manager::core::v1::ResourceManifest Collect(const std::vector<std::shared_ptr<Generator>>& generators,
                                                               const transfer::manager::core::v1::DataRequest& request);

  std::mutex                                              mutex_;
  std::vector<std::shared_ptr<ClientResourceGenerator>>   client_generators_;
  std::vector<std::shared_ptr<ProviderResourceGenerator>> provider_generators_;
};

} // namespace transfer::provision
