#include "manifest_generator.hpp"

#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace transfer::provision {

using namespace transfer::manager::core::v1;

void RegistryManifestGenerator::RegisterClientGenerator(std::shared_ptr<ClientResourceGenerator> generator) {
  if (!generator) {
    throw std::invalid_argument("client resource generator is null");
  }
  std::lock_guard lock(mutex_);
  client_generators_.push_back(std::move(generator));
}

void RegistryManifestGenerator::RegisterProviderGenerator(std::shared_ptr<ProviderResourceGenerator> generator) {
  if (!generator) {
    throw std::invalid_argument("provider resource generator is null");
  }
  std::lock_guard lock(mutex_);
  provider_generators_.push_back(std::move(generator));
}

template <typename Generator>
ResourceManifest RegistryManifestGenerator::Collect(const std::vector<std::shared_ptr<Generator>>& generators,
                                                    const DataRequest&                            request) {
  ResourceManifest manifest;
  for (const auto& generator : generators) {
    auto definition = generator->Generate(request);
    if (!definition) {
      continue;
    }
    if (definition->id().empty()) {
      definition->set_id(util::GenerateUUIDString());
    }
    definition->set_transfer_process_id(request.process_id());
    *manifest.add_definitions() = std::move(*definition);
  }
  return manifest;
}

ResourceManifest RegistryManifestGenerator::GenerateClientManifest(const DataRequest& request) {
  std::vector<std::shared_ptr<ClientResourceGenerator>> generators;
  {
    std::lock_guard lock(mutex_);
    generators = client_generators_;
  }
  return Collect(generators, request);
}

ResourceManifest RegistryManifestGenerator::GenerateProviderManifest(const DataRequest& request) {
  std::vector<std::shared_ptr<ProviderResourceGenerator>> generators;
  {
    std::lock_guard lock(mutex_);
    generators = provider_generators_;
  }
  return Collect(generators, request);
}

} // namespace transfer::provision
