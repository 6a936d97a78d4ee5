#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace transfer::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing sections get their defaults (see ApplyDefaults).
*/
class ConfigLoader {
 public:
  static transfer::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static transfer::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills every unset field that has a default. Idempotent.
  static void ApplyDefaults(transfer::runtime::config::RuntimeConfig& config);
};

inline constexpr const char* kDefaultBindAddress    = "0.0.0.0:50061";
inline constexpr const char* kDefaultLogLevel       = "info";
inline constexpr uint32_t    kDefaultBatchSize      = 5;
inline constexpr uint64_t    kDefaultWaitMs         = 5000;
inline constexpr uint64_t    kDefaultGrpcDeadlineMs = 10000;

} // namespace transfer::config
