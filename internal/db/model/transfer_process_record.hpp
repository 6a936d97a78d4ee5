#pragma once

#include <cstdint>
#include <string>

namespace transfer::db::model {

/*
  Persistent transfer process row.

  Structured payloads (data request, manifest, provisioned resources) are
  stored as protobuf JSON so every backend can keep them in a text column.
  An empty resource_manifest_json means no manifest has been attached yet.
*/

struct TransferProcessRecord {
  std::string id;

  int32_t type  = 0;
  int32_t state = 0;

  uint32_t state_count        = 0;
  uint64_t state_timestamp_ms = 0;

  std::string data_request_json;
  std::string resource_manifest_json;
  std::string provisioned_resources_json;

  std::string error_detail;
};

} // namespace transfer::db::model
