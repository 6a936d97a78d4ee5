#pragma once

#include "internal/db/model/transfer_process_record.hpp"
#include "internal/model/transfer_process.hpp"

namespace transfer::store {

// Domain <-> row mapping. Nested protobuf payloads are stored as JSON.
db::model::TransferProcessRecord ToRecord(const model::TransferProcess& process);
model::TransferProcess           FromRecord(const db::model::TransferProcessRecord& record);

} // namespace transfer::store
