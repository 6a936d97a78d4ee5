#pragma once

#include "transfer/manager/core/v1/types.pb.h"

#include "transfer/manager/services/v1/transfer_service.pb.h"
#include "transfer/manager/services/v1/transfer_service.grpc.pb.h"

namespace transfer::manager::v1 {
using namespace ::transfer::manager::core::v1;
using namespace ::transfer::manager::services::v1;
}
