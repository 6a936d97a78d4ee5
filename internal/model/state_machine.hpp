#pragma once

#include <string_view>

#include "transfer/manager/core/v1/types.pb.h"

namespace transfer::model {

using TransferProcessState = transfer::manager::core::v1::TransferProcessState;
using TransferType         = transfer::manager::core::v1::TransferType;

constexpr bool IsTerminal(TransferProcessState state) {
  return state == transfer::manager::core::v1::TRANSFER_PROCESS_STATE_ERROR;
}

/*
  Forward-only transition graph.

  ERROR is reachable from every saved, non-terminal state. Role-specific edges
  (REQUESTED for clients, IN_PROGRESS for providers) are checked by
  TransferProcess, not here.
*/
constexpr bool CanTransition(TransferProcessState from, TransferProcessState to) {
  using namespace transfer::manager::core::v1;

  if (IsTerminal(from)) {
    return false;
  }
  if (to == TRANSFER_PROCESS_STATE_ERROR) {
    return from != TRANSFER_PROCESS_STATE_UNSAVED;
  }

  switch (from) {
    case TRANSFER_PROCESS_STATE_UNSAVED:
      return to == TRANSFER_PROCESS_STATE_INITIAL;
    case TRANSFER_PROCESS_STATE_INITIAL:
      return to == TRANSFER_PROCESS_STATE_PROVISIONING;
    case TRANSFER_PROCESS_STATE_PROVISIONING:
      return to == TRANSFER_PROCESS_STATE_PROVISIONED;
    case TRANSFER_PROCESS_STATE_PROVISIONED:
      return to == TRANSFER_PROCESS_STATE_REQUESTED || to == TRANSFER_PROCESS_STATE_IN_PROGRESS;
    case TRANSFER_PROCESS_STATE_REQUESTED:
      return to == TRANSFER_PROCESS_STATE_REQUESTED_ACK;
    default:
      return false;
  }
}

std::string_view ToString(TransferProcessState state);
std::string_view ToString(TransferType type);

} // namespace transfer::model
