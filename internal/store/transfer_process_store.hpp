#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/transfer_process.hpp"

namespace transfer::store {

/*
  Durable storage of transfer processes, keyed by process id.

  Every method may be called concurrently from the manager loop, intake
  callers and provisioning callbacks. Update is last-write-wins.
  UpdateIfState is the guarded write for a process that more than one
  thread may move out of the same state.

  Errors are reported as util::NotFound / util::AlreadyExists or
  std::runtime_error for backend failures.
*/
class TransferProcessStore {
 public:
  virtual ~TransferProcessStore() = default;

  virtual void Create(const model::TransferProcess& process) = 0;

  virtual void Update(const model::TransferProcess& process) = 0;

  // Writes only while the stored state is still `expected`; false otherwise.
  // Throws util::NotFound when the process does not exist.
  virtual bool UpdateIfState(const model::TransferProcess& process, model::TransferProcessState expected) = 0;

  virtual std::optional<model::TransferProcess> Find(const std::string& id) = 0;

  // At most `limit` processes in `state`; oldest transition first.
  virtual std::vector<model::TransferProcess> NextForState(model::TransferProcessState state, std::size_t limit) = 0;

  virtual std::vector<model::TransferProcess> List() = 0;
};

} // namespace transfer::store
