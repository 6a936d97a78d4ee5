#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/repository.hpp"
#include "transfer_process_store.hpp"

namespace transfer::store {

/*
  TransferProcessStore backed by a transactional db::Repository.

  Each call runs in its own short transaction and commits before returning.
  Writes are serialized through one mutex so UpdateIfState can check and
  write without another writer in between.
*/
class RepositoryTransferProcessStore final : public TransferProcessStore {
 public:
  explicit RepositoryTransferProcessStore(std::shared_ptr<db::Repository> repository);

  void Create(const model::TransferProcess& process) override;
  void Update(const model::TransferProcess& process) override;
  bool UpdateIfState(const model::TransferProcess& process, model::TransferProcessState expected) override;
  std::optional<model::TransferProcess> Find(const std::string& id) override;
  std::vector<model::TransferProcess> NextForState(model::TransferProcessState state, std::size_t limit) override;
  std::vector<model::TransferProcess> List() override;

 private:
  std::shared_ptr<db::Repository> repository_;
  std::mutex                      write_mutex_;
};

} // namespace transfer::store
