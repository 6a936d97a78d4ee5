#include "repository_store.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "process_codec.hpp"

namespace transfer::store {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::Conflict:
      throw util::InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

std::vector<model::TransferProcess> FromRecords(const std::vector<db::model::TransferProcessRecord>& records) {
  std::vector<model::TransferProcess> processes;
  processes.reserve(records.size());
  for (const auto& record : records) {
    processes.push_back(FromRecord(record));
  }
  return processes;
}

} // namespace

RepositoryTransferProcessStore::RepositoryTransferProcessStore(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
  if (!repository_) {
    throw util::ConfigurationError("transfer process store requires a repository");
  }
}

void RepositoryTransferProcessStore::Create(const model::TransferProcess& process) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertProcess(*tx, ToRecord(process)), "create transfer process " + process.Id());
  tx->Commit();
}

void RepositoryTransferProcessStore::Update(const model::TransferProcess& process) {
  std::lock_guard lock(write_mutex_);
  auto            tx = repository_->Begin();
  ThrowIfDbError(repository_->UpdateProcess(*tx, ToRecord(process)), "update transfer process " + process.Id());
  tx->Commit();
}

bool RepositoryTransferProcessStore::UpdateIfState(const model::TransferProcess& process, model::TransferProcessState expected) {
  std::lock_guard lock(write_mutex_);
  auto            tx      = repository_->Begin();
  auto            current = repository_->GetProcess(*tx, process.Id());
  if (!current) {
    tx->Rollback();
    throw util::NotFound("update transfer process " + process.Id());
  }
  if (current->state != static_cast<int32_t>(expected)) {
    tx->Rollback();
    return false;
  }
  ThrowIfDbError(repository_->UpdateProcess(*tx, ToRecord(process)), "update transfer process " + process.Id());
  tx->Commit();
  return true;
}

std::optional<model::TransferProcess> RepositoryTransferProcessStore::Find(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetProcess(*tx, id);
  tx->Commit();
  if (!record) {
    return std::nullopt;
  }
  return FromRecord(*record);
}

std::vector<model::TransferProcess> RepositoryTransferProcessStore::NextForState(model::TransferProcessState state, std::size_t limit) {
  auto tx      = repository_->Begin();
  auto records = repository_->NextForState(*tx, static_cast<int32_t>(state), limit);
  tx->Commit();
  return FromRecords(records);
}

std::vector<model::TransferProcess> RepositoryTransferProcessStore::List() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListProcesses(*tx);
  tx->Commit();
  return FromRecords(records);
}

} // namespace transfer::store
