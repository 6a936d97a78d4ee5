#include "memory_tx.hpp"

#include <stdexcept>

namespace transfer::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& id : inserted_) {
    if (repo_.committed_.contains(id)) {
      throw std::runtime_error("transaction conflict: transfer process " + id + " was inserted concurrently");
    }
  }
  for (auto& [id, record] : writes_) {
    repo_.committed_[id] = std::move(record);
  }
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  inserted_.clear();
  rolled_back_ = true;
}

} // namespace transfer::db::memory
