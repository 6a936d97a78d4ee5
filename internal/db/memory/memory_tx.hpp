#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace transfer::db::memory {

/*
  Transaction = write set over the committed map.

  Commit applies the write set row by row (last writer wins). Only a
  concurrent insert of the same id is treated as a conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  std::unordered_map<std::string, model::TransferProcessRecord>& Writes() {
    return writes_;
  }
  const std::unordered_map<std::string, model::TransferProcessRecord>& Writes() const {
    return writes_;
  }
  std::unordered_set<std::string>& Inserted() {
    return inserted_;
  }

 private:
  MemoryRepository&                                             repo_;
  std::unordered_map<std::string, model::TransferProcessRecord> writes_;
  std::unordered_set<std::string>                               inserted_;
  bool                                                          committed_   = false;
  bool                                                          rolled_back_ = false;
};

} // namespace transfer::db::memory
