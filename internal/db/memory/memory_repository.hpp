#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace transfer::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProcess(Transaction&, const model::TransferProcessRecord&) override;
  std::optional<model::TransferProcessRecord> GetProcess(Transaction&, const std::string&) override;
  Result UpdateProcess(Transaction&, const model::TransferProcessRecord&) override;
  std::vector<model::TransferProcessRecord> ListProcesses(Transaction&) override;
  std::vector<model::TransferProcessRecord> NextForState(Transaction&, int32_t state, std::size_t limit) override;

private:
  friend class MemoryTransaction;

  using ProcessMap = std::unordered_map<std::string, model::TransferProcessRecord>;

  // Committed rows overlaid with the transaction's own writes.
  ProcessMap Visible(const MemoryTransaction& tx) const;

  mutable std::mutex mutex_;
  ProcessMap         committed_;
};

}
