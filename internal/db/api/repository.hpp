#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/transfer_process_record.hpp"

namespace transfer::db {

/*
  Repository abstraction.

  GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Updates replace the whole row; the last committed write wins

  The DB is the source of truth for transfer process state. The manager
  keeps nothing in memory across iterations.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual Result InsertProcess(Transaction&, const model::TransferProcessRecord&) = 0;

  virtual std::optional<model::TransferProcessRecord> GetProcess(Transaction&, const std::string& id) = 0;

  virtual Result UpdateProcess(Transaction&, const model::TransferProcessRecord&) = 0;

  virtual std::vector<model::TransferProcessRecord> ListProcesses(Transaction&) = 0;

  // At most `limit` rows in `state`, oldest state_timestamp_ms first.
  virtual std::vector<model::TransferProcessRecord> NextForState(Transaction&, int32_t state, std::size_t limit) = 0;
};

} // namespace transfer::db
