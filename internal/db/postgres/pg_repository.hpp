#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace transfer::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Creates the transfer_process table and its state index if missing.
  static void BootstrapSchema(PgPool& pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProcess(Transaction&, const model::TransferProcessRecord&) override;
  std::optional<model::TransferProcessRecord> GetProcess(Transaction&, const std::string&) override;
  Result UpdateProcess(Transaction&, const model::TransferProcessRecord&) override;
  std::vector<model::TransferProcessRecord> ListProcesses(Transaction&) override;
  std::vector<model::TransferProcessRecord> NextForState(Transaction&, int32_t state, std::size_t limit) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
