#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace transfer::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the transfer_process table and its state index if missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProcess(Transaction&, const model::TransferProcessRecord&) override;
  std::optional<model::TransferProcessRecord> GetProcess(Transaction&, const std::string&) override;
  Result UpdateProcess(Transaction&, const model::TransferProcessRecord&) override;
  std::vector<model::TransferProcessRecord> ListProcesses(Transaction&) override;
  std::vector<model::TransferProcessRecord> NextForState(Transaction&, int32_t state, std::size_t limit) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace transfer::db::sqlite
