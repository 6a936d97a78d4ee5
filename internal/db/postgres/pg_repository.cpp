#include "pg_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace transfer::db::postgres {

namespace {

model::TransferProcessRecord ReadRow(const pqxx::row& row) {
  model::TransferProcessRecord r;
  r.id                         = row[0].c_str();
  r.type                       = row[1].as<int32_t>();
  r.state                      = row[2].as<int32_t>();
  r.state_count                = row[3].as<uint32_t>();
  r.state_timestamp_ms         = row[4].as<uint64_t>();
  r.data_request_json          = row[5].c_str();
  r.resource_manifest_json     = row[6].c_str();
  r.provisioned_resources_json = row[7].c_str();
  r.error_detail               = row[8].c_str();
  return r;
}

std::vector<model::TransferProcessRecord> ReadAll(const pqxx::result& res) {
  std::vector<model::TransferProcessRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  tx.exec(sql::CREATE_TRANSFER_PROCESS_POSTGRES);
  tx.exec(sql::CREATE_STATE_INDEX);
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertProcess(Transaction& t, const model::TransferProcessRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_process", r.id, r.type, r.state, r.state_count, r.state_timestamp_ms, r.data_request_json,
                               r.resource_manifest_json, r.provisioned_resources_json, r.error_detail);
    return Result::Ok();
  } catch (const pqxx::unique_violation& e) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TransferProcessRecord> PgRepository::GetProcess(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_process", id);
  if (res.empty()) return std::nullopt;
  return ReadRow(res[0]);
}

Result PgRepository::UpdateProcess(Transaction& t, const model::TransferProcessRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_process", r.id, r.type, r.state, r.state_count, r.state_timestamp_ms,
                                          r.data_request_json, r.resource_manifest_json, r.provisioned_resources_json, r.error_detail);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TransferProcessRecord> PgRepository::ListProcesses(Transaction& t) {
  return ReadAll(TX(t).Work().exec_prepared("list_processes"));
}

std::vector<model::TransferProcessRecord> PgRepository::NextForState(Transaction& t, int32_t state, std::size_t limit) {
  return ReadAll(TX(t).Work().exec_prepared("next_for_state", state, static_cast<int64_t>(limit)));
}

} // namespace transfer::db::postgres
