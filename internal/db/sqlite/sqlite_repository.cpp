#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace transfer::db::sqlite {

using transfer::db::ErrorCode;
using transfer::db::Result;

namespace {

struct StatementDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Statement(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Binds every column but id, starting at `first`.
int BindColumns(sqlite3_stmt* st, int first, const model::TransferProcessRecord& r) {
  int idx = first;
  BindI64(st, idx++, r.type);
  BindI64(st, idx++, r.state);
  BindI64(st, idx++, r.state_count);
  BindI64(st, idx++, static_cast<int64_t>(r.state_timestamp_ms));
  BindText(st, idx++, r.data_request_json);
  BindText(st, idx++, r.resource_manifest_json);
  BindText(st, idx++, r.provisioned_resources_json);
  BindText(st, idx++, r.error_detail);
  return idx;
}

model::TransferProcessRecord ReadRow(sqlite3_stmt* st) {
  model::TransferProcessRecord r;
  r.id                         = ColText(st, 0);
  r.type                       = static_cast<int32_t>(ColI64(st, 1));
  r.state                      = static_cast<int32_t>(ColI64(st, 2));
  r.state_count                = static_cast<uint32_t>(ColI64(st, 3));
  r.state_timestamp_ms         = static_cast<uint64_t>(ColI64(st, 4));
  r.data_request_json          = ColText(st, 5);
  r.resource_manifest_json     = ColText(st, 6);
  r.provisioned_resources_json = ColText(st, 7);
  r.error_detail               = ColText(st, 8);
  return r;
}

std::vector<model::TransferProcessRecord> ReadAll(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::TransferProcessRecord> out;
  int                                       rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadRow(st));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(sql::CREATE_TRANSFER_PROCESS_SQLITE);
  db.Exec(sql::CREATE_STATE_INDEX);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::InsertProcess(Transaction& t, const model::TransferProcessRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_PROCESS);

  BindText(st.get(), 1, r.id);
  BindColumns(st.get(), 2, r);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, r.id);
  }
  return Translate(db, rc);
}

std::optional<model::TransferProcessRecord> SqliteRepository::GetProcess(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_PROCESS);
  BindText(st.get(), 1, id);

  auto rows = ReadAll(db, st.get());
  if (rows.empty()) return std::nullopt;
  return std::move(rows.front());
}

Result SqliteRepository::UpdateProcess(Transaction& t, const model::TransferProcessRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_PROCESS);

  const int id_idx = BindColumns(st.get(), 1, r);
  BindText(st.get(), id_idx, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, r.id);
  }
  return Translate(db, rc);
}

std::vector<model::TransferProcessRecord> SqliteRepository::ListProcesses(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::LIST_PROCESSES);
  return ReadAll(db, st.get());
}

std::vector<model::TransferProcessRecord> SqliteRepository::NextForState(Transaction& t, int32_t state, std::size_t limit) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::NEXT_FOR_STATE);
  BindI64(st.get(), 1, state);
  BindI64(st.get(), 2, static_cast<int64_t>(limit));
  return ReadAll(db, st.get());
}

} // namespace transfer::db::sqlite
