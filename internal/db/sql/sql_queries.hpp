#pragma once

namespace transfer::db::sql {

/*
  Canonical SQL used by the SQLite backend. The Postgres backend prepares the
  same statements with $n placeholders in PgPool.
*/

static constexpr const char* CREATE_TRANSFER_PROCESS_SQLITE =
    "CREATE TABLE IF NOT EXISTS transfer_process ("
    " id TEXT PRIMARY KEY,"
    " type INTEGER NOT NULL,"
    " state INTEGER NOT NULL,"
    " state_count INTEGER NOT NULL,"
    " state_timestamp_ms INTEGER NOT NULL,"
    " data_request TEXT NOT NULL,"
    " resource_manifest TEXT NOT NULL DEFAULT '',"
    " provisioned_resources TEXT NOT NULL DEFAULT '',"
    " error_detail TEXT NOT NULL DEFAULT '');";

static constexpr const char* CREATE_TRANSFER_PROCESS_POSTGRES =
    "CREATE TABLE IF NOT EXISTS transfer_process ("
    " id TEXT PRIMARY KEY,"
    " type SMALLINT NOT NULL,"
    " state INTEGER NOT NULL,"
    " state_count INTEGER NOT NULL,"
    " state_timestamp_ms BIGINT NOT NULL,"
    " data_request TEXT NOT NULL,"
    " resource_manifest TEXT NOT NULL DEFAULT '',"
    " provisioned_resources TEXT NOT NULL DEFAULT '',"
    " error_detail TEXT NOT NULL DEFAULT '');";

static constexpr const char* CREATE_STATE_INDEX =
    "CREATE INDEX IF NOT EXISTS transfer_process_state_idx"
    " ON transfer_process(state, state_timestamp_ms);";

static constexpr const char* INSERT_PROCESS =
    "INSERT INTO transfer_process(id,type,state,state_count,state_timestamp_ms,"
    "data_request,resource_manifest,provisioned_resources,error_detail)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_PROCESS =
    "SELECT id,type,state,state_count,state_timestamp_ms,"
    "data_request,resource_manifest,provisioned_resources,error_detail"
    " FROM transfer_process WHERE id=?;";

static constexpr const char* UPDATE_PROCESS =
    "UPDATE transfer_process SET type=?,state=?,state_count=?,state_timestamp_ms=?,"
    "data_request=?,resource_manifest=?,provisioned_resources=?,error_detail=?"
    " WHERE id=?;";

static constexpr const char* LIST_PROCESSES =
    "SELECT id,type,state,state_count,state_timestamp_ms,"
    "data_request,resource_manifest,provisioned_resources,error_detail"
    " FROM transfer_process ORDER BY id;";

static constexpr const char* NEXT_FOR_STATE =
    "SELECT id,type,state,state_count,state_timestamp_ms,"
    "data_request,resource_manifest,provisioned_resources,error_detail"
    " FROM transfer_process WHERE state=?"
    " ORDER BY state_timestamp_ms ASC, id ASC LIMIT ?;";

} // namespace transfer::db::sql
