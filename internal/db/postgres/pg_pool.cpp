#include "pg_pool.hpp"

namespace transfer::db::postgres {

namespace {

constexpr const char* kColumns =
    "id,type,state,state_count,state_timestamp_ms,data_request,resource_manifest,provisioned_resources,error_detail";

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  const std::string columns = kColumns;

  conn.prepare("insert_process",
               "INSERT INTO transfer_process(" + columns + ") VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("get_process", "SELECT " + columns + " FROM transfer_process WHERE id=$1");

  conn.prepare("update_process",
               "UPDATE transfer_process SET type=$2,state=$3,state_count=$4,state_timestamp_ms=$5,"
               "data_request=$6,resource_manifest=$7,provisioned_resources=$8,error_detail=$9 WHERE id=$1");

  conn.prepare("list_processes", "SELECT " + columns + " FROM transfer_process ORDER BY id");

  conn.prepare("next_for_state",
               "SELECT " + columns + " FROM transfer_process WHERE state=$1 "
               "ORDER BY state_timestamp_ms ASC, id ASC LIMIT $2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace transfer::db::postgres
