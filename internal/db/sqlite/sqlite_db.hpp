#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace transfer::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  Transactions on the shared connection are serialized through TxMutex();
  SqliteTransaction holds it from BEGIN until COMMIT/ROLLBACK.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace transfer::db::sqlite
