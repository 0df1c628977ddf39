#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace treasury::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection's transaction mutex for its whole lifetime, since
  SQLite nests nothing on one connection. BEGIN IMMEDIATE takes the write
  lock up front; other processes queue on busy_timeout.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> lock_;
  bool finished_  = false;
};

}
