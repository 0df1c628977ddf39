#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <vector>

namespace treasury::db::sqlite {

struct SqliteOptions {
  bool wal_mode        = true;
  int  busy_timeout_ms = 5000;
};

/*
  Owns one sqlite3 connection for the ledger store.

  The connection is opened serialized and configured once:
    - WAL journal with synchronous=NORMAL, or a rollback journal with
      synchronous=FULL when WAL is off, so a committed ledger write is
      never lost on power failure;
    - foreign keys enforced (holdings and events reference their ledger);
    - lock waits bounded by busy_timeout_ms.

  Schema changes go through ApplyMigrations, which records progress in
  PRAGMA user_version.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // One connection carries one transaction at a time; transactions hold this.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  void Exec(const std::string& sql);

  // Journal mode reported by the connection ("wal", "delete", "memory", ...).
  std::string JournalMode();

  int UserVersion();

  // Step i (0-based) moves the schema to version i + 1. Steps at or below
  // the stored version are skipped; each pending step commits on its own.
  void ApplyMigrations(const std::vector<std::string>& steps);

 private:
  void        Configure();
  std::string QueryText(const char* sql);

  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace treasury::db::sqlite
