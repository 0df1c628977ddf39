#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace treasury::db::sqlite {

namespace {

std::runtime_error SqliteError(sqlite3* db, const std::string& what) {
  return std::runtime_error("sqlite " + what + ": " + (db ? sqlite3_errmsg(db) : "no connection"));
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(options) {
  if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    auto error = SqliteError(db_, "open " + path_);
    sqlite3_close(db_);
    db_ = nullptr;
    throw error;
  }

  try {
    Configure();
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = "sqlite exec failed: " + std::string(err ? err : sqlite3_errmsg(db_)) + " [" + sql + "]";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

std::string SqliteDB::QueryText(const char* sql) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    throw SqliteError(db_, std::string("prepare ") + sql);
  }

  std::string value;
  const int   rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    const auto* text = sqlite3_column_text(stmt, 0);
    value            = text ? reinterpret_cast<const char*>(text) : "";
  }
  sqlite3_finalize(stmt);

  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw SqliteError(db_, std::string("step ") + sql);
  }
  return value;
}

std::string SqliteDB::JournalMode() {
  return QueryText("PRAGMA journal_mode;");
}

int SqliteDB::UserVersion() {
  return std::stoi(QueryText("PRAGMA user_version;"));
}

void SqliteDB::ApplyMigrations(const std::vector<std::string>& steps) {
  std::lock_guard<std::mutex> lock(tx_mutex_);

  const int current = UserVersion();
  for (int version = current + 1; version <= static_cast<int>(steps.size()); ++version) {
    Exec("BEGIN IMMEDIATE;");
    try {
      Exec(steps[version - 1]);
      Exec("PRAGMA user_version = " + std::to_string(version) + ";");
      Exec("COMMIT;");
    } catch (const std::exception& ex) {
      Exec("ROLLBACK;");
      TREASURY_LOG_ERROR("sqlite migration failed", {observability::StringField("path", path_), observability::UIntField("version", version),
                                                     observability::StringField("error", ex.what())});
      throw;
    }
    TREASURY_LOG_INFO("sqlite schema migrated", {observability::StringField("path", path_), observability::UIntField("version", version)});
  }
}

void SqliteDB::Configure() {
  if (sqlite3_busy_timeout(db_, options_.busy_timeout_ms) != SQLITE_OK) {
    throw SqliteError(db_, "busy_timeout");
  }

  Exec("PRAGMA foreign_keys = ON;");

  if (options_.wal_mode) {
    Exec("PRAGMA journal_mode = WAL;");
    Exec("PRAGMA synchronous = NORMAL;");
  } else {
    Exec("PRAGMA synchronous = FULL;");
  }

  const auto journal = JournalMode();
  if (options_.wal_mode && journal != "wal") {
    // In-memory databases cannot use WAL.
    TREASURY_LOG_WARN("sqlite WAL unavailable", {observability::StringField("path", path_), observability::StringField("journal_mode", journal)});
  }
}

} // namespace treasury::db::sqlite
