#include "internal/db/sqlite/sqlite_db.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using treasury::db::sqlite::SqliteDB;
using treasury::db::sqlite::SqliteOptions;

std::string TempDbPath(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  return (std::filesystem::temp_directory_path() / ("treasury_ledger_sqlite_db_" + name + "_" + std::to_string(stamp) + ".db")).string();
}

void RemoveDb(const std::string& path) {
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

const std::vector<std::string> kSteps = {
    "CREATE TABLE ledgers (id TEXT PRIMARY KEY);",
    "CREATE TABLE holdings (ledger_id TEXT NOT NULL REFERENCES ledgers(id), holder TEXT NOT NULL);",
};

void TestWalModeIsApplied() {
  const auto path = TempDbPath("wal");
  {
    SqliteDB db(path, SqliteOptions{});
    assert(db.JournalMode() == "wal");
    assert(db.Path() == path);
  }
  RemoveDb(path);
}

void TestRollbackJournalWhenWalIsOff() {
  const auto path = TempDbPath("delete");
  {
    SqliteOptions options;
    options.wal_mode = false;
    SqliteDB db(path, options);
    assert(db.JournalMode() == "delete");
  }
  RemoveDb(path);
}

void TestInMemoryFallsBackWithoutThrowing() {
  SqliteDB db(":memory:", SqliteOptions{});
  assert(db.JournalMode() == "memory");
}

void TestMigrationsRunOnceAndResume() {
  const auto path = TempDbPath("migrate");
  {
    SqliteDB db(path, SqliteOptions{});
    assert(db.UserVersion() == 0);

    db.ApplyMigrations({kSteps[0]});
    assert(db.UserVersion() == 1);

    // Step one is skipped; only the new step runs.
    db.ApplyMigrations(kSteps);
    assert(db.UserVersion() == 2);
    db.ApplyMigrations(kSteps);
    assert(db.UserVersion() == 2);
  }
  {
    SqliteDB reopened(path, SqliteOptions{});
    assert(reopened.UserVersion() == 2);
    reopened.Exec("INSERT INTO ledgers (id) VALUES ('ledger-1');");
    reopened.Exec("INSERT INTO holdings (ledger_id, holder) VALUES ('ledger-1', 'alice');");
  }
  RemoveDb(path);
}

void TestFailedMigrationKeepsVersion() {
  SqliteDB db(":memory:", SqliteOptions{});
  db.ApplyMigrations({kSteps[0]});

  bool threw = false;
  try {
    db.ApplyMigrations({kSteps[0], "CREATE TABLE broken (;"});
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(db.UserVersion() == 1);
}

void TestForeignKeysAreEnforced() {
  SqliteDB db(":memory:", SqliteOptions{});
  db.ApplyMigrations(kSteps);

  bool threw = false;
  try {
    db.Exec("INSERT INTO holdings (ledger_id, holder) VALUES ('missing', 'alice');");
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).find("FOREIGN KEY") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestWalModeIsApplied();
  TestRollbackJournalWhenWalIsOff();
  TestInMemoryFallsBackWithoutThrowing();
  TestMigrationsRunOnceAndResume();
  TestFailedMigrationKeepsVersion();
  TestForeignKeysAreEnforced();

  std::cout << "treasury_ledger_unit_sqlite_db: pass\n";
  return 0;
}
