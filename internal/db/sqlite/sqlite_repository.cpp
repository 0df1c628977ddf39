#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace treasury::db::sqlite {

using treasury::db::ErrorCode;
using treasury::db::Result;

namespace {

// Finalizes on scope exit so early returns cannot leak statements.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(stmt_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

// Stored as the signed bit pattern; ColU64 reverses it.
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

constexpr const char* kSelectLedger =
    "SELECT id,circulating_supply,oracle_value,oracle_updated_ms,governance,paused,version,created_at_ms FROM ledgers";

model::LedgerRecord ReadLedgerRow(sqlite3_stmt* st) {
  model::LedgerRecord r;
  r.id                 = ColText(st, 0);
  r.circulating_supply = ColU64(st, 1);
  r.oracle_value       = ColU64(st, 2);
  r.oracle_updated_ms  = ColU64(st, 3);
  r.governance         = ColText(st, 4);
  r.paused             = sqlite3_column_int(st, 5) != 0;
  r.version            = ColU64(st, 6);
  r.created_at_ms      = ColU64(st, 7);
  return r;
}

model::LedgerEventRecord ReadEventRow(sqlite3_stmt* st) {
  model::LedgerEventRecord e;
  e.ledger_id        = ColText(st, 0);
  e.sequence         = ColU64(st, 1);
  e.kind             = static_cast<treasury::ledger::core::v1::LedgerEventKind>(sqlite3_column_int(st, 2));
  e.actor            = ColText(st, 3);
  e.counterparty     = ColText(st, 4);
  e.amount           = ColU64(st, 5);
  e.collateral_value = ColU64(st, 6);
  e.created_at_ms    = ColU64(st, 7);
  return e;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
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

// ------------------------------------------------------------------
// Collateral entries
// ------------------------------------------------------------------

Result SqliteRepository::WriteEntries(sqlite3* db, const model::LedgerRecord& r) {
  {
    Statement del(db, "DELETE FROM collateral_entries WHERE ledger_id=?;");
    BindText(del.get(), 1, r.id);
    auto res = Translate(db, sqlite3_step(del.get()));
    if (!res) return res;
  }

  Statement ins(db, "INSERT INTO collateral_entries(ledger_id,position,asset_id,description,value) VALUES(?,?,?,?,?);");
  for (size_t i = 0; i < r.entries.size(); ++i) {
    sqlite3_reset(ins.get());
    BindText(ins.get(), 1, r.id);
    BindU64(ins.get(), 2, i);
    BindBlob(ins.get(), 3, r.entries[i].asset_id);
    BindText(ins.get(), 4, r.entries[i].description);
    BindU64(ins.get(), 5, r.entries[i].value);
    auto res = Translate(db, sqlite3_step(ins.get()));
    if (!res) return res;
  }
  return Result::Ok();
}

std::vector<model::CollateralEntryRecord> SqliteRepository::ReadEntries(sqlite3* db, const std::string& ledger_id) {
  Statement st(db, "SELECT asset_id,description,value FROM collateral_entries WHERE ledger_id=? ORDER BY position;");
  BindText(st.get(), 1, ledger_id);

  std::vector<model::CollateralEntryRecord> entries;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    entries.push_back({ColBlob(st.get(), 0), ColText(st.get(), 1), ColU64(st.get(), 2)});
  }
  return entries;
}

// ------------------------------------------------------------------
// Ledgers
// ------------------------------------------------------------------

Result SqliteRepository::InsertLedger(Transaction& t, const model::LedgerRecord& r) {
  auto* db = TX(t).Handle();

  if (GetLedger(t, r.id).has_value()) {
    return Result::Err(ErrorCode::AlreadyExists, "ledger already exists: " + r.id);
  }

  {
    Statement st(db,
                 "INSERT INTO ledgers(id,circulating_supply,oracle_value,oracle_updated_ms,governance,paused,version,created_at_ms) "
                 "VALUES(?,?,?,?,?,?,?,?);");
    BindText(st.get(), 1, r.id);
    BindU64(st.get(), 2, r.circulating_supply);
    BindU64(st.get(), 3, r.oracle_value);
    BindU64(st.get(), 4, r.oracle_updated_ms);
    BindText(st.get(), 5, r.governance);
    sqlite3_bind_int(st.get(), 6, r.paused ? 1 : 0);
    BindU64(st.get(), 7, r.version);
    BindU64(st.get(), 8, r.created_at_ms);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }

  return WriteEntries(db, r);
}

std::optional<model::LedgerRecord> SqliteRepository::GetLedger(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  std::optional<model::LedgerRecord> record;
  {
    Statement st(db, (std::string(kSelectLedger) + " WHERE id=?;").c_str());
    BindText(st.get(), 1, id);
    if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
    record = ReadLedgerRow(st.get());
  }
  record->entries = ReadEntries(db, id);
  return record;
}

std::vector<model::LedgerRecord> SqliteRepository::ListLedgers(Transaction& t) {
  auto* db = TX(t).Handle();

  std::vector<model::LedgerRecord> records;
  {
    Statement st(db, (std::string(kSelectLedger) + " ORDER BY id;").c_str());
    while (sqlite3_step(st.get()) == SQLITE_ROW) {
      records.push_back(ReadLedgerRow(st.get()));
    }
  }
  for (auto& record : records) {
    record.entries = ReadEntries(db, record.id);
  }
  return records;
}

Result SqliteRepository::UpdateLedger(Transaction& t, const model::LedgerRecord& r) {
  auto* db = TX(t).Handle();

  {
    // Optimistic check: only the successor of the stored version may land.
    Statement st(db,
                 "UPDATE ledgers SET circulating_supply=?,oracle_value=?,oracle_updated_ms=?,governance=?,paused=?,version=? "
                 "WHERE id=? AND version=?;");
    BindU64(st.get(), 1, r.circulating_supply);
    BindU64(st.get(), 2, r.oracle_value);
    BindU64(st.get(), 3, r.oracle_updated_ms);
    BindText(st.get(), 4, r.governance);
    sqlite3_bind_int(st.get(), 5, r.paused ? 1 : 0);
    BindU64(st.get(), 6, r.version);
    BindText(st.get(), 7, r.id);
    BindU64(st.get(), 8, r.version - 1);
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }

  if (sqlite3_changes(db) == 0) {
    if (!GetLedger(t, r.id).has_value()) return Result::Err(ErrorCode::NotFound, "ledger not found: " + r.id);
    return Result::Err(ErrorCode::Conflict, "ledger version mismatch: " + r.id);
  }

  return WriteEntries(db, r);
}

// ------------------------------------------------------------------
// Holdings
// ------------------------------------------------------------------

Result SqliteRepository::UpsertHolding(Transaction& t, const model::HoldingRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO holdings(ledger_id,holder,balance) VALUES(?,?,?) "
               "ON CONFLICT(ledger_id,holder) DO UPDATE SET balance=excluded.balance;");
  BindText(st.get(), 1, r.ledger_id);
  BindText(st.get(), 2, r.holder);
  BindU64(st.get(), 3, r.balance);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) {
    // foreign key: the ledger row does not exist
    return Result::Err(ErrorCode::NotFound, "ledger not found: " + r.ledger_id);
  }
  return Translate(db, rc);
}

std::optional<model::HoldingRecord> SqliteRepository::GetHolding(Transaction& t, const std::string& ledger_id, const std::string& holder) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT ledger_id,holder,balance FROM holdings WHERE ledger_id=? AND holder=?;");
  BindText(st.get(), 1, ledger_id);
  BindText(st.get(), 2, holder);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return model::HoldingRecord{ColText(st.get(), 0), ColText(st.get(), 1), ColU64(st.get(), 2)};
}

std::vector<model::HoldingRecord> SqliteRepository::ListHoldings(Transaction& t, const std::string& ledger_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT ledger_id,holder,balance FROM holdings WHERE ledger_id=? ORDER BY holder;");
  BindText(st.get(), 1, ledger_id);

  std::vector<model::HoldingRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColU64(st.get(), 2)});
  }
  return out;
}

// ------------------------------------------------------------------
// Audit journal
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::LedgerEventRecord& event) {
  auto* db = TX(t).Handle();

  if (!GetLedger(t, event.ledger_id).has_value()) {
    return Result::Err(ErrorCode::NotFound, "ledger not found: " + event.ledger_id);
  }

  uint64_t next = 1;
  {
    Statement st(db, "SELECT COALESCE(MAX(sequence),0)+1 FROM ledger_events WHERE ledger_id=?;");
    BindText(st.get(), 1, event.ledger_id);
    if (sqlite3_step(st.get()) == SQLITE_ROW) next = ColU64(st.get(), 0);
  }

  Statement st(db,
               "INSERT INTO ledger_events(ledger_id,sequence,kind,actor,counterparty,amount,collateral_value,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?);");
  BindText(st.get(), 1, event.ledger_id);
  BindU64(st.get(), 2, next);
  sqlite3_bind_int(st.get(), 3, static_cast<int>(event.kind));
  BindText(st.get(), 4, event.actor);
  BindText(st.get(), 5, event.counterparty);
  BindU64(st.get(), 6, event.amount);
  BindU64(st.get(), 7, event.collateral_value);
  BindU64(st.get(), 8, event.created_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res) event.sequence = next;
  return res;
}

std::vector<model::LedgerEventRecord> SqliteRepository::ListEvents(Transaction& t, const std::string& ledger_id, uint64_t start_sequence,
                                                                   std::optional<uint64_t> max_events) {
  auto* db = TX(t).Handle();

  // LIMIT -1 means no limit in sqlite
  Statement st(db,
               "SELECT ledger_id,sequence,kind,actor,counterparty,amount,collateral_value,created_at_ms FROM ledger_events "
               "WHERE ledger_id=? AND sequence>=? ORDER BY sequence LIMIT ?;");
  BindText(st.get(), 1, ledger_id);
  BindU64(st.get(), 2, start_sequence);
  sqlite3_bind_int64(st.get(), 3, max_events ? static_cast<sqlite3_int64>(*max_events) : -1);

  std::vector<model::LedgerEventRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadEventRow(st.get()));
  }
  return out;
}

} // namespace treasury::db::sqlite
