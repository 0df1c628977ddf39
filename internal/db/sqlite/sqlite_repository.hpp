#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace treasury::db::sqlite {

/*
  Tables: ledgers, collateral_entries (ordered by position), holdings,
  ledger_events. Schema is created by the factory at startup.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertLedger(Transaction&, const model::LedgerRecord&) override;
  std::optional<model::LedgerRecord> GetLedger(Transaction&, const std::string&) override;
  std::vector<model::LedgerRecord> ListLedgers(Transaction&) override;
  Result UpdateLedger(Transaction&, const model::LedgerRecord&) override;

  Result UpsertHolding(Transaction&, const model::HoldingRecord&) override;
  std::optional<model::HoldingRecord> GetHolding(Transaction&, const std::string& ledger_id,
                                                 const std::string& holder) override;
  std::vector<model::HoldingRecord> ListHoldings(Transaction&, const std::string& ledger_id) override;

  Result AppendEvent(Transaction&, model::LedgerEventRecord& event) override;
  std::vector<model::LedgerEventRecord> ListEvents(Transaction&, const std::string& ledger_id,
                                                   uint64_t start_sequence,
                                                   std::optional<uint64_t> max_events) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  Result WriteEntries(sqlite3* db, const model::LedgerRecord& r);
  std::vector<model::CollateralEntryRecord> ReadEntries(sqlite3* db, const std::string& ledger_id);

  std::shared_ptr<SqliteDB> db_;
};

}
