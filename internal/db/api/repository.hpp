#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/holding_record.hpp"
#include "internal/db/model/ledger_event_record.hpp"
#include "internal/db/model/ledger_record.hpp"

namespace treasury::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - UpdateLedger only succeeds when record.version == stored.version + 1
  - A ledger, its holdings and its events commit together or not at all

  The DB is the source of truth for:
    ledger aggregates
    holder balances
    the audit journal
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Ledgers
  // ---------------------------------------------------------------------

  virtual Result InsertLedger(Transaction&, const model::LedgerRecord&) = 0;

  virtual std::optional<model::LedgerRecord> GetLedger(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::LedgerRecord> ListLedgers(Transaction&) = 0;

  virtual Result UpdateLedger(Transaction&, const model::LedgerRecord&) = 0;

  // ---------------------------------------------------------------------
  // Holdings
  // ---------------------------------------------------------------------

  virtual Result UpsertHolding(Transaction&, const model::HoldingRecord&) = 0;

  virtual std::optional<model::HoldingRecord> GetHolding(Transaction&, const std::string& ledger_id, const std::string& holder) = 0;

  virtual std::vector<model::HoldingRecord> ListHoldings(Transaction&, const std::string& ledger_id) = 0;

  // ---------------------------------------------------------------------
  // Audit journal
  // ---------------------------------------------------------------------

  // Assigns the next contiguous sequence for the ledger.
  virtual Result AppendEvent(Transaction&, model::LedgerEventRecord& event) = 0;

  virtual std::vector<model::LedgerEventRecord> ListEvents(Transaction&, const std::string& ledger_id, uint64_t start_sequence,
                                                           std::optional<uint64_t> max_events) = 0;
};

} // namespace treasury::db
