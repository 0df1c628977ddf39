#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace treasury::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  // Everything owned by one ledger; the unit of conflict detection.
  struct LedgerSlot {
    model::LedgerRecord record;
    std::map<std::string, model::HoldingRecord> holdings;
    std::vector<model::LedgerEventRecord> events;
    uint64_t commit_version = 0;
  };

  struct State {
    std::map<std::string, LedgerSlot> ledgers;
  };

  std::mutex mutex_;
  State committed_;
};

}
