#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/treasury_ledger.hpp"
#include "internal/db/api/repository.hpp"
#include "treasury/ledger/admin/v1/stats.pb.h"
#include "treasury/ledger/core/v1/types.pb.h"

namespace treasury::core {

/*
  LedgerManager

  Hosts any number of TreasuryLedger instances on top of a Repository.
  Every call runs in one repository transaction: load, apply, persist,
  append one journal event, commit. A throwing call commits nothing.

  Calls on the same ledger are serialized by a per-ledger mutex; calls on
  different ledgers proceed independently.
*/
class LedgerManager {
 public:
  struct Options {
    // Snapshots report oracle_stale past this age; zero disables it.
    std::chrono::milliseconds oracle_max_age{0};
  };

  struct TransferResult {
    uint64_t from_balance = 0;
    uint64_t to_balance   = 0;
  };

  explicit LedgerManager(std::shared_ptr<db::Repository> repository);
  LedgerManager(std::shared_ptr<db::Repository> repository, Options options);

  // A fresh UUID is assigned when params.ledger_id is empty.
  treasury::ledger::core::v1::LedgerSnapshot Initialize(TreasuryLedger::InitializeParams params);

  treasury::ledger::core::v1::LedgerSnapshot Issue(const std::string& ledger_id, const TreasuryLedger::IssueParams& params);
  treasury::ledger::core::v1::LedgerSnapshot Redeem(const std::string& ledger_id, const Address& holder, uint64_t burn_amount,
                                                    uint64_t collateral_value_reduction);

  // Return the resulting paused flag.
  bool Pause(const std::string& ledger_id, const Address& caller);
  bool Resume(const std::string& ledger_id, const Address& caller);

  treasury::ledger::core::v1::ValuationOracle UpdateValuation(const std::string& ledger_id, const Address& caller, uint64_t value);

  TransferResult Transfer(const std::string& ledger_id, const Address& from, const Address& to, uint64_t amount);

  bool                                                    CheckHealth(const std::string& ledger_id);
  treasury::ledger::core::v1::LedgerSnapshot              GetLedger(const std::string& ledger_id);
  uint64_t                                                GetBalance(const std::string& ledger_id, const Address& holder);
  std::vector<treasury::ledger::core::v1::LedgerSnapshot> ListLedgers();
  std::vector<treasury::ledger::core::v1::LedgerEvent>    ListEvents(const std::string& ledger_id, uint64_t start_sequence,
                                                                     std::optional<uint64_t> max_events);

  treasury::ledger::admin::v1::StatsResponse Stats();

  // Per-ledger mutexes currently in the lock table. Entries live only while
  // some call holds or waits on them.
  std::size_t TrackedLedgerLocks() const;

 private:
  struct Loaded {
    db::model::LedgerRecord record;
    TreasuryLedger          ledger;
    HoldingTable            holdings;
  };

  class LedgerLock {
   public:
    LedgerLock(LedgerManager& manager, const std::string& ledger_id);
    ~LedgerLock();

    LedgerLock(const LedgerLock&)            = delete;
    LedgerLock& operator=(const LedgerLock&) = delete;

   private:
    LedgerManager&              manager_;
    std::string                 ledger_id_;
    std::shared_ptr<std::mutex> mutex_;
  };

  std::shared_ptr<std::mutex> LedgerMutex(const std::string& ledger_id);

  Loaded Load(db::Transaction& tx, const std::string& ledger_id, const char* context);

  // Writes the ledger back with version + 1, upserts changed holdings and
  // appends the event. Does not commit.
  db::model::LedgerRecord Persist(db::Transaction& tx, const Loaded& before, const TreasuryLedger& ledger, const HoldingTable& holdings,
                                  db::model::LedgerEventRecord event, const char* context);

  treasury::ledger::core::v1::LedgerSnapshot BuildSnapshot(const db::model::LedgerRecord& record) const;
  void                                       PublishGauges(const db::model::LedgerRecord& record) const;

  std::shared_ptr<db::Repository> repository_;
  Options                         options_;

  mutable std::mutex                                           ledger_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> ledger_mutexes_;
};

} // namespace treasury::core
