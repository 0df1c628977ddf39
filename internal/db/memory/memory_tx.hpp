#pragma once

#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace treasury::db::memory {

/*
  Transaction = snapshot + set of touched ledgers

  Commit publishes only the touched ledger slots, and fails if any of them
  was committed by someone else after this snapshot was taken.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;

  MemoryRepository::LedgerSlot& MutableLedger(const std::string& id);

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::set<std::string>   touched_;
  bool                    committed_   = false;
  bool                    rolled_back_ = false;
};

} // namespace treasury::db::memory
