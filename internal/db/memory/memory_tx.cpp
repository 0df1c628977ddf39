#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace treasury::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::LedgerSlot& MemoryTransaction::MutableLedger(const std::string& id) {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction is already finished");
  }
  touched_.insert(id);
  return working_.ledgers[id];
}

void MemoryTransaction::Commit() {
  if (rolled_back_) {
    throw std::logic_error("memory transaction was rolled back");
  }

  std::scoped_lock lock(repo_.mutex_);
  for (const auto& id : touched_) {
    const auto committed_it = repo_.committed_.ledgers.find(id);
    const auto working_it   = working_.ledgers.find(id);
    const auto seen_version = working_it == working_.ledgers.end() ? 0 : working_it->second.commit_version;
    const auto current      = committed_it == repo_.committed_.ledgers.end() ? 0 : committed_it->second.commit_version;
    if (current != seen_version) {
      throw util::Conflict("transaction conflict: ledger " + id + " was modified by a concurrent transaction");
    }
  }

  for (const auto& id : touched_) {
    auto& slot = working_.ledgers[id];
    slot.commit_version++;
    repo_.committed_.ledgers[id] = std::move(slot);
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace treasury::db::memory
