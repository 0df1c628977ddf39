#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace treasury::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertLedger(Transaction& t, const model::LedgerRecord& r) {
  if (TX(t).View().ledgers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "ledger already exists: " + r.id);
  TX(t).MutableLedger(r.id).record = r;
  return Result::Ok();
}

std::optional<model::LedgerRecord> MemoryRepository::GetLedger(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.ledgers.find(id);
  if (it == s.ledgers.end()) return std::nullopt;
  return it->second.record;
}

std::vector<model::LedgerRecord> MemoryRepository::ListLedgers(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::LedgerRecord> records;
  records.reserve(s.ledgers.size());
  for (const auto& [_, slot] : s.ledgers) {
    records.push_back(slot.record);
  }
  return records;
}

Result MemoryRepository::UpdateLedger(Transaction& t, const model::LedgerRecord& r) {
  const auto& s  = TX(t).View();
  auto        it = s.ledgers.find(r.id);
  if (it == s.ledgers.end()) return Result::Err(ErrorCode::NotFound, "ledger not found: " + r.id);
  if (r.version != it->second.record.version + 1) {
    return Result::Err(ErrorCode::Conflict, "ledger version mismatch: " + r.id);
  }
  TX(t).MutableLedger(r.id).record = r;
  return Result::Ok();
}

Result MemoryRepository::UpsertHolding(Transaction& t, const model::HoldingRecord& r) {
  if (!TX(t).View().ledgers.contains(r.ledger_id)) {
    return Result::Err(ErrorCode::NotFound, "ledger not found: " + r.ledger_id);
  }
  TX(t).MutableLedger(r.ledger_id).holdings[r.holder] = r;
  return Result::Ok();
}

std::optional<model::HoldingRecord> MemoryRepository::GetHolding(Transaction& t, const std::string& ledger_id, const std::string& holder) {
  const auto& s  = TX(t).View();
  auto        it = s.ledgers.find(ledger_id);
  if (it == s.ledgers.end()) return std::nullopt;
  auto hit = it->second.holdings.find(holder);
  if (hit == it->second.holdings.end()) return std::nullopt;
  return hit->second;
}

std::vector<model::HoldingRecord> MemoryRepository::ListHoldings(Transaction& t, const std::string& ledger_id) {
  std::vector<model::HoldingRecord> records;
  const auto&                       s  = TX(t).View();
  auto                              it = s.ledgers.find(ledger_id);
  if (it == s.ledgers.end()) return records;
  records.reserve(it->second.holdings.size());
  for (const auto& [_, record] : it->second.holdings) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::AppendEvent(Transaction& t, model::LedgerEventRecord& event) {
  if (!TX(t).View().ledgers.contains(event.ledger_id)) {
    return Result::Err(ErrorCode::NotFound, "ledger not found: " + event.ledger_id);
  }
  auto& events   = TX(t).MutableLedger(event.ledger_id).events;
  event.sequence = static_cast<uint64_t>(events.size()) + 1;
  events.push_back(event);
  return Result::Ok();
}

std::vector<model::LedgerEventRecord> MemoryRepository::ListEvents(Transaction& t, const std::string& ledger_id, uint64_t start_sequence,
                                                                   std::optional<uint64_t> max_events) {
  std::vector<model::LedgerEventRecord> out;
  const auto&                           s  = TX(t).View();
  auto                                  it = s.ledgers.find(ledger_id);
  if (it == s.ledgers.end()) return out;

  const auto& events = it->second.events;
  const auto  first  = std::max<uint64_t>(start_sequence, 1);
  for (uint64_t seq = first; seq <= events.size(); ++seq) {
    if (max_events && out.size() >= *max_events) break;
    out.push_back(events[seq - 1]);
  }
  return out;
}

} // namespace treasury::db::memory
