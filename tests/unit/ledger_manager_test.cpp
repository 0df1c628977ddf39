#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/ledger_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using treasury::core::LedgerManager;
using treasury::core::TreasuryLedger;
using treasury::util::ErrorKind;
using treasury::util::LedgerError;

namespace pb = treasury::ledger::core::v1;

template <typename Fn>
bool ThrowsKind(Fn&& fn, ErrorKind kind) {
  try {
    fn();
  } catch (const LedgerError& ex) {
    return ex.Kind() == kind;
  }
  return false;
}

TreasuryLedger::InitializeParams Params(const std::string& id = "ledger-1") {
  TreasuryLedger::InitializeParams params;
  params.ledger_id            = id;
  params.collateral           = {{"A", "desc", 15000}};
  params.initial_supply       = 10000;
  params.oracle_initial_value = 15000;
  params.governance           = "gov";
  params.owner                = "owner";
  return params;
}

TreasuryLedger::IssueParams IssueOf(uint64_t collateral, uint64_t amount) {
  TreasuryLedger::IssueParams params;
  params.additional_collateral_value = collateral;
  params.amount                      = amount;
  params.recipient                   = "alice";
  return params;
}

LedgerManager MakeManager() {
  return LedgerManager(std::make_shared<treasury::db::memory::MemoryRepository>());
}

void TestInitializeBuildsSnapshotAndJournal() {
  auto       manager  = MakeManager();
  const auto snapshot = manager.Initialize(Params());

  assert(snapshot.id().value() == "ledger-1");
  assert(snapshot.version() == 1);
  assert(snapshot.healthy());
  assert(!snapshot.oracle_stale());
  assert(snapshot.collateral_ratio_bps() == 15000);
  assert(snapshot.total_collateral() == "15000");
  assert(snapshot.pool().entries_size() == 1);
  assert(snapshot.pool().circulating_supply() == 10000);
  assert(snapshot.guard().governance().value() == "gov");
  assert(manager.GetBalance("ledger-1", "owner") == 10000);

  const auto events = manager.ListEvents("ledger-1", 1, std::nullopt);
  assert(events.size() == 1);
  assert(events[0].sequence() == 1);
  assert(events[0].kind() == pb::LEDGER_EVENT_KIND_INITIALIZE);
  assert(events[0].actor().value() == "owner");
  assert(events[0].counterparty().value() == "gov");
  assert(events[0].amount() == 10000);
  assert(events[0].collateral_value() == 15000);
}

void TestInitializeAssignsIdWhenMissing() {
  auto       manager  = MakeManager();
  const auto snapshot = manager.Initialize(Params(""));
  assert(!snapshot.id().value().empty());
  assert(manager.GetLedger(snapshot.id().value()).version() == 1);
}

void TestInitializeRejectsExistingId() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());
  assert(ThrowsKind([&] { (void)manager.Initialize(Params()); }, ErrorKind::kAlreadyExists));
  assert(manager.ListLedgers().size() == 1);
}

void TestFailedInitializeStoresNothing() {
  auto manager = MakeManager();
  auto params  = Params();
  params.collateral[0].value = 14999;
  assert(ThrowsKind([&] { (void)manager.Initialize(params); }, ErrorKind::kInsufficientCollateral));
  assert(manager.ListLedgers().empty());
  assert(ThrowsKind([&] { (void)manager.GetLedger("ledger-1"); }, ErrorKind::kNotFound));
}

void TestIssueAndRedeemBumpVersionAndJournal() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());

  auto snapshot = manager.Issue("ledger-1", IssueOf(1500, 1000));
  assert(snapshot.version() == 2);
  assert(snapshot.pool().circulating_supply() == 11000);
  assert(manager.GetBalance("ledger-1", "alice") == 1000);

  snapshot = manager.Redeem("ledger-1", "alice", 400, 600);
  assert(snapshot.version() == 3);
  assert(snapshot.pool().circulating_supply() == 10600);
  assert(snapshot.pool().entries(1).value() == 900);
  assert(manager.GetBalance("ledger-1", "alice") == 600);

  const auto events = manager.ListEvents("ledger-1", 0, std::nullopt);
  assert(events.size() == 3);
  assert(events[1].kind() == pb::LEDGER_EVENT_KIND_ISSUE);
  assert(events[1].actor().value() == "alice");
  assert(events[1].amount() == 1000);
  assert(events[1].collateral_value() == 1500);
  assert(events[2].kind() == pb::LEDGER_EVENT_KIND_REDEEM);
  assert(events[2].amount() == 400);
  assert(events[2].collateral_value() == 600);
  for (size_t i = 0; i < events.size(); ++i) {
    assert(events[i].sequence() == i + 1);
  }
}

void TestRejectedCallsLeaveVersionAndJournalUnchanged() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());

  assert(ThrowsKind([&] { (void)manager.Issue("ledger-1", IssueOf(0, 1)); }, ErrorKind::kInsufficientCollateral));
  assert(ThrowsKind([&] { (void)manager.Redeem("ledger-1", "owner", 1, 15001); }, ErrorKind::kExcessiveReduction));
  assert(ThrowsKind([&] { (void)manager.Pause("ledger-1", "owner"); }, ErrorKind::kUnauthorized));
  assert(ThrowsKind([&] { (void)manager.Transfer("ledger-1", "owner", "bob", 10001); }, ErrorKind::kInsufficientBalance));
  assert(ThrowsKind([&] { (void)manager.UpdateValuation("ledger-1", "owner", 1); }, ErrorKind::kUnauthorized));

  const auto snapshot = manager.GetLedger("ledger-1");
  assert(snapshot.version() == 1);
  assert(snapshot.pool().circulating_supply() == 10000);
  assert(manager.ListEvents("ledger-1", 1, std::nullopt).size() == 1);
  assert(manager.GetBalance("ledger-1", "owner") == 10000);
  assert(manager.GetBalance("ledger-1", "bob") == 0);
}

void TestPauseResumeRoundTrip() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());

  assert(manager.Pause("ledger-1", "gov"));
  assert(manager.GetLedger("ledger-1").guard().paused());
  assert(ThrowsKind([&] { (void)manager.Issue("ledger-1", IssueOf(1500, 1000)); }, ErrorKind::kPaused));

  // Idempotent, but still journaled.
  assert(manager.Pause("ledger-1", "gov"));
  assert(manager.GetLedger("ledger-1").version() == 3);

  // Transfers are not gated by pause.
  const auto moved = manager.Transfer("ledger-1", "owner", "bob", 10);
  assert(moved.from_balance == 9990);
  assert(moved.to_balance == 10);

  assert(!manager.Resume("ledger-1", "gov"));
  (void)manager.Issue("ledger-1", IssueOf(1500, 1000));

  const auto events = manager.ListEvents("ledger-1", 2, std::nullopt);
  assert(events.size() == 5);
  assert(events[0].kind() == pb::LEDGER_EVENT_KIND_PAUSE);
  assert(events[0].actor().value() == "gov");
  assert(events[2].kind() == pb::LEDGER_EVENT_KIND_TRANSFER);
  assert(events[2].counterparty().value() == "bob");
  assert(events[3].kind() == pb::LEDGER_EVENT_KIND_RESUME);
}

void TestTransferConservesSupply() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());

  (void)manager.Transfer("ledger-1", "owner", "bob", 2500);
  (void)manager.Transfer("ledger-1", "bob", "carol", 500);

  const auto total = manager.GetBalance("ledger-1", "owner") + manager.GetBalance("ledger-1", "bob") + manager.GetBalance("ledger-1", "carol");
  assert(total == 10000);
  assert(manager.GetLedger("ledger-1").pool().circulating_supply() == 10000);
}

void TestRedeemGapReportsUnhealthy() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());

  const auto snapshot = manager.Redeem("ledger-1", "owner", 1, 15000);
  assert(!snapshot.healthy());
  assert(snapshot.collateral_ratio_bps() == 0);
  assert(!manager.CheckHealth("ledger-1"));

  const auto stats = manager.Stats();
  assert(stats.ledgers() == 1);
  assert(stats.ledgers_unhealthy() == 1);
  assert(stats.total_circulating_supply() == "9999");
}

void TestUpdateValuationIsJournaled() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());

  const auto oracle = manager.UpdateValuation("ledger-1", "gov", 123);
  assert(oracle.latest_value() == 123);
  assert(manager.GetLedger("ledger-1").oracle().latest_value() == 123);

  const auto events = manager.ListEvents("ledger-1", 2, 1);
  assert(events.size() == 1);
  assert(events[0].kind() == pb::LEDGER_EVENT_KIND_VALUATION_UPDATE);
  assert(events[0].collateral_value() == 123);
}

void TestStaleOracleIsFlagged() {
  LedgerManager::Options options;
  options.oracle_max_age = std::chrono::milliseconds(1);
  LedgerManager manager(std::make_shared<treasury::db::memory::MemoryRepository>(), options);
  (void)manager.Initialize(Params());

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  assert(manager.GetLedger("ledger-1").oracle_stale());
}

void TestUnknownLedgerIsNotFound() {
  auto manager = MakeManager();
  assert(ThrowsKind([&] { (void)manager.Issue("missing", IssueOf(1, 1)); }, ErrorKind::kNotFound));
  assert(ThrowsKind([&] { (void)manager.CheckHealth("missing"); }, ErrorKind::kNotFound));
  assert(ThrowsKind([&] { (void)manager.GetBalance("missing", "owner"); }, ErrorKind::kNotFound));
  assert(ThrowsKind([&] { (void)manager.ListEvents("missing", 1, std::nullopt); }, ErrorKind::kNotFound));
}

void TestLedgersAreIndependent() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params("ledger-a"));
  (void)manager.Initialize(Params("ledger-b"));

  (void)manager.Pause("ledger-a", "gov");
  (void)manager.Issue("ledger-b", IssueOf(1500, 1000));

  const auto ledgers = manager.ListLedgers();
  assert(ledgers.size() == 2);
  assert(ledgers[0].id().value() == "ledger-a");
  assert(ledgers[0].guard().paused());
  assert(ledgers[0].pool().circulating_supply() == 10000);
  assert(!ledgers[1].guard().paused());
  assert(ledgers[1].pool().circulating_supply() == 11000);

  const auto stats = manager.Stats();
  assert(stats.ledgers() == 2);
  assert(stats.ledgers_paused() == 1);
  assert(stats.total_circulating_supply() == "21000");
}

void TestConcurrentIssuesOnOneLedgerSerialize() {
  auto manager = MakeManager();
  (void)manager.Initialize(Params());

  std::vector<std::thread> workers;
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&] {
      for (int j = 0; j < 10; ++j) {
        (void)manager.Issue("ledger-1", IssueOf(15, 10));
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  const auto snapshot = manager.GetLedger("ledger-1");
  assert(snapshot.pool().circulating_supply() == 10800);
  assert(snapshot.version() == 81);
  assert(manager.GetBalance("ledger-1", "alice") == 800);
  assert(manager.ListEvents("ledger-1", 1, std::nullopt).size() == 81);
  assert(manager.TrackedLedgerLocks() == 0);
}

void TestLockTableDoesNotGrowWithUnknownIds() {
  auto manager = MakeManager();
  for (int i = 0; i < 200; ++i) {
    const auto id = "missing-" + std::to_string(i);
    assert(ThrowsKind([&] { (void)manager.Issue(id, IssueOf(1, 1)); }, ErrorKind::kNotFound));
    assert(ThrowsKind([&] { (void)manager.Pause(id, "gov"); }, ErrorKind::kNotFound));
    assert(ThrowsKind([&] { (void)manager.Transfer(id, "owner", "bob", 1); }, ErrorKind::kNotFound));
  }
  assert(manager.TrackedLedgerLocks() == 0);

  // Rejected initializes do not leave entries either.
  auto bad       = Params("ledger-bad");
  bad.governance = "";
  assert(ThrowsKind([&] { (void)manager.Initialize(bad); }, ErrorKind::kInvalidArgument));
  assert(manager.TrackedLedgerLocks() == 0);

  (void)manager.Initialize(Params());
  (void)manager.Issue("ledger-1", IssueOf(15, 10));
  assert(manager.TrackedLedgerLocks() == 0);
  assert(manager.GetLedger("ledger-1").version() == 2);
}

} // namespace

int main() {
  TestInitializeBuildsSnapshotAndJournal();
  TestInitializeAssignsIdWhenMissing();
  TestInitializeRejectsExistingId();
  TestFailedInitializeStoresNothing();
  TestIssueAndRedeemBumpVersionAndJournal();
  TestRejectedCallsLeaveVersionAndJournalUnchanged();
  TestPauseResumeRoundTrip();
  TestTransferConservesSupply();
  TestRedeemGapReportsUnhealthy();
  TestUpdateValuationIsJournaled();
  TestStaleOracleIsFlagged();
  TestUnknownLedgerIsNotFound();
  TestLedgersAreIndependent();
  TestConcurrentIssuesOnOneLedgerSerialize();
  TestLockTableDoesNotGrowWithUnknownIds();

  std::cout << "treasury_ledger_unit_ledger_manager: pass\n";
  return 0;
}
