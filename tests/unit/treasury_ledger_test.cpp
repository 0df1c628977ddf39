#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "internal/core/treasury_ledger.hpp"
#include "internal/util/errors.hpp"

namespace {

using treasury::core::CollateralPool;
using treasury::core::GovernanceGuard;
using treasury::core::HoldingTable;
using treasury::core::LedgerState;
using treasury::core::TreasuryLedger;
using treasury::core::ValuationOracle;
using treasury::util::ErrorKind;
using treasury::util::LedgerError;

template <typename Fn>
bool ThrowsKind(Fn&& fn, ErrorKind kind) {
  try {
    fn();
  } catch (const LedgerError& ex) {
    return ex.Kind() == kind;
  }
  return false;
}

TreasuryLedger::InitializeParams Params(uint64_t collateral, uint64_t supply) {
  TreasuryLedger::InitializeParams params;
  params.ledger_id            = "ledger-1";
  params.collateral           = {{"A", "desc", collateral}};
  params.initial_supply       = supply;
  params.oracle_initial_value = 42;
  params.governance           = "gov";
  params.owner                = "owner";
  return params;
}

TreasuryLedger::IssueParams IssueOf(uint64_t collateral, uint64_t amount, const std::string& recipient = "alice") {
  TreasuryLedger::IssueParams params;
  params.additional_collateral_value = collateral;
  params.amount                      = amount;
  params.recipient                   = recipient;
  return params;
}

void TestInitializeAtExactRatio() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);

  assert(ledger.Pool().CirculatingSupply() == 10000);
  assert(ledger.Pool().TotalValue() == 15000);
  assert(ledger.Oracle().LatestValue() == 42);
  assert(ledger.Guard().Governance() == "gov");
  assert(!ledger.Guard().IsPaused());
  assert(ledger.CheckHealth());
  assert(holdings.BalanceOf("owner") == 10000);
}

void TestInitializeOneUnitShortFails() {
  HoldingTable holdings("ledger-1");
  assert(ThrowsKind([&] { (void)TreasuryLedger::Initialize(Params(14999, 10000), holdings); }, ErrorKind::kInsufficientCollateral));
  assert(holdings.All().empty());
}

void TestInitializeRejectsDuplicateAssetIds() {
  HoldingTable holdings("ledger-1");
  auto         params = Params(15000, 100);
  params.collateral.push_back({"A", "again", 1});
  assert(ThrowsKind([&] { (void)TreasuryLedger::Initialize(params, holdings); }, ErrorKind::kInvalidArgument));
}

void TestIssueRequiresRatioOnNewSupply() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);

  // 10001 * 150 / 100 = 15001 > 15000
  assert(ThrowsKind([&] { ledger.Issue(IssueOf(0, 1), holdings); }, ErrorKind::kInsufficientCollateral));
  assert(ledger.Pool().Entries().size() == 1);
  assert(ledger.Pool().CirculatingSupply() == 10000);
  assert(holdings.BalanceOf("alice") == 0);

  ledger.Issue(IssueOf(150, 1), holdings);
  assert(ledger.Pool().CirculatingSupply() == 10001);
  assert(ledger.Pool().TotalValue() == 15150);
  assert(ledger.Pool().Entries().size() == 2);
  assert(ledger.Pool().Entries().back().asset_id == "issue-1");
  assert(ledger.Pool().Entries().back().value == 150);
  assert(holdings.BalanceOf("alice") == 1);
}

void TestIssueUsesProvidedAssetId() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);

  auto params        = IssueOf(1500, 1000);
  params.asset_id    = "T-BILL-2026";
  params.description = "treasury bill";
  ledger.Issue(params, holdings);
  assert(ledger.Pool().Entries().back().asset_id == "T-BILL-2026");
  assert(ledger.Pool().Entries().back().description == "treasury bill");

  // Reusing an asset id leaves everything untouched.
  assert(ThrowsKind([&] { ledger.Issue(params, holdings); }, ErrorKind::kInvalidArgument));
  assert(ledger.Pool().CirculatingSupply() == 11000);
  assert(holdings.BalanceOf("alice") == 1000);
}

void TestGeneratedAssetIdSkipsTakenIds() {
  auto params       = Params(15000, 0);
  params.collateral = {{"issue-1", "user asset", 15000}};

  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(params, holdings);

  ledger.Issue(IssueOf(150, 100), holdings);
  assert(ledger.Pool().Entries().size() == 2);
  assert(ledger.Pool().Entries().back().asset_id == "issue-2");
  assert(ledger.Pool().CirculatingSupply() == 100);
  assert(holdings.BalanceOf("alice") == 100);

  auto named     = IssueOf(0, 0);
  named.asset_id = "issue-3";
  ledger.Issue(named, holdings);

  ledger.Issue(IssueOf(150, 100), holdings);
  assert(ledger.Pool().Entries().back().asset_id == "issue-4");
  assert(ledger.Pool().CirculatingSupply() == 200);
}

void TestIssueRejectsEmptyRecipient() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);
  assert(ThrowsKind([&] { ledger.Issue(IssueOf(1500, 1000, ""), holdings); }, ErrorKind::kInvalidArgument));
  assert(ledger.Pool().CirculatingSupply() == 10000);
}

void TestIssueTruncationCanLeaveRatioBelowMinimum() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(0, 0), holdings);

  // 1 * 150 / 100 truncates to 1.
  ledger.Issue(IssueOf(1, 1), holdings);
  assert(ledger.Pool().CirculatingSupply() == 1);
  assert(!ledger.CheckHealth());
}

void TestIssueRedeemRoundTrip() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);

  ledger.Issue(IssueOf(1500, 1000), holdings);
  ledger.Redeem("alice", 1000, 1500, holdings);

  assert(ledger.Pool().CirculatingSupply() == 10000);
  assert(ledger.Pool().TotalValue() == 15000);
  assert(ledger.Pool().Entries().size() == 2);
  assert(ledger.Pool().Entries().back().value == 0);
  assert(holdings.BalanceOf("alice") == 0);
  assert(holdings.BalanceOf("owner") == 10000);
  assert(ledger.CheckHealth());
}

void TestRedeemFailuresLeaveStateUnchanged() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);
  const auto   before = ledger.State();
  const auto   owned  = holdings.All();

  assert(ThrowsKind([&] { ledger.Redeem("owner", 10001, 0, holdings); }, ErrorKind::kInsufficientSupply));
  assert(ThrowsKind([&] { ledger.Redeem("owner", 1, 15001, holdings); }, ErrorKind::kExcessiveReduction));
  assert(ThrowsKind([&] { ledger.Redeem("alice", 1, 1, holdings); }, ErrorKind::kInsufficientBalance));

  assert(ledger.State() == before);
  assert(holdings.All() == owned);
}

void TestRedeemDoesNotRecheckRatio() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);

  ledger.Redeem("owner", 1, 15000, holdings);
  assert(ledger.Pool().CirculatingSupply() == 9999);
  assert(ledger.Pool().TotalValue() == 0);
  assert(!ledger.CheckHealth());
}

void TestRedeemOnEmptyPool() {
  LedgerState state;
  state.id    = "ledger-empty";
  state.pool  = CollateralPool({}, 5);
  state.guard = GovernanceGuard("gov", false);
  auto ledger = TreasuryLedger::Restore(state);

  HoldingTable holdings("ledger-empty", {{"owner", 5}});
  assert(ThrowsKind([&] { ledger.Redeem("owner", 1, 0, holdings); }, ErrorKind::kEmptyCollateralPool));
  assert(ledger.Pool().CirculatingSupply() == 5);
  assert(holdings.BalanceOf("owner") == 5);

  // Burning more than the supply still reports the empty pool.
  assert(ThrowsKind([&] { ledger.Redeem("owner", 6, 0, holdings); }, ErrorKind::kEmptyCollateralPool));

  LedgerState drained;
  drained.id    = "ledger-drained";
  drained.pool  = CollateralPool({}, 0);
  drained.guard = GovernanceGuard("gov", false);
  auto         zero_supply = TreasuryLedger::Restore(drained);
  HoldingTable none("ledger-drained");
  assert(ThrowsKind([&] { zero_supply.Redeem("owner", 5, 0, none); }, ErrorKind::kEmptyCollateralPool));
  assert(zero_supply.Pool().CirculatingSupply() == 0);
}

void TestPauseBlocksIssueAndRedeem() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);

  assert(ThrowsKind([&] { ledger.Pause("owner"); }, ErrorKind::kUnauthorized));
  ledger.Pause("gov");
  assert(ThrowsKind([&] { ledger.Issue(IssueOf(1500, 1000), holdings); }, ErrorKind::kPaused));
  assert(ThrowsKind([&] { ledger.Redeem("owner", 1, 0, holdings); }, ErrorKind::kPaused));
  // Paused wins over every other failure.
  assert(ThrowsKind([&] { ledger.Issue(IssueOf(0, 1000000), holdings); }, ErrorKind::kPaused));

  // Holders can still move units while paused.
  holdings.Transfer("owner", "bob", 10);
  assert(holdings.BalanceOf("bob") == 10);

  assert(ThrowsKind([&] { ledger.Resume("owner"); }, ErrorKind::kUnauthorized));
  ledger.Resume("gov");
  ledger.Issue(IssueOf(1500, 1000), holdings);
  assert(ledger.Pool().CirculatingSupply() == 11000);
}

void TestUpdateValuationIsGovernanceOnlyAndInformational() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);
  const auto   now    = treasury::util::Now();

  assert(ThrowsKind([&] { ledger.UpdateValuation("owner", 1, now); }, ErrorKind::kUnauthorized));
  ledger.UpdateValuation("gov", 0, now);
  assert(ledger.Oracle().LatestValue() == 0);
  assert(ledger.Oracle().LastUpdated() == now);
  assert(ledger.CheckHealth());
}

void TestHoldingsOfAnotherLedgerAreRejected() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);

  HoldingTable foreign("ledger-2");
  assert(ThrowsKind([&] { ledger.Issue(IssueOf(1500, 1000), foreign); }, ErrorKind::kInvalidArgument));
  assert(ledger.Pool().CirculatingSupply() == 10000);
}

void TestSupplyOverflowIsReported() {
  constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
  LedgerState        state;
  state.id    = "ledger-big";
  state.pool  = CollateralPool({{"A", "", kMax}, {"B", "", kMax}}, kMax);
  state.guard = GovernanceGuard("gov", false);
  auto ledger = TreasuryLedger::Restore(state);

  HoldingTable holdings("ledger-big", {{"owner", kMax}});
  assert(ThrowsKind([&] { ledger.Issue(IssueOf(kMax, 1), holdings); }, ErrorKind::kArithmeticOverflow));
  assert(ledger.Pool().Entries().size() == 2);
}

void TestRestoreRoundTripsState() {
  HoldingTable holdings("ledger-1");
  auto         ledger = TreasuryLedger::Initialize(Params(15000, 10000), holdings);
  ledger.Pause("gov");

  auto restored = TreasuryLedger::Restore(ledger.State());
  assert(restored.State() == ledger.State());
  assert(restored.Guard().IsPaused());
}

} // namespace

int main() {
  TestInitializeAtExactRatio();
  TestInitializeOneUnitShortFails();
  TestInitializeRejectsDuplicateAssetIds();
  TestIssueRequiresRatioOnNewSupply();
  TestIssueUsesProvidedAssetId();
  TestGeneratedAssetIdSkipsTakenIds();
  TestIssueRejectsEmptyRecipient();
  TestIssueTruncationCanLeaveRatioBelowMinimum();
  TestIssueRedeemRoundTrip();
  TestRedeemFailuresLeaveStateUnchanged();
  TestRedeemDoesNotRecheckRatio();
  TestRedeemOnEmptyPool();
  TestPauseBlocksIssueAndRedeem();
  TestUpdateValuationIsGovernanceOnlyAndInformational();
  TestHoldingsOfAnotherLedgerAreRejected();
  TestSupplyOverflowIsReported();
  TestRestoreRoundTripsState();

  std::cout << "treasury_ledger_unit_treasury_ledger: pass\n";
  return 0;
}
