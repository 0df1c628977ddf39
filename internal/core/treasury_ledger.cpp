#include "treasury_ledger.hpp"

#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"

namespace treasury::core {

namespace {

// First "issue-<n>" not already taken, starting at the pool's entry count.
std::string NextIssueAssetId(const CollateralPool& pool) {
  for (auto index = pool.Entries().size();; ++index) {
    auto candidate = "issue-" + std::to_string(index);
    if (!pool.Contains(candidate)) {
      return candidate;
    }
  }
}

} // namespace

TreasuryLedger::TreasuryLedger(LedgerState state)
    : id_(std::move(state.id)),
      pool_(std::move(state.pool)),
      oracle_(state.oracle),
      guard_(std::move(state.guard)),
      authority_(id_) {
}

TreasuryLedger TreasuryLedger::Initialize(const InitializeParams& params, HoldingTable& holdings) {
  if (params.ledger_id.empty()) {
    throw util::InvalidArgument("ledger id must not be empty");
  }
  if (params.governance.empty()) {
    throw util::InvalidArgument("governance address must not be empty");
  }
  if (params.owner.empty()) {
    throw util::InvalidArgument("owner address must not be empty");
  }

  std::unordered_set<std::string> seen;
  for (const auto& entry : params.collateral) {
    if (entry.asset_id.empty()) {
      throw util::InvalidArgument("collateral asset id must not be empty");
    }
    if (!seen.insert(entry.asset_id).second) {
      throw util::InvalidArgument("duplicate collateral asset id: " + entry.asset_id);
    }
  }

  CollateralPool pool(params.collateral, params.initial_supply);
  if (!IsCollateralized(pool.TotalValue(), params.initial_supply)) {
    throw util::InsufficientCollateral("initial collateral " + util::ToDecimal(pool.TotalValue()) + " cannot back supply " +
                                       std::to_string(params.initial_supply) + " at " + std::to_string(kMinCollateralRatioPercent) + "%");
  }

  LedgerState state;
  state.id     = params.ledger_id;
  state.pool   = std::move(pool);
  state.oracle = ValuationOracle(params.oracle_initial_value, params.now);
  state.guard  = GovernanceGuard(params.governance, false);

  TreasuryLedger ledger(std::move(state));

  HoldingTable staged = holdings;
  ledger.authority_.Mint(staged, params.owner, params.initial_supply);
  holdings.swap(staged);

  return ledger;
}

TreasuryLedger TreasuryLedger::Restore(LedgerState state) {
  if (state.id.empty()) {
    throw util::InvalidArgument("ledger id must not be empty");
  }
  return TreasuryLedger(std::move(state));
}

void TreasuryLedger::Issue(const IssueParams& params, HoldingTable& holdings) {
  guard_.EnsureActive();

  const util::Wide required = RequiredCollateral(pool_.CirculatingSupply(), params.amount);
  const util::Wide total    = pool_.TotalValue() + params.additional_collateral_value;
  if (total < required) {
    throw util::InsufficientCollateral("collateral " + util::ToDecimal(total) + " is below required " + util::ToDecimal(required) + " to issue " +
                                       std::to_string(params.amount));
  }

  CollateralPool staged_pool = pool_;
  staged_pool.IncreaseSupply(params.amount);

  if (params.recipient.empty()) {
    throw util::InvalidArgument("recipient address must not be empty");
  }

  CollateralEntry entry;
  entry.asset_id    = params.asset_id.empty() ? NextIssueAssetId(staged_pool) : params.asset_id;
  entry.description = params.description;
  entry.value       = params.additional_collateral_value;
  staged_pool.Append(std::move(entry));

  HoldingTable staged_holdings = holdings;
  authority_.Mint(staged_holdings, params.recipient, params.amount);

  pool_.swap(staged_pool);
  holdings.swap(staged_holdings);
}

void TreasuryLedger::Redeem(const Address& holder, uint64_t burn_amount, uint64_t collateral_value_reduction, HoldingTable& holdings) {
  guard_.EnsureActive();

  if (pool_.Empty()) {
    throw util::EmptyCollateralPool("redeem: collateral pool has no entries");
  }

  CollateralPool staged_pool = pool_;
  staged_pool.DecreaseSupply(burn_amount);
  staged_pool.ReduceLast(collateral_value_reduction);

  HoldingTable staged_holdings = holdings;
  authority_.Burn(staged_holdings, holder, burn_amount);

  pool_.swap(staged_pool);
  holdings.swap(staged_holdings);
}

void TreasuryLedger::Pause(const Address& caller) {
  guard_.Pause(caller);
}

void TreasuryLedger::Resume(const Address& caller) {
  guard_.Resume(caller);
}

void TreasuryLedger::UpdateValuation(const Address& caller, uint64_t value, util::TimePoint now) {
  guard_.Authorize(caller);
  oracle_.Update(value, now);
}

bool TreasuryLedger::CheckHealth() const {
  return IsCollateralized(pool_.TotalValue(), pool_.CirculatingSupply());
}

LedgerState TreasuryLedger::State() const {
  LedgerState state;
  state.id     = id_;
  state.pool   = pool_;
  state.oracle = oracle_;
  state.guard  = guard_;
  return state;
}

} // namespace treasury::core
