#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/core/collateral_pool.hpp"
#include "internal/core/governance_guard.hpp"
#include "internal/core/holding_table.hpp"
#include "internal/core/ledger_types.hpp"
#include "internal/core/minting_authority.hpp"
#include "internal/core/valuation_oracle.hpp"
#include "internal/util/time.hpp"

namespace treasury::core {

/*
  Plain-data view of a ledger, used for persistence and snapshots.
  Excludes the minting authority.
*/
struct LedgerState {
  std::string     id;
  CollateralPool  pool;
  ValuationOracle oracle;
  GovernanceGuard guard;

  bool operator==(const LedgerState&) const = default;
};

/*
  TreasuryLedger

  Root aggregate: owns the collateral pool, the valuation oracle, the
  governance guard and the minting authority. It is the only place the
  collateralization invariant is checked:

    sum(collateral values) * 100 >= circulating_supply * 150

  Every mutating operation stages its result in local copies, validates,
  then swaps the copies in. A throwing call leaves the ledger and the
  presented HoldingTable exactly as they were.

  Redeem does not re-check the invariant after burning. A caller that
  reduces collateral far more than it burns can leave the ledger
  under-collateralized; CheckHealth() reports it, nothing repairs it.
*/
class TreasuryLedger {
 public:
  struct InitializeParams {
    std::string                  ledger_id;
    std::vector<CollateralEntry> collateral;
    uint64_t                     initial_supply       = 0;
    uint64_t                     oracle_initial_value = 0;
    Address                      governance;
    Address                      owner; // receives initial_supply
    util::TimePoint              now{};
  };

  struct IssueParams {
    uint64_t    additional_collateral_value = 0;
    uint64_t    amount                      = 0;
    Address     recipient;
    std::string asset_id; // first free "issue-<index>" when empty
    std::string description;
  };

  // Throws InsufficientCollateral / InvalidArgument.
  static TreasuryLedger Initialize(const InitializeParams& params, HoldingTable& holdings);

  // Rehydrates a previously persisted ledger as-is.
  static TreasuryLedger Restore(LedgerState state);

  TreasuryLedger(TreasuryLedger&&) noexcept            = default;
  TreasuryLedger& operator=(TreasuryLedger&&) noexcept = default;

  // Throws Paused / InsufficientCollateral / ArithmeticOverflow / InvalidArgument.
  void Issue(const IssueParams& params, HoldingTable& holdings);

  // Throws Paused / InsufficientSupply / EmptyCollateralPool / ExcessiveReduction / InsufficientBalance.
  void Redeem(const Address& holder, uint64_t burn_amount, uint64_t collateral_value_reduction, HoldingTable& holdings);

  void Pause(const Address& caller);
  void Resume(const Address& caller);
  void UpdateValuation(const Address& caller, uint64_t value, util::TimePoint now);

  bool CheckHealth() const;

  const std::string& Id() const {
    return id_;
  }
  const CollateralPool& Pool() const {
    return pool_;
  }
  const ValuationOracle& Oracle() const {
    return oracle_;
  }
  const GovernanceGuard& Guard() const {
    return guard_;
  }

  LedgerState State() const;

 private:
  explicit TreasuryLedger(LedgerState state);

  std::string      id_;
  CollateralPool   pool_;
  ValuationOracle  oracle_;
  GovernanceGuard  guard_;
  MintingAuthority authority_;
};

} // namespace treasury::core
