#pragma once

#include <cstdint>
#include <string>

#include "internal/core/ledger_types.hpp"

namespace treasury::core {

class HoldingTable;
class TreasuryLedger;

/*
  Exclusive right to change a ledger's supply.

  Only TreasuryLedger can construct one and it never hands it out. The
  capability cannot be copied; moving it is allowed so the owning ledger
  can itself be moved.
*/
class MintingAuthority {
 public:
  MintingAuthority(const MintingAuthority&)            = delete;
  MintingAuthority& operator=(const MintingAuthority&) = delete;

  MintingAuthority(MintingAuthority&&) noexcept            = default;
  MintingAuthority& operator=(MintingAuthority&&) noexcept = default;

  const std::string& LedgerId() const {
    return ledger_id_;
  }

  void Mint(HoldingTable& holdings, const Address& recipient, uint64_t amount) const;
  void Burn(HoldingTable& holdings, const Address& holder, uint64_t amount) const;

 private:
  friend class TreasuryLedger;

  explicit MintingAuthority(std::string ledger_id);

  void RequireOwnHoldings(const HoldingTable& holdings) const;

  std::string ledger_id_;
};

} // namespace treasury::core
