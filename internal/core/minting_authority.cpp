#include "minting_authority.hpp"

#include <utility>

#include "internal/core/holding_table.hpp"
#include "internal/util/errors.hpp"

namespace treasury::core {

MintingAuthority::MintingAuthority(std::string ledger_id) : ledger_id_(std::move(ledger_id)) {
}

void MintingAuthority::RequireOwnHoldings(const HoldingTable& holdings) const {
  if (holdings.LedgerId() != ledger_id_) {
    throw util::InvalidArgument("holdings of ledger '" + holdings.LedgerId() + "' presented to ledger '" + ledger_id_ + "'");
  }
}

void MintingAuthority::Mint(HoldingTable& holdings, const Address& recipient, uint64_t amount) const {
  RequireOwnHoldings(holdings);
  holdings.Credit(recipient, amount);
}

void MintingAuthority::Burn(HoldingTable& holdings, const Address& holder, uint64_t amount) const {
  RequireOwnHoldings(holdings);
  holdings.Debit(holder, amount);
}

} // namespace treasury::core
