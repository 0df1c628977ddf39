#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/core/ledger_types.hpp"
#include "internal/util/wide.hpp"

namespace treasury::core {

class MintingAuthority;

/*
  Per-ledger unit balances.

  Public operations only move value between holders and never change the
  table total. Creating or destroying units goes through MintingAuthority.
*/
class HoldingTable {
 public:
  using Balances = std::map<Address, uint64_t>;

  explicit HoldingTable(std::string ledger_id);
  HoldingTable(std::string ledger_id, Balances balances);

  const std::string& LedgerId() const {
    return ledger_id_;
  }
  const Balances& All() const {
    return balances_;
  }

  uint64_t   BalanceOf(const Address& holder) const;
  util::Wide Total() const;

  // Throws InvalidArgument / InsufficientBalance.
  void Transfer(const Address& from, const Address& to, uint64_t amount);

  void swap(HoldingTable& other) noexcept;

 private:
  friend class MintingAuthority;

  void Credit(const Address& holder, uint64_t amount);
  void Debit(const Address& holder, uint64_t amount);

  std::string ledger_id_;
  Balances    balances_;
};

} // namespace treasury::core
