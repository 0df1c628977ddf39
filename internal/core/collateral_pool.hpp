#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/core/ledger_types.hpp"
#include "internal/util/wide.hpp"

namespace treasury::core {

/*
  Ordered collateral entries plus the circulating-supply counter.

  Order matters: redemption only ever reduces the most recently appended
  entry. Entries are never removed. Every mutator either fully applies or
  throws before touching state.
*/
class CollateralPool {
 public:
  CollateralPool() = default;
  CollateralPool(std::vector<CollateralEntry> entries, uint64_t circulating_supply);

  const std::vector<CollateralEntry>& Entries() const {
    return entries_;
  }
  uint64_t CirculatingSupply() const {
    return circulating_supply_;
  }
  bool Empty() const {
    return entries_.empty();
  }

  util::Wide TotalValue() const;
  bool       Contains(const std::string& asset_id) const;

  // Throws EmptyCollateralPool.
  const CollateralEntry& Last() const;

  // Throws InvalidArgument on a duplicate asset id.
  void Append(CollateralEntry entry);

  // Throws EmptyCollateralPool / ExcessiveReduction.
  void ReduceLast(uint64_t reduction);

  // Throws ArithmeticOverflow.
  void IncreaseSupply(uint64_t amount);

  // Throws InsufficientSupply.
  void DecreaseSupply(uint64_t amount);

  void swap(CollateralPool& other) noexcept;

  bool operator==(const CollateralPool&) const = default;

 private:
  std::vector<CollateralEntry> entries_;
  uint64_t                     circulating_supply_ = 0;
};

// sum * 100 >= supply * 150
bool IsCollateralized(util::Wide total_collateral, uint64_t circulating_supply);

// (supply + amount) * 150 / 100, multiply before divide.
util::Wide RequiredCollateral(uint64_t circulating_supply, uint64_t amount);

// total * 10000 / supply, saturated to u64; 0 when supply is 0.
uint64_t CollateralRatioBps(util::Wide total_collateral, uint64_t circulating_supply);

} // namespace treasury::core
