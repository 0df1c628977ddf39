#include "collateral_pool.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace treasury::core {

CollateralPool::CollateralPool(std::vector<CollateralEntry> entries, uint64_t circulating_supply)
    : entries_(std::move(entries)), circulating_supply_(circulating_supply) {
}

util::Wide CollateralPool::TotalValue() const {
  util::Wide total = 0;
  for (const auto& entry : entries_) {
    total += entry.value;
  }
  return total;
}

bool CollateralPool::Contains(const std::string& asset_id) const {
  return std::any_of(entries_.begin(), entries_.end(), [&](const CollateralEntry& entry) { return entry.asset_id == asset_id; });
}

const CollateralEntry& CollateralPool::Last() const {
  if (entries_.empty()) {
    throw util::EmptyCollateralPool("collateral pool has no entries to reduce");
  }
  return entries_.back();
}

void CollateralPool::Append(CollateralEntry entry) {
  if (entry.asset_id.empty()) {
    throw util::InvalidArgument("collateral asset id must not be empty");
  }
  if (Contains(entry.asset_id)) {
    throw util::InvalidArgument("duplicate collateral asset id: " + entry.asset_id);
  }
  entries_.push_back(std::move(entry));
}

void CollateralPool::ReduceLast(uint64_t reduction) {
  const auto& last = Last();
  if (last.value < reduction) {
    throw util::ExcessiveReduction("reduction " + std::to_string(reduction) + " exceeds last collateral entry value " + std::to_string(last.value));
  }
  entries_.back().value -= reduction;
}

void CollateralPool::IncreaseSupply(uint64_t amount) {
  const util::Wide next = static_cast<util::Wide>(circulating_supply_) + amount;
  if (!util::FitsU64(next)) {
    throw util::ArithmeticOverflow("circulating supply would exceed 64 bits");
  }
  circulating_supply_ = static_cast<uint64_t>(next);
}

void CollateralPool::DecreaseSupply(uint64_t amount) {
  if (circulating_supply_ < amount) {
    throw util::InsufficientSupply("burn " + std::to_string(amount) + " exceeds circulating supply " + std::to_string(circulating_supply_));
  }
  circulating_supply_ -= amount;
}

void CollateralPool::swap(CollateralPool& other) noexcept {
  entries_.swap(other.entries_);
  std::swap(circulating_supply_, other.circulating_supply_);
}

bool IsCollateralized(util::Wide total_collateral, uint64_t circulating_supply) {
  return total_collateral * kPercentDenominator >= static_cast<util::Wide>(circulating_supply) * kMinCollateralRatioPercent;
}

util::Wide RequiredCollateral(uint64_t circulating_supply, uint64_t amount) {
  const util::Wide next_supply = static_cast<util::Wide>(circulating_supply) + amount;
  return next_supply * kMinCollateralRatioPercent / kPercentDenominator;
}

uint64_t CollateralRatioBps(util::Wide total_collateral, uint64_t circulating_supply) {
  if (circulating_supply == 0) {
    return 0;
  }
  // A sum of u64 entries stays far below 2^114, so the product fits.
  const util::Wide bps = total_collateral * 10000 / circulating_supply;
  return util::FitsU64(bps) ? static_cast<uint64_t>(bps) : static_cast<uint64_t>(util::kU64Max);
}

} // namespace treasury::core
