#pragma once

#include <cstdint>
#include <string>

namespace treasury::core {

// Host-supplied caller / holder identity. Empty is never valid.
using Address = std::string;

// Minimum collateralization, in percent of circulating supply.
inline constexpr uint64_t kMinCollateralRatioPercent = 150;
inline constexpr uint64_t kPercentDenominator        = 100;

struct CollateralEntry {
  std::string asset_id;  // opaque bytes, unique within a pool
  std::string description;
  uint64_t    value = 0; // smallest currency unit

  bool operator==(const CollateralEntry&) const = default;
};

} // namespace treasury::core
