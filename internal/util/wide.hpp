#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>

namespace treasury::util {

/*
  128-bit unsigned arithmetic for collateral sums and ratio products.

  A sum of u64 values or a u64 * 150 product never overflows this width.
*/
__extension__ typedef unsigned __int128 Wide;

inline constexpr Wide kU64Max = std::numeric_limits<uint64_t>::max();

inline bool FitsU64(Wide value) {
  return value <= kU64Max;
}

inline std::string ToDecimal(Wide value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

} // namespace treasury::util
