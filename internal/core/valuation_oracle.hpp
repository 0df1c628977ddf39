#pragma once

#include <chrono>
#include <cstdint>

#include "internal/util/time.hpp"

namespace treasury::core {

/*
  Latest reported collateral valuation and when it was recorded.

  The value is accepted as given; nothing here fetches or derives it.
*/
class ValuationOracle {
 public:
  ValuationOracle() = default;
  ValuationOracle(uint64_t latest_value, util::TimePoint last_updated);

  uint64_t LatestValue() const {
    return latest_value_;
  }
  util::TimePoint LastUpdated() const {
    return last_updated_;
  }

  void Update(uint64_t value, util::TimePoint now);

  // Zero if `now` precedes the last update.
  std::chrono::milliseconds Age(util::TimePoint now) const;

  // Always false when max_age is zero.
  bool IsStale(util::TimePoint now, std::chrono::milliseconds max_age) const;

  bool operator==(const ValuationOracle&) const = default;

 private:
  uint64_t        latest_value_ = 0;
  util::TimePoint last_updated_{};
};

} // namespace treasury::core
