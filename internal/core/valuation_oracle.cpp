#include "valuation_oracle.hpp"

namespace treasury::core {

ValuationOracle::ValuationOracle(uint64_t latest_value, util::TimePoint last_updated) : latest_value_(latest_value), last_updated_(last_updated) {
}

void ValuationOracle::Update(uint64_t value, util::TimePoint now) {
  latest_value_ = value;
  last_updated_ = now;
}

std::chrono::milliseconds ValuationOracle::Age(util::TimePoint now) const {
  if (now <= last_updated_) {
    return std::chrono::milliseconds{0};
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(now - last_updated_);
}

bool ValuationOracle::IsStale(util::TimePoint now, std::chrono::milliseconds max_age) const {
  if (max_age.count() <= 0) {
    return false;
  }
  return Age(now) > max_age;
}

} // namespace treasury::core
