#include "internal/core/valuation_oracle.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using std::chrono::milliseconds;
using treasury::core::ValuationOracle;

const treasury::util::TimePoint kT0 = treasury::util::TimePoint{} + std::chrono::hours(1);

void TestAgeIsClampedAtZero() {
  ValuationOracle oracle(500, kT0);
  assert(oracle.LatestValue() == 500);
  assert(oracle.Age(kT0 + milliseconds(2500)) == milliseconds(2500));
  assert(oracle.Age(kT0) == milliseconds(0));
  assert(oracle.Age(kT0 - std::chrono::seconds(1)) == milliseconds(0));
}

void TestStalenessUsesStrictBound() {
  ValuationOracle oracle(500, kT0);
  const auto      later = kT0 + milliseconds(2500);

  assert(oracle.IsStale(later, milliseconds(1000)));
  assert(!oracle.IsStale(later, milliseconds(2500)));
  assert(oracle.IsStale(later, milliseconds(2499)));
}

void TestZeroMaxAgeNeverStale() {
  ValuationOracle oracle;
  assert(oracle.LatestValue() == 0);
  assert(!oracle.IsStale(kT0 + std::chrono::hours(24 * 365), milliseconds(0)));
}

void TestUpdateReplacesValueAndTimestamp() {
  ValuationOracle oracle(500, kT0);
  const auto      later = kT0 + milliseconds(2500);

  oracle.Update(700, later);
  assert(oracle.LatestValue() == 700);
  assert(oracle.LastUpdated() == later);
  assert(!oracle.IsStale(later, milliseconds(1)));

  // A lower value is accepted as reported.
  oracle.Update(10, later + milliseconds(1));
  assert(oracle.LatestValue() == 10);
  assert(oracle == ValuationOracle(10, later + milliseconds(1)));
}

} // namespace

int main() {
  TestAgeIsClampedAtZero();
  TestStalenessUsesStrictBound();
  TestZeroMaxAgeNeverStale();
  TestUpdateReplacesValueAndTimestamp();

  std::cout << "treasury_ledger_unit_valuation_oracle: pass\n";
  return 0;
}
