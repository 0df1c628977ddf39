#pragma once

#include "internal/core/ledger_types.hpp"

namespace treasury::core {

/*
  Emergency brake.

  The governance address is fixed at construction. Only a caller equal to it
  may flip `paused`; issue and redeem consult EnsureActive().
*/
class GovernanceGuard {
 public:
  GovernanceGuard() = default;
  GovernanceGuard(Address governance, bool paused);

  const Address& Governance() const {
    return governance_;
  }
  bool IsPaused() const {
    return paused_;
  }

  // Throws Unauthorized unless caller == governance.
  void Authorize(const Address& caller) const;

  // Throws Paused.
  void EnsureActive() const;

  void Pause(const Address& caller);
  void Resume(const Address& caller);

  bool operator==(const GovernanceGuard&) const = default;

 private:
  Address governance_;
  bool    paused_ = false;
};

} // namespace treasury::core
