#include "governance_guard.hpp"

#include <utility>

#include "internal/util/errors.hpp"

namespace treasury::core {

GovernanceGuard::GovernanceGuard(Address governance, bool paused) : governance_(std::move(governance)), paused_(paused) {
}

void GovernanceGuard::Authorize(const Address& caller) const {
  if (caller.empty() || caller != governance_) {
    throw util::Unauthorized("caller '" + caller + "' is not the governance address");
  }
}

void GovernanceGuard::EnsureActive() const {
  if (paused_) {
    throw util::Paused("ledger is paused by governance");
  }
}

void GovernanceGuard::Pause(const Address& caller) {
  Authorize(caller);
  paused_ = true;
}

void GovernanceGuard::Resume(const Address& caller) {
  Authorize(caller);
  paused_ = false;
}

} // namespace treasury::core
