#pragma once

#include <cstdint>
#include <string>

#include "treasury/ledger/core/v1/types.pb.h"

namespace treasury::db::model {

/*
  Append-only audit entry. `sequence` is assigned by the repository,
  contiguous per ledger starting at 1.
*/
struct LedgerEventRecord {
  std::string ledger_id;
  uint64_t    sequence = 0;

  treasury::ledger::core::v1::LedgerEventKind kind = treasury::ledger::core::v1::LEDGER_EVENT_KIND_UNSPECIFIED;

  std::string actor;
  std::string counterparty;
  uint64_t    amount           = 0;
  uint64_t    collateral_value = 0;
  uint64_t    created_at_ms    = 0;
};

} // namespace treasury::db::model
