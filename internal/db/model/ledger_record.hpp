#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace treasury::db::model {

struct CollateralEntryRecord {
  std::string asset_id;
  std::string description;
  uint64_t    value = 0;
};

/*
  Persistent ledger row.

  IMPORTANT:
  - One record is the whole aggregate: pool, supply, oracle, guard.
  - Entry order is significant (position = index in `entries`).
  - Version is used for optimistic concurrency; every committed mutation
    bumps it by exactly one.
*/
struct LedgerRecord {
  std::string id;

  std::vector<CollateralEntryRecord> entries;
  uint64_t                           circulating_supply = 0;

  uint64_t oracle_value      = 0;
  uint64_t oracle_updated_ms = 0;

  std::string governance;
  bool        paused = false;

  uint64_t version       = 0;
  uint64_t created_at_ms = 0;
};

} // namespace treasury::db::model
