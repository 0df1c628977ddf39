#pragma once

#include <cstdint>
#include <string>

namespace treasury::db::model {

struct HoldingRecord {
  std::string ledger_id;
  std::string holder;
  uint64_t    balance = 0;
};

}
