#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace treasury::util {

/*
  Ledger clock.

  Everything the ledger timestamps (oracle updates, creation, journal
  entries) is persisted as unix milliseconds. Now() is truncated to the
  same precision so a time point read back from storage compares equal to
  the one that was written.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t ms);

} // namespace treasury::util
