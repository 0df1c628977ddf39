#include "time.hpp"

namespace treasury::util {

TimePoint Now() {
  return FromUnixMillis(ToUnixMillis(Clock::now()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  return MillisToProto(ToUnixMillis(tp));
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(ms / 1000));
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
  return ts;
}

} // namespace treasury::util
