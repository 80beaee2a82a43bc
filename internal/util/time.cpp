#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace dedup::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

std::string ToIso8601(TimePoint tp) {
  return google::protobuf::util::TimeUtil::ToString(ToProto(tp));
}

} // namespace dedup::util
