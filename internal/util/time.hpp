#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace dedup::util {

/*
  Time utilities. All wall-clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// RFC 3339 UTC, e.g. 2024-05-01T12:30:00.123Z
std::string ToIso8601(TimePoint tp);

} // namespace dedup::util
