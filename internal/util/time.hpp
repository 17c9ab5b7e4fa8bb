#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace rulebook::util {

/*
  Time utilities. Clock source is controlled here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Optional timestamps are stored as millis with 0 meaning "unset".
int64_t                  ToUnixMillis(const std::optional<TimePoint>& tp);
std::optional<TimePoint> OptionalFromUnixMillis(int64_t ms);

// "<seconds>.<micros>" wall-clock stamp used in job ids.
std::string EpochStamp(TimePoint tp);

} // namespace rulebook::util
