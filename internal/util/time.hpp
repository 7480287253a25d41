#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace vaultd::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Local wall-clock helpers (hour-of-day scheduling, journal dates).
int         LocalHour(TimePoint tp);
bool        SameLocalDay(TimePoint a, TimePoint b);
std::string LocalDate(TimePoint tp); // YYYY-MM-DD

// UTC ISO-8601 with millisecond precision, e.g. 2024-05-01T08:15:00.000Z
std::string ToIso8601(TimePoint tp);
// Returns false when the text is not an ISO-8601 UTC timestamp.
bool ParseIso8601(const std::string& text, TimePoint* out);

} // namespace vaultd::util
