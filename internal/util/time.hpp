#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace eryzaa::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// Seconds since the unix epoch; the unit of advertisement timestamps.
std::uint64_t UnixSeconds(TimePoint tp);
std::uint64_t NowUnixSeconds();

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

} // namespace eryzaa::util
