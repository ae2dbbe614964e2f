#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace eryzaa::util {

TimePoint Now() {
  return Clock::now();
}

std::uint64_t UnixSeconds(TimePoint tp) {
  const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
  return secs < 0 ? 0 : static_cast<std::uint64_t>(secs);
}

std::uint64_t NowUnixSeconds() {
  return UnixSeconds(Now());
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(google::protobuf::util::TimeUtil::DurationToMilliseconds(d));
}

} // namespace eryzaa::util
