#include "time.hpp"

#include <cstdint>
#include <string>

namespace rdash::util {

TimePoint Now() {
  return Clock::now();
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

std::string TimeAgo(std::chrono::seconds age) {
  const int64_t seconds = age.count() < 0 ? 0 : age.count();

  if (seconds >= 86400) return std::to_string(seconds / 86400) + "d ago";
  if (seconds >= 3600) return std::to_string(seconds / 3600) + "h ago";
  if (seconds >= 60) return std::to_string(seconds / 60) + "m ago";
  return std::to_string(seconds) + "s ago";
}

std::string TimeAgo(TimePoint then, TimePoint now) {
  return TimeAgo(std::chrono::duration_cast<std::chrono::seconds>(now - then));
}

} // namespace rdash::util
