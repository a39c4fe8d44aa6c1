#pragma once

#include <chrono>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace rdash::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

TimePoint FromProto(const google::protobuf::Timestamp& ts);

// "5s ago", "3m ago", "2h ago", "4d ago". Negative ages clamp to "0s ago".
std::string TimeAgo(std::chrono::seconds age);
std::string TimeAgo(TimePoint then, TimePoint now = Now());

} // namespace rdash::util
