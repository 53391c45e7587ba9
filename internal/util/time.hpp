#pragma once

#include <google/protobuf/timestamp.pb.h>

#include <chrono>
#include <cstdint>

namespace twiper::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::int64_t ToUnixSeconds(TimePoint tp);
TimePoint    FromUnixSeconds(std::int64_t seconds);

TimePoint FromProto(const google::protobuf::Timestamp& ts);

} // namespace twiper::util
