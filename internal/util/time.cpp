#include "time.hpp"

namespace twiper::util {

TimePoint Now() {
  return Clock::now();
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixSeconds(std::int64_t seconds) {
  return TimePoint{} + std::chrono::seconds(seconds);
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

} // namespace twiper::util
