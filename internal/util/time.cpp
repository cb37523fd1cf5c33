#include "internal/util/time.hpp"

namespace syncore::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

Millis FromProto(const google::protobuf::Duration& d, Millis fallback) {
  const auto total = std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos());
  if (total.count() <= 0) {
    return fallback;
  }
  return std::chrono::duration_cast<Millis>(total);
}

} // namespace syncore::util
