#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace syncore::util {

/*
  Wall-clock helpers. Expiry, deferral, blackout windows and audit stamps are
  all stored as Unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis    = std::chrono::milliseconds;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Returns fallback when the duration is unset or zero.
Millis FromProto(const google::protobuf::Duration& d, Millis fallback);

} // namespace syncore::util
