#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace tables::util {

/*
  Clock for audit records and row timestamps.

  Rows store unix milliseconds, so Now() is truncated to milliseconds and
  an audit timestamp survives the JSON round trip unchanged.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

TimePoint Now();
uint64_t  NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Pins Now() for the lifetime of the object. Not nestable.
class ScopedFixedClock {
 public:
  explicit ScopedFixedClock(TimePoint fixed);
  ~ScopedFixedClock();

  ScopedFixedClock(const ScopedFixedClock&)            = delete;
  ScopedFixedClock& operator=(const ScopedFixedClock&) = delete;
};

} // namespace tables::util
