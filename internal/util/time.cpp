#include "time.hpp"

#include <atomic>

namespace tables::util {
namespace {

// unix ms, 0 when the real clock is in use
std::atomic<int64_t> fixed_now_ms{0};

} // namespace

TimePoint Now() {
  if (auto fixed = fixed_now_ms.load(std::memory_order_relaxed); fixed != 0) {
    return TimePoint{std::chrono::milliseconds(fixed)};
  }
  return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  const auto ms = tp.time_since_epoch().count();

  google::protobuf::Timestamp ts;
  ts.set_seconds(ms / 1000);
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  // sub-millisecond nanos are dropped
  return TimePoint{std::chrono::milliseconds(ts.seconds() * 1000 + ts.nanos() / 1000000)};
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(tp.time_since_epoch().count());
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{std::chrono::milliseconds(static_cast<int64_t>(ms))};
}

ScopedFixedClock::ScopedFixedClock(TimePoint fixed) {
  fixed_now_ms.store(fixed.time_since_epoch().count(), std::memory_order_relaxed);
}

ScopedFixedClock::~ScopedFixedClock() {
  fixed_now_ms.store(0, std::memory_order_relaxed);
}

} // namespace tables::util
