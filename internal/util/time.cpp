#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace vault::util {

TimePoint SystemClock::Now() const {
  return std::chrono::time_point_cast<Micros>(std::chrono::system_clock::now());
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Advance(Micros delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

void ManualClock::Set(TimePoint tp) {
  std::lock_guard lock(mutex_);
  now_ = tp;
}

int64_t ToUnixMicros(TimePoint tp) {
  return tp.time_since_epoch().count();
}

TimePoint FromUnixMicros(int64_t micros) {
  return TimePoint{Micros{micros}};
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto micro = std::chrono::duration_cast<Micros>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(micro.count() * 1000));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::seconds(ts.seconds()) + Micros(ts.nanos() / 1000);
}

Micros FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Micros>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

std::string FormatIso(TimePoint tp) {
  auto        sec   = std::chrono::floor<std::chrono::seconds>(tp);
  auto        micro = (tp - sec).count();
  std::time_t t     = static_cast<std::time_t>(sec.time_since_epoch().count());

  std::tm tm{};
  gmtime_r(&t, &tm);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lldZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<long long>(micro));
  return buf;
}

} // namespace vault::util
