#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace vault::util {

/*
  Time utilities.

  All persisted instants have microsecond resolution. kEpsilon is the
  smallest representable step and separates a superseded version's end
  from its successor's start.
*/

using Micros    = std::chrono::microseconds;
using TimePoint = std::chrono::time_point<std::chrono::system_clock, Micros>;

inline constexpr Micros kEpsilon{1};

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

// Test clock. Only moves when told to.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start);

  TimePoint Now() const override;

  void Advance(Micros delta);
  void Set(TimePoint tp);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

Micros FromProto(const google::protobuf::Duration& d);

// 2026-01-31T12:00:00.000001Z
std::string FormatIso(TimePoint tp);

} // namespace vault::util
