#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace warranty::util {

/*
  Time utilities.

  All persisted timestamps are unix milliseconds; 0 means "unset".
  Core code reads the current time through a Clock so tests can pin it.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClockSource final : public Clock {
 public:
  TimePoint Now() const override {
    return SystemClock::now();
  }
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// 0 maps to an empty Timestamp.
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t unix_ms);

// Calendar month arithmetic in UTC. Day-of-month clamps to the end of the
// target month (Jan 31 + 1 month = Feb 28/29).
TimePoint AddMonths(TimePoint tp, int months);

int YearOf(TimePoint tp);

// Whole days between two instants, floored, never negative.
int64_t DaysBetween(TimePoint from, TimePoint to);

// UTC calendar date, midnight.
TimePoint MakeDate(int year, unsigned month, unsigned day);

} // namespace warranty::util
