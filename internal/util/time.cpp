#include "time.hpp"

namespace warranty::util {

using namespace std::chrono;

TimePoint Now() {
  return SystemClock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = time_point_cast<seconds>(tp);
  auto nanos = duration_cast<nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= seconds(1);
    nanos += seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + duration_cast<SystemClock::duration>(seconds(ts.seconds()) + nanoseconds(ts.nanos()));
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  if (unix_ms == 0) {
    return {};
  }
  return ToProto(FromUnixMillis(unix_ms));
}

uint64_t ProtoToMillis(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() == 0 && ts.nanos() == 0) {
    return 0;
  }
  return ToUnixMillis(FromProto(ts));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(duration_cast<milliseconds>(tp.time_since_epoch()).count());
}

TimePoint FromUnixMillis(uint64_t unix_ms) {
  return TimePoint{} + duration_cast<SystemClock::duration>(milliseconds(static_cast<int64_t>(unix_ms)));
}

TimePoint AddMonths(TimePoint tp, int months) {
  const auto day_start = floor<days>(tp);
  const auto time_of_day = tp - day_start;

  year_month_day ymd{day_start};
  ymd += std::chrono::months{months};
  if (!ymd.ok()) {
    ymd = year_month_day{ymd.year() / ymd.month() / last};
  }
  return sys_days{ymd} + time_of_day;
}

int YearOf(TimePoint tp) {
  const year_month_day ymd{floor<days>(tp)};
  return static_cast<int>(ymd.year());
}

int64_t DaysBetween(TimePoint from, TimePoint to) {
  if (to <= from) {
    return 0;
  }
  return duration_cast<days>(to - from).count();
}

TimePoint MakeDate(int year, unsigned month, unsigned day) {
  return sys_days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
}

} // namespace warranty::util
