#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace vaultd::util {

namespace {

std::tm LocalTm(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           out{};
  localtime_r(&t, &out);
  return out;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

int LocalHour(TimePoint tp) {
  return LocalTm(tp).tm_hour;
}

bool SameLocalDay(TimePoint a, TimePoint b) {
  const auto ta = LocalTm(a);
  const auto tb = LocalTm(b);
  return ta.tm_year == tb.tm_year && ta.tm_yday == tb.tm_yday;
}

std::string LocalDate(TimePoint tp) {
  const auto tm = LocalTm(tp);
  char       buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

std::string ToIso8601(TimePoint tp) {
  const int64_t     ms = ToUnixMillis(tp);
  const std::time_t t  = static_cast<std::time_t>(ms / 1000);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                tm.tm_sec, static_cast<int>(ms % 1000));
  return buf;
}

bool ParseIso8601(const std::string& text, TimePoint* out) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;

  const int matched = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ", &year, &month, &day, &hour, &minute, &second, &millis);
  if (matched < 6) {
    return false;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  const std::time_t t = timegm(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return false;
  }

  *out = Clock::from_time_t(t) + std::chrono::milliseconds(matched == 7 ? millis : 0);
  return true;
}

} // namespace vaultd::util
