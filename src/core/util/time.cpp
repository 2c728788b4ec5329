// src/core/util/time.cpp
#include "blast/core/util/time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace blast {
namespace {

struct Split {
  std::time_t secs;
  int millis;
};

Split split(TimestampNs t) {
  std::int64_t secs = t.ns / 1'000'000'000;
  std::int64_t rem = t.ns % 1'000'000'000;
  if (rem < 0) {
    rem += 1'000'000'000;
    --secs;
  }
  return Split{static_cast<std::time_t>(secs), static_cast<int>(rem / 1'000'000)};
}

std::string format(TimestampNs t, bool utc, const char* fmt, char millis_sep) {
  const Split s = split(t);
  std::tm tm{};
  if (utc) gmtime_r(&s.secs, &tm);
  else localtime_r(&s.secs, &tm);

  std::ostringstream ss;
  ss << std::put_time(&tm, fmt) << millis_sep << std::setw(3) << std::setfill('0') << s.millis;
  return ss.str();
}

}  // namespace

TimestampNs wall_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return TimestampNs{
      static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count())};
}

std::string iso8601_utc(TimestampNs t) {
  return format(t, /*utc=*/true, "%Y-%m-%dT%H:%M:%S", '.') + "Z";
}

std::string local_time_text(TimestampNs t) {
  return format(t, /*utc=*/false, "%Y-%m-%d %H:%M:%S", '.');
}

std::string run_stamp(TimestampNs t) {
  return format(t, /*utc=*/false, "%Y%m%d_%H%M%S", '_');
}

}  // namespace blast
