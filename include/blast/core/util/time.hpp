// include/blast/core/util/time.hpp
#pragma once

#include <chrono>
#include <string>

#include "blast/core/types.hpp"

namespace blast {

using SteadyClock = std::chrono::steady_clock;

TimestampNs wall_now();

// 2026-10-16T08:30:01.250Z
std::string iso8601_utc(TimestampNs t);

// 2026-10-16 10:30:01.250 (local time, used by the text stream)
std::string local_time_text(TimestampNs t);

// 20261016_103001_250 (local time, used for run ids)
std::string run_stamp(TimestampNs t);

inline std::chrono::nanoseconds seconds_to_duration(double seconds) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(seconds));
}

inline double seconds_since(SteadyClock::time_point since, SteadyClock::time_point now) {
  return std::chrono::duration<double>(now - since).count();
}

}  // namespace blast
