// include/blast/core/types.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace blast {

// -----------------------------
// Basic identifiers
// -----------------------------

using NodeId = std::string;       // e.g. "blast_stand"
using ComponentName = std::string;  // watchdog / metric owner, e.g. "data_acquisition"

using Bytes = std::vector<std::uint8_t>;  // raw serial traffic

// -----------------------------
// Time
// -----------------------------
// Wall timestamps are integer nanoseconds since the Unix epoch. Durations used for
// liveness and backoff decisions come from steady_clock and never from these.

struct TimestampNs {
  std::int64_t ns = 0;

  constexpr bool operator==(const TimestampNs& other) const noexcept { return ns == other.ns; }
  constexpr bool operator!=(const TimestampNs& other) const noexcept { return ns != other.ns; }
  constexpr bool operator<(const TimestampNs& other) const noexcept { return ns < other.ns; }
  constexpr bool operator<=(const TimestampNs& other) const noexcept { return ns <= other.ns; }
  constexpr bool operator>(const TimestampNs& other) const noexcept { return ns > other.ns; }
  constexpr bool operator>=(const TimestampNs& other) const noexcept { return ns >= other.ns; }
};

// -----------------------------
// Severity
// -----------------------------

enum class Level : int {
  kDebug = 0,
  kInfo,
  kWarning,
  kError,
  kCritical,
};

const char* to_string(Level level);

// Accepts "debug", "info", "warning"/"warn", "error", "critical" (case-insensitive).
bool parse_level(const std::string& s, Level* out);

// -----------------------------
// Log categories
// -----------------------------
// Each streaming category maps to one append-only file inside the run directory.
// kArtifact is not a stream: the record is written as a standalone file.

enum class Category : int {
  kEvents = 0,
  kErrors,
  kPerformance,
  kSerial,
  kSystem,
  kData,
  kArtifact,
};

inline constexpr int kStreamCategoryCount = 6;

const char* to_string(Category category);

// True for categories written as one JSON object per line.
constexpr bool is_json_category(Category c) noexcept {
  return c != Category::kSystem && c != Category::kArtifact;
}

}  // namespace blast
