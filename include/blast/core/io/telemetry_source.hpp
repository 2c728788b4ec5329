// File: include/blast/core/io/telemetry_source.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "blast/core/status.hpp"
#include "blast/core/types.hpp"

namespace blast {

struct SensorReading {
  std::string id;  // pt1, tc1, lc1 ...
  double value{0.0};
  std::string unit;
};

struct TelemetryFrame {
  // Logical time since the source started.
  TimestampNs t_ns{0};
  std::uint64_t sequence{0};
  std::vector<SensorReading> readings;

  // The line as it arrived on the wire (JSON object + '\n').
  Bytes raw;
};

class ITelemetrySource {
 public:
  virtual ~ITelemetrySource() = default;

  // Returns:
  //  - OK on success and fills `out`
  //  - out_of_range("eof") when no more frames
  //  - io_error on a read timeout; the same frame is returned by the next call
  //  - other error codes on failure
  virtual Status next(TelemetryFrame* out) = 0;

  virtual Status reset() { return Status::unsupported("reset not supported"); }

  virtual std::string name() const = 0;
};

}  // namespace blast
