// File: include/blast/adapters/synth/synth_telemetry_source.hpp
#pragma once

#include <cstdint>
#include <random>
#include <string>

#include "blast/core/io/telemetry_source.hpp"

namespace blast {

struct SynthSourceConfig {
  double tick_hz{10.0};

  int num_pressure{4};      // pt1..ptN, PSI
  int num_thermocouple{3};  // tc1..tcN, degC
  int num_load_cell{2};     // lc1..lcN, lbs

  // Pressure ramps linearly from ambient to the peak over ramp_s, then holds with noise.
  double pressure_peak{800.0};
  double ramp_s{30.0};

  // Every Nth frame times out once before it is delivered (0 disables).
  int fault_every_n{0};

  std::uint32_t seed{1};
};

// Deterministic stand-in for the test stand's serial feed.
class SynthTelemetrySource final : public ITelemetrySource {
 public:
  explicit SynthTelemetrySource(SynthSourceConfig cfg);

  Status next(TelemetryFrame* out) override;
  Status reset() override;

  std::string name() const override { return "synth"; }

  [[nodiscard]] std::uint64_t faults_injected() const noexcept { return faults_; }

 private:
  std::int64_t tick_period_ns_{100000000};  // 10 Hz default
  std::int64_t tick_{0};
  bool faulted_this_tick_{false};
  std::uint64_t faults_{0};

  SynthSourceConfig cfg_;
  std::mt19937 rng_;
};

}  // namespace blast
