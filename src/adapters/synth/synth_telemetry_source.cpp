// File: src/adapters/synth/synth_telemetry_source.cpp
#include "blast/adapters/synth/synth_telemetry_source.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "blast/core/util/json.hpp"

namespace blast {
namespace {

constexpr double kAmbientPsi = 14.7;
constexpr double kAmbientC = 20.0;
constexpr double kThermalRiseC = 60.0;
constexpr double kLoadPeakLbs = 500.0;

std::int64_t hz_to_period_ns(double hz) {
  if (hz <= 0.0) return 100000000;  // 10 Hz fallback
  const double ns = 1e9 / hz;
  return static_cast<std::int64_t>(std::llround(ns));
}

double round2(double v) { return std::round(v * 100.0) / 100.0; }

}  // namespace

SynthTelemetrySource::SynthTelemetrySource(SynthSourceConfig cfg)
    : cfg_(std::move(cfg)), rng_(cfg_.seed) {
  tick_period_ns_ = hz_to_period_ns(cfg_.tick_hz);
}

Status SynthTelemetrySource::reset() {
  tick_ = 0;
  faulted_this_tick_ = false;
  faults_ = 0;
  rng_.seed(cfg_.seed);
  return Status::ok_status();
}

Status SynthTelemetrySource::next(TelemetryFrame* out) {
  if (!out) return Status::invalid_argument("SynthTelemetrySource::next: out is null");

  const std::uint64_t seq = static_cast<std::uint64_t>(tick_) + 1;
  if (cfg_.fault_every_n > 0 && seq % static_cast<std::uint64_t>(cfg_.fault_every_n) == 0 &&
      !faulted_this_tick_) {
    faulted_this_tick_ = true;
    ++faults_;
    return Status::io_error("serial read timeout (frame " + std::to_string(seq) + ")");
  }
  faulted_this_tick_ = false;

  const std::int64_t t_ns = tick_ * tick_period_ns_;
  const double t_s = static_cast<double>(t_ns) * 1e-9;
  const double ramp = std::clamp(t_s / cfg_.ramp_s, 0.0, 1.0);

  std::normal_distribution<double> noise(0.0, 1.0);

  out->t_ns = TimestampNs{t_ns};
  out->sequence = seq;
  out->readings.clear();

  for (int i = 1; i <= cfg_.num_pressure; ++i) {
    const double v = kAmbientPsi + (cfg_.pressure_peak - kAmbientPsi) * ramp + 2.0 * noise(rng_);
    out->readings.push_back({"pt" + std::to_string(i), round2(std::max(0.0, v)), "PSI"});
  }
  for (int i = 1; i <= cfg_.num_thermocouple; ++i) {
    const double v = kAmbientC + kThermalRiseC * ramp + 0.5 * noise(rng_);
    out->readings.push_back({"tc" + std::to_string(i), round2(v), "C"});
  }
  for (int i = 1; i <= cfg_.num_load_cell; ++i) {
    const double v = kLoadPeakLbs * ramp + 3.0 * noise(rng_);
    out->readings.push_back({"lc" + std::to_string(i), round2(v), "lbs"});
  }

  // Same shape the stand controller prints: one JSON object per line.
  JsonObject line;
  line.add("seq", seq).add("t_ms", t_ns / 1000000);
  for (const auto& r : out->readings) line.add(r.id, r.value);
  const std::string text = line.str() + "\n";
  out->raw.assign(text.begin(), text.end());

  ++tick_;
  return Status::ok_status();
}

}  // namespace blast
