// tests/test_synth_source.cpp
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "blast/adapters/synth/synth_telemetry_source.hpp"

namespace blast {
namespace {

std::vector<TelemetryFrame> take(SynthTelemetrySource& src, int n) {
  std::vector<TelemetryFrame> out;
  while (static_cast<int>(out.size()) < n) {
    TelemetryFrame f;
    const Status s = src.next(&f);
    if (s.code() == Status::Code::kIoError) continue;
    EXPECT_TRUE(s.ok()) << s.message();
    out.push_back(std::move(f));
  }
  return out;
}

TEST(SynthTelemetrySource, ProducesConfiguredChannels) {
  SynthSourceConfig cfg;
  cfg.num_pressure = 2;
  cfg.num_thermocouple = 1;
  cfg.num_load_cell = 1;
  SynthTelemetrySource src(cfg);

  TelemetryFrame f;
  ASSERT_TRUE(src.next(&f).ok());
  EXPECT_EQ(f.sequence, 1u);
  EXPECT_EQ(f.t_ns.ns, 0);
  ASSERT_EQ(f.readings.size(), 4u);
  EXPECT_EQ(f.readings[0].id, "pt1");
  EXPECT_EQ(f.readings[0].unit, "PSI");
  EXPECT_EQ(f.readings[1].id, "pt2");
  EXPECT_EQ(f.readings[2].id, "tc1");
  EXPECT_EQ(f.readings[3].id, "lc1");
  EXPECT_EQ(f.readings[3].unit, "lbs");

  // Ambient at t=0, within a few sigma of noise.
  EXPECT_NEAR(f.readings[0].value, 14.7, 10.0);
  EXPECT_NEAR(f.readings[2].value, 20.0, 3.0);

  const std::string raw(f.raw.begin(), f.raw.end());
  EXPECT_EQ(raw.rfind("{\"seq\":1,\"t_ms\":0,\"pt1\":", 0), 0u);
  EXPECT_EQ(raw.back(), '\n');
}

TEST(SynthTelemetrySource, TimeAdvancesAtTickRate) {
  SynthSourceConfig cfg;
  cfg.tick_hz = 20.0;
  SynthTelemetrySource src(cfg);
  const auto frames = take(src, 3);
  EXPECT_EQ(frames[1].t_ns.ns, 50000000);
  EXPECT_EQ(frames[2].t_ns.ns, 100000000);
  EXPECT_EQ(frames[2].sequence, 3u);
}

TEST(SynthTelemetrySource, SameSeedSameFrames) {
  SynthSourceConfig cfg;
  cfg.seed = 99;
  SynthTelemetrySource a(cfg);
  SynthTelemetrySource b(cfg);
  const auto fa = take(a, 5);
  const auto fb = take(b, 5);
  for (std::size_t i = 0; i < fa.size(); ++i) EXPECT_EQ(fa[i].raw, fb[i].raw);

  cfg.seed = 100;
  SynthTelemetrySource c(cfg);
  EXPECT_NE(take(c, 1)[0].raw, fa[0].raw);
}

TEST(SynthTelemetrySource, ResetReplaysFromStart) {
  SynthTelemetrySource src(SynthSourceConfig{});
  const auto first = take(src, 3);
  ASSERT_TRUE(src.reset().ok());
  const auto again = take(src, 3);
  for (std::size_t i = 0; i < first.size(); ++i) EXPECT_EQ(first[i].raw, again[i].raw);
}

TEST(SynthTelemetrySource, InjectedFaultTimesOutOnceThenDelivers) {
  SynthSourceConfig cfg;
  cfg.fault_every_n = 3;
  SynthTelemetrySource src(cfg);

  TelemetryFrame f;
  ASSERT_TRUE(src.next(&f).ok());
  ASSERT_TRUE(src.next(&f).ok());

  const Status s = src.next(&f);
  EXPECT_EQ(s.code(), Status::Code::kIoError);
  EXPECT_EQ(s.message(), "serial read timeout (frame 3)");
  EXPECT_EQ(src.faults_injected(), 1u);

  ASSERT_TRUE(src.next(&f).ok());
  EXPECT_EQ(f.sequence, 3u);
  ASSERT_TRUE(src.next(&f).ok());
  EXPECT_EQ(f.sequence, 4u);
  EXPECT_EQ(src.faults_injected(), 1u);
}

TEST(SynthTelemetrySource, PressureRampsToPeak) {
  SynthSourceConfig cfg;
  cfg.tick_hz = 10.0;
  cfg.ramp_s = 1.0;
  cfg.pressure_peak = 500.0;
  cfg.num_thermocouple = 0;
  cfg.num_load_cell = 0;
  SynthTelemetrySource src(cfg);

  const auto frames = take(src, 15);
  EXPECT_NEAR(frames.back().readings[0].value, 500.0, 10.0);
}

TEST(SynthTelemetrySource, NullOutputRejected) {
  SynthTelemetrySource src(SynthSourceConfig{});
  EXPECT_EQ(src.next(nullptr).code(), Status::Code::kInvalidArgument);
}

}  // namespace
}  // namespace blast
