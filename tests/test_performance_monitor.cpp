// tests/test_performance_monitor.cpp
#include <chrono>
#include <thread>

#include <gtest/gtest.h>

#include "blast/core/monitor/performance_monitor.hpp"
#include "fake_probe.hpp"
#include "test_util.hpp"

namespace blast {
namespace {

class PerformanceMonitorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    router_ = std::make_unique<LogRouter>(test::logging_in(dir_));
    ASSERT_TRUE(router_->create_run("stand", "h").ok());
    ASSERT_TRUE(router_->start().ok());
  }

  std::unique_ptr<PerformanceMonitor> make(const PerformanceConfig& cfg,
                                           std::unique_ptr<ResourceProbe> probe) {
    auto r = PerformanceMonitor::create(cfg, *router_, std::move(probe));
    EXPECT_TRUE(r.ok()) << r.status().message();
    return r.ok() ? r.take_value() : nullptr;
  }

  std::vector<std::string> lines(Category c) {
    router_->shutdown();
    return test::read_lines(router_->path_for(c));
  }

  test::TempDir dir_;
  std::unique_ptr<LogRouter> router_;
};

TEST_F(PerformanceMonitorTest, RejectsNonPositiveIntervals) {
  PerformanceConfig cfg;
  cfg.sample_interval_s = 0.0;
  EXPECT_EQ(PerformanceMonitor::create(cfg, *router_).status().code(), Status::Code::kInvalidArgument);

  cfg = PerformanceConfig{};
  cfg.log_interval_s = -1.0;
  EXPECT_EQ(PerformanceMonitor::create(cfg, *router_).status().code(), Status::Code::kInvalidArgument);
}

TEST_F(PerformanceMonitorTest, MetricStatisticsTrackExtremaAndMean) {
  auto m = make(PerformanceConfig{}, std::make_unique<test::FakeProbe>());
  ASSERT_TRUE(m);
  m->record_metric("x", 10.0);
  m->record_metric("x", 20.0);
  m->record_metric("x", 30.0);

  const auto x = m->metric("x");
  ASSERT_TRUE(x.has_value());
  EXPECT_EQ(x->count, 3u);
  EXPECT_DOUBLE_EQ(x->min, 10.0);
  EXPECT_DOUBLE_EQ(x->max, 30.0);
  EXPECT_NEAR(x->average(), 20.0, 1e-9);
  EXPECT_DOUBLE_EQ(x->last, 30.0);
  EXPECT_FALSE(m->metric("y").has_value());
}

TEST_F(PerformanceMonitorTest, ScopedTimerRecordsAndFlagsSlowOperations) {
  PerformanceConfig cfg;
  cfg.slow_operation_ms = 5.0;
  auto m = make(cfg, std::make_unique<test::FakeProbe>());
  ASSERT_TRUE(m);

  {
    auto t = m->measure("read_frame");
    EXPECT_EQ(m->active_operations(), 1);
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  EXPECT_EQ(m->active_operations(), 0);

  const auto rf = m->metric("read_frame");
  ASSERT_TRUE(rf.has_value());
  EXPECT_EQ(rf->count, 1u);
  EXPECT_GE(rf->last, 5.0);
  EXPECT_EQ(rf->unit, "ms");
  EXPECT_EQ(m->slow_operations(), 1u);

  const auto sys = lines(Category::kSystem);
  EXPECT_EQ(test::count_containing(sys, "[WARNING] performance_monitor: Slow operation: read_frame took"), 1u);
}

TEST_F(PerformanceMonitorTest, LogIntervalSnapshotsAndResetsWindow) {
  PerformanceConfig cfg;
  cfg.log_interval_s = 0.05;
  auto m = make(cfg, std::make_unique<test::FakeProbe>());
  ASSERT_TRUE(m);

  m->record_metric("memory_mb", 100.0, "MB");
  m->record_metric("x", 1.0);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  m->record_metric("x", 2.0);

  // Application metrics start a fresh window, resource metrics carry over.
  EXPECT_FALSE(m->metric("x").has_value());
  ASSERT_TRUE(m->metric("memory_mb").has_value());

  const auto perf = lines(Category::kPerformance);
  ASSERT_EQ(test::count_containing(perf, "\"type\":\"metrics_snapshot\""), 1u);
  EXPECT_EQ(test::count_containing(perf, "\"x\":{\"name\":\"x\",\"count\":2"), 1u);
}

TEST_F(PerformanceMonitorTest, FlushWritesSnapshotNow) {
  auto m = make(PerformanceConfig{}, std::make_unique<test::FakeProbe>());
  ASSERT_TRUE(m);
  EXPECT_TRUE(m->flush().ok());  // nothing to write yet
  m->record_metric("frame_bytes", 120.0, "bytes");
  EXPECT_TRUE(m->flush().ok());
  EXPECT_EQ(test::count_containing(lines(Category::kPerformance), "\"frame_bytes\""), 1u);
}

TEST_F(PerformanceMonitorTest, SampleRaisesAlertsAndHealthIssues) {
  PerformanceConfig cfg;
  auto m = make(cfg, std::make_unique<test::FakeProbe>(ResourceSnapshot{600.0, 96.0, 60}));
  ASSERT_TRUE(m);
  m->sample_now();

  EXPECT_EQ(m->alerts_sent(), 2u);
  EXPECT_DOUBLE_EQ(m->metric("memory_mb")->last, 600.0);
  EXPECT_DOUBLE_EQ(m->metric("cpu_percent")->last, 96.0);
  EXPECT_DOUBLE_EQ(m->metric("thread_count")->last, 60.0);

  const HealthReport h = m->health();
  EXPECT_FALSE(h.healthy);
  EXPECT_EQ(h.issues.size(), 3u);

  const auto perf = lines(Category::kPerformance);
  EXPECT_EQ(test::count_containing(perf, "\"type\":\"alert_memory\""), 1u);
  EXPECT_EQ(test::count_containing(perf, "\"type\":\"alert_cpu_critical\""), 1u);
}

TEST_F(PerformanceMonitorTest, CpuWarningBelowCritical) {
  auto m = make(PerformanceConfig{}, std::make_unique<test::FakeProbe>(ResourceSnapshot{50.0, 85.0, 4}));
  ASSERT_TRUE(m);
  m->sample_now();
  EXPECT_EQ(m->alerts_sent(), 1u);
  EXPECT_TRUE(m->health().healthy);
  EXPECT_EQ(test::count_containing(lines(Category::kPerformance), "\"type\":\"alert_cpu_warning\""), 1u);
}

TEST_F(PerformanceMonitorTest, NullProbeRecordsNothing) {
  auto m = make(PerformanceConfig{}, std::make_unique<NullResourceProbe>());
  ASSERT_TRUE(m);
  m->sample_now();
  m->sample_now();
  EXPECT_TRUE(m->statistics().empty());
  EXPECT_EQ(test::count_containing(lines(Category::kSystem), "resource sampling failed"), 1u);
}

TEST_F(PerformanceMonitorTest, BackgroundSamplerRunsUntilStopped) {
  PerformanceConfig cfg;
  cfg.sample_interval_s = 0.02;
  auto probe = std::make_unique<test::FakeProbe>(ResourceSnapshot{10.0, 0.0, 3});
  test::FakeProbe* raw = probe.get();
  auto m = make(cfg, std::move(probe));
  ASSERT_TRUE(m);

  m->start();
  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  m->stop();

  const int after_stop = raw->samples();
  EXPECT_GE(after_stop, 2);
  std::this_thread::sleep_for(std::chrono::milliseconds(60));
  EXPECT_EQ(raw->samples(), after_stop);
}

TEST(ResourceProbeTest, PeekKeepsTheLastCpuReading) {
  ProcResourceProbe probe;
  const Result<ResourceSnapshot> first = probe.sample();
  if (!first.ok()) GTEST_SKIP() << first.status().message();
  EXPECT_DOUBLE_EQ(first->cpu_percent, 0.0);

  volatile double sink = 0.0;
  for (int i = 0; i < 2000000; ++i) sink = sink + static_cast<double>(i);

  const Result<ResourceSnapshot> peeked = probe.peek();
  ASSERT_TRUE(peeked.ok());
  EXPECT_DOUBLE_EQ(peeked->cpu_percent, first->cpu_percent);
  EXPECT_GT(peeked->memory_mb, 0.0);
}

TEST(ResourceProbeTest, NullProbePeekIsUnsupported) {
  NullResourceProbe probe;
  EXPECT_EQ(probe.peek().status().code(), Status::Code::kUnsupported);
}

}  // namespace
}  // namespace blast
