// include/blast/core/monitor/performance_monitor.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "blast/core/config.hpp"
#include "blast/core/health.hpp"
#include "blast/core/logging/log_router.hpp"
#include "blast/core/monitor/resource_probe.hpp"
#include "blast/core/status.hpp"
#include "blast/core/util/json.hpp"
#include "blast/core/util/time.hpp"
#include "blast/core/util/worker.hpp"

namespace blast {

struct MetricStat {
  std::string name;
  std::string unit;
  std::uint64_t count = 0;
  double total = 0.0;
  double min = 0.0;
  double max = 0.0;
  double last = 0.0;

  void add(double value);
  [[nodiscard]] double average() const { return count > 0 ? total / static_cast<double>(count) : 0.0; }
  [[nodiscard]] JsonObject to_json() const;
};

// memory_*, cpu_*, thread_* are resource metrics and survive window resets.
bool is_resource_metric(const std::string& name);

class PerformanceMonitor {
  // Construction goes through create().
  struct Token {
    explicit Token() = default;
  };

 public:
  // Records elapsed milliseconds under its operation name when destroyed.
  class ScopedTimer {
   public:
    ScopedTimer(PerformanceMonitor* monitor, std::string operation);
    ~ScopedTimer();

    ScopedTimer(ScopedTimer&& other) noexcept;
    ScopedTimer& operator=(ScopedTimer&&) = delete;
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

   private:
    PerformanceMonitor* monitor_;
    std::string operation_;
    SteadyClock::time_point start_;
  };

  static Result<std::unique_ptr<PerformanceMonitor>> create(
      const PerformanceConfig& cfg, LogRouter& router,
      std::unique_ptr<ResourceProbe> probe = make_resource_probe());

  PerformanceMonitor(Token, const PerformanceConfig& cfg, LogRouter& router,
                     std::unique_ptr<ResourceProbe> probe);
  ~PerformanceMonitor();

  PerformanceMonitor(const PerformanceMonitor&) = delete;
  PerformanceMonitor& operator=(const PerformanceMonitor&) = delete;

  [[nodiscard]] ScopedTimer measure(std::string operation);

  // Updates the running stat; flushes a snapshot once per log interval.
  void record_metric(const std::string& name, double value, const std::string& unit = "");

  // Background sampler at sample_interval_s.
  void start();
  void stop();

  // One sampler pass: resource metrics plus threshold alerts.
  void sample_now();

  // Snapshot to the performance stream now; non-resource metrics start a new window.
  Status flush();

  [[nodiscard]] std::map<std::string, MetricStat> statistics() const;
  [[nodiscard]] std::optional<MetricStat> metric(const std::string& name) const;
  [[nodiscard]] std::uint64_t alerts_sent() const { return alerts_sent_.load(); }
  [[nodiscard]] std::uint64_t slow_operations() const { return slow_operations_.load(); }
  [[nodiscard]] int active_operations() const { return active_operations_.load(); }
  [[nodiscard]] HealthReport health() const;

  [[nodiscard]] ResourceProbe& probe() { return *probe_; }

 private:

  void finish_timing_(const std::string& operation, double elapsed_ms);
  void alert_(const std::string& kind, Level level, double value, double threshold,
              const std::string& message);
  std::string take_snapshot_(SteadyClock::time_point now);

  PerformanceConfig cfg_;
  LogRouter& router_;
  std::unique_ptr<ResourceProbe> probe_;

  mutable std::mutex mu_;
  std::map<std::string, MetricStat> metrics_;
  SteadyClock::time_point window_start_;

  std::atomic<std::uint64_t> alerts_sent_{0};
  std::atomic<std::uint64_t> slow_operations_{0};
  std::atomic<int> active_operations_{0};
  std::atomic<bool> probe_failure_logged_{false};

  StopSignal stop_;
  Worker sampler_{"perf_sampler"};
  std::atomic<bool> running_{false};
};

}  // namespace blast
