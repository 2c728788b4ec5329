// src/core/monitor/performance_monitor.cpp
#include "blast/core/monitor/performance_monitor.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace blast {
namespace {

constexpr const char* kSource = "performance_monitor";

std::string fmt1(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v;
  return ss.str();
}

}  // namespace

void MetricStat::add(double value) {
  if (count == 0) {
    min = value;
    max = value;
  } else {
    min = std::min(min, value);
    max = std::max(max, value);
  }
  ++count;
  total += value;
  last = value;
}

JsonObject MetricStat::to_json() const {
  JsonObject o;
  o.add("name", name).add("count", count).add("average", average());
  if (count > 0) {
    o.add("min", min).add("max", max);
  } else {
    o.add_null("min").add_null("max");
  }
  o.add("last", last);
  if (!unit.empty()) o.add("unit", unit);
  return o;
}

bool is_resource_metric(const std::string& name) {
  return name.rfind("memory_", 0) == 0 || name.rfind("cpu_", 0) == 0 ||
         name.rfind("thread_", 0) == 0;
}

// -----------------------------
// ScopedTimer
// -----------------------------

PerformanceMonitor::ScopedTimer::ScopedTimer(PerformanceMonitor* monitor, std::string operation)
    : monitor_(monitor), operation_(std::move(operation)), start_(SteadyClock::now()) {
  monitor_->active_operations_.fetch_add(1);
}

PerformanceMonitor::ScopedTimer::ScopedTimer(ScopedTimer&& other) noexcept
    : monitor_(other.monitor_), operation_(std::move(other.operation_)), start_(other.start_) {
  other.monitor_ = nullptr;
}

PerformanceMonitor::ScopedTimer::~ScopedTimer() {
  if (!monitor_) return;
  const double ms = seconds_since(start_, SteadyClock::now()) * 1000.0;
  monitor_->finish_timing_(operation_, ms);
}

// -----------------------------
// PerformanceMonitor
// -----------------------------

Result<std::unique_ptr<PerformanceMonitor>> PerformanceMonitor::create(
    const PerformanceConfig& cfg, LogRouter& router, std::unique_ptr<ResourceProbe> probe) {
  using R = Result<std::unique_ptr<PerformanceMonitor>>;
  if (!(cfg.sample_interval_s > 0.0) || !(cfg.log_interval_s > 0.0)) {
    return R::err(Status::invalid_argument("performance: sample and log intervals must be positive"));
  }
  if (!probe) probe = std::make_unique<NullResourceProbe>();

  auto m = std::make_unique<PerformanceMonitor>(Token{}, cfg, router, std::move(probe));
  router.system(Level::kInfo, kSource,
                "initialized (sample=" + fmt1(cfg.sample_interval_s) +
                    "s, log=" + fmt1(cfg.log_interval_s) + "s, probe=" + m->probe_->name() + ")");
  return R::ok(std::move(m));
}

PerformanceMonitor::PerformanceMonitor(Token, const PerformanceConfig& cfg, LogRouter& router,
                                       std::unique_ptr<ResourceProbe> probe)
    : cfg_(cfg), router_(router), probe_(std::move(probe)), window_start_(SteadyClock::now()) {}

PerformanceMonitor::~PerformanceMonitor() {
  stop_.request();
  sampler_.join();
}

PerformanceMonitor::ScopedTimer PerformanceMonitor::measure(std::string operation) {
  return ScopedTimer(this, std::move(operation));
}

void PerformanceMonitor::finish_timing_(const std::string& operation, double elapsed_ms) {
  active_operations_.fetch_sub(1);
  record_metric(operation, elapsed_ms, "ms");

  if (elapsed_ms > cfg_.slow_operation_ms) {
    slow_operations_.fetch_add(1);
    router_.system(Level::kWarning, kSource,
                   "Slow operation: " + operation + " took " + fmt1(elapsed_ms) + "ms");
  }
}

void PerformanceMonitor::record_metric(const std::string& name, double value,
                                       const std::string& unit) {
  std::string snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    MetricStat& m = metrics_[name];
    if (m.name.empty()) {
      m.name = name;
      m.unit = unit;
    }
    m.add(value);

    const auto now = SteadyClock::now();
    if (seconds_since(window_start_, now) >= cfg_.log_interval_s) {
      snapshot = take_snapshot_(now);
    }
  }

  if (!snapshot.empty()) {
    LogRecord rec;
    rec.category = Category::kPerformance;
    rec.level = Level::kInfo;
    rec.source = kSource;
    rec.payload = std::move(snapshot);
    (void)router_.enqueue(std::move(rec));
  }
}

// Caller holds mu_.
std::string PerformanceMonitor::take_snapshot_(SteadyClock::time_point now) {
  JsonObject all;
  for (const auto& [name, stat] : metrics_) all.add(name, stat.to_json());

  JsonObject o;
  o.add("type", "metrics_snapshot")
      .add("window_s", seconds_since(window_start_, now))
      .add("metrics", all);

  for (auto it = metrics_.begin(); it != metrics_.end();) {
    if (is_resource_metric(it->first)) {
      ++it;
    } else {
      it = metrics_.erase(it);
    }
  }
  window_start_ = now;
  return o.str();
}

Status PerformanceMonitor::flush() {
  std::string snapshot;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (metrics_.empty()) return Status{};
    snapshot = take_snapshot_(SteadyClock::now());
  }

  LogRecord rec;
  rec.category = Category::kPerformance;
  rec.level = Level::kInfo;
  rec.source = kSource;
  rec.payload = std::move(snapshot);
  return router_.enqueue(std::move(rec));
}

void PerformanceMonitor::alert_(const std::string& kind, Level level, double value,
                                double threshold, const std::string& message) {
  alerts_sent_.fetch_add(1);

  JsonObject o;
  o.add("type", "alert_" + kind)
      .add("value", value)
      .add("threshold", threshold)
      .add("message", message);
  (void)router_.enqueue(Category::kPerformance, level, kSource, o);
  router_.system(level, kSource, message);
}

void PerformanceMonitor::sample_now() {
  Result<ResourceSnapshot> r = probe_->sample();
  if (!r.ok()) {
    // Log the first failure only; the probe does not change at runtime.
    if (!probe_failure_logged_.exchange(true)) {
      router_.system(Level::kWarning, kSource,
                     std::string("resource sampling failed: ") + r.status().message());
    }
    return;
  }
  const ResourceSnapshot& s = *r;

  record_metric("memory_mb", s.memory_mb, "MB");
  if (s.cpu_percent > 0.0) record_metric("cpu_percent", s.cpu_percent, "%");
  if (s.thread_count > 0) record_metric("thread_count", s.thread_count, "threads");

  if (s.memory_mb > cfg_.memory_ceiling_mb) {
    alert_("memory", Level::kWarning, s.memory_mb, cfg_.memory_ceiling_mb,
           "High memory usage: " + fmt1(s.memory_mb) + "MB");
  }

  if (s.cpu_percent >= cfg_.cpu_critical_percent) {
    alert_("cpu_critical", Level::kError, s.cpu_percent, cfg_.cpu_critical_percent,
           "Critical CPU usage: " + fmt1(s.cpu_percent) + "%");
  } else if (s.cpu_percent >= cfg_.cpu_warning_percent) {
    alert_("cpu_warning", Level::kWarning, s.cpu_percent, cfg_.cpu_warning_percent,
           "High CPU usage: " + fmt1(s.cpu_percent) + "%");
  }
}

void PerformanceMonitor::start() {
  if (!cfg_.sampler_enabled) return;
  if (running_.exchange(true)) {
    router_.system(Level::kWarning, kSource, "sampler already running");
    return;
  }

  stop_.reset();
  const auto interval = seconds_to_duration(cfg_.sample_interval_s);
  sampler_.start([this, interval] {
    while (!stop_.requested()) {
      sample_now();
      if (stop_.wait_for(interval)) break;
    }
  });
  router_.system(Level::kInfo, kSource, "monitoring started");
}

void PerformanceMonitor::stop() {
  if (running_.exchange(false)) {
    stop_.request();
    if (!sampler_.join_for(seconds_to_duration(2.0))) {
      router_.system(Level::kError, kSource, "sampler thread did not stop cleanly");
    } else {
      router_.system(Level::kInfo, kSource, "monitoring stopped");
    }
  }
  (void)flush();
}

std::map<std::string, MetricStat> PerformanceMonitor::statistics() const {
  std::lock_guard<std::mutex> lk(mu_);
  return metrics_;
}

std::optional<MetricStat> PerformanceMonitor::metric(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = metrics_.find(name);
  if (it == metrics_.end()) return std::nullopt;
  return it->second;
}

HealthReport PerformanceMonitor::health() const {
  HealthReport h;
  h.component = "performance_monitor";

  double memory_mb = 0.0;
  double cpu_percent = 0.0;
  int threads = 0;
  std::size_t tracked = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    tracked = metrics_.size();
    if (auto it = metrics_.find("memory_mb"); it != metrics_.end()) memory_mb = it->second.last;
    if (auto it = metrics_.find("cpu_percent"); it != metrics_.end()) cpu_percent = it->second.last;
    if (auto it = metrics_.find("thread_count"); it != metrics_.end()) {
      threads = static_cast<int>(it->second.last);
    }
  }

  if (memory_mb > cfg_.memory_ceiling_mb) h.flag("High memory usage");
  if (threads > cfg_.thread_ceiling) h.flag("Too many threads");
  if (cpu_percent >= cfg_.cpu_critical_percent) h.flag("Critical CPU usage");

  h.details.add("memory_mb", memory_mb)
      .add("cpu_percent", cpu_percent)
      .add("thread_count", threads)
      .add("active_operations", active_operations_.load())
      .add("metrics_tracked", tracked)
      .add("slow_operations", slow_operations_.load())
      .add("alerts_sent", alerts_sent_.load())
      .add("probe", probe_->name());
  return h;
}

}  // namespace blast
