// src/core/monitor/freeze_detector.cpp
#include "blast/core/monitor/freeze_detector.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

namespace blast {
namespace {

constexpr const char* kSource = "freeze_detector";

std::string fmt1(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v;
  return ss.str();
}

std::string this_thread_name() {
  std::ostringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace

Result<std::unique_ptr<FreezeDetector>> FreezeDetector::create(const WatchdogConfig& cfg,
                                                               LogRouter& router,
                                                               EventRecorder& events,
                                                               ResourceProbe* probe) {
  using R = Result<std::unique_ptr<FreezeDetector>>;
  if (!(cfg.poll_interval_s > 0.0)) {
    return R::err(Status::invalid_argument("watchdog.poll_interval_s must be > 0"));
  }
  if (!(cfg.min_heartbeat_interval_s > 0.0)) {
    return R::err(Status::invalid_argument("watchdog.min_heartbeat_interval_s must be > 0"));
  }
  if (cfg.history_size == 0) {
    return R::err(Status::invalid_argument("watchdog.history_size must be > 0"));
  }

  auto d = std::make_unique<FreezeDetector>(Token{}, cfg, router, events, probe);
  for (const auto& c : cfg.components) {
    const Status s = d->register_watchdog(c.name, c.timeout_s);
    if (!s.ok()) return R::err(s);
  }

  router.system(Level::kInfo, kSource,
                "initialized (poll=" + fmt1(cfg.poll_interval_s) +
                    "s, min_interval=" + fmt1(cfg.min_heartbeat_interval_s) +
                    "s, watchdogs=" + std::to_string(cfg.components.size()) + ")");
  return R::ok(std::move(d));
}

FreezeDetector::FreezeDetector(Token, const WatchdogConfig& cfg, LogRouter& router,
                               EventRecorder& events, ResourceProbe* probe)
    : cfg_(cfg), router_(router), events_(events), probe_(probe) {}

FreezeDetector::~FreezeDetector() {
  stop_.request();
  poller_.join();
}

Status FreezeDetector::register_watchdog(const std::string& component, double timeout_s,
                                         FreezeCallback callback) {
  if (component.empty()) return Status::invalid_argument("watchdog component name is empty");
  if (!(timeout_s > cfg_.min_heartbeat_interval_s)) {
    return Status::invalid_argument("watchdog '" + component + "': timeout " + fmt1(timeout_s) +
                                    "s must exceed heartbeat interval " +
                                    fmt1(cfg_.min_heartbeat_interval_s) + "s");
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    Entry& e = entries_[component];
    e = Entry{};
    e.timeout_s = timeout_s;
    e.last_heartbeat = SteadyClock::now();
    e.callback = std::move(callback);
  }

  router_.system(Level::kDebug, kSource,
                 "registered watchdog '" + component + "' (timeout=" + fmt1(timeout_s) + "s)");
  return Status{};
}

Status FreezeDetector::heartbeat(const std::string& component) {
  const auto now = SteadyClock::now();

  bool recovered = false;
  double frozen_for_s = 0.0;
  double gap_s = 0.0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(component);
    if (it == entries_.end()) return Status::not_found("no watchdog '" + component + "'");

    Entry& e = it->second;
    gap_s = seconds_since(e.last_heartbeat, now);
    if (e.frozen) {
      e.frozen = false;
      e.severe_reported = false;
      recovered = true;
      frozen_for_s = seconds_since(e.frozen_at, now);
      ++recoveries_;
    }
    e.last_heartbeat = now;
    ++e.heartbeats;
    ++heartbeats_;
  }

  if (recovered) {
    JsonObject d;
    d.add("component", component)
        .add("silent_s", gap_s)
        .add("frozen_for_s", frozen_for_s);
    router_.system(Level::kWarning, kSource,
                   component + " recovered from freeze after " + fmt1(gap_s) + "s");
    return events_.record(EventKind::kFreezeRecovered, d, Level::kWarning);
  }

  if (gap_s > 2.0 * cfg_.min_heartbeat_interval_s) {
    router_.system(Level::kDebug, kSource,
                   "heartbeat gap for '" + component + "': " + fmt1(gap_s) + "s");
  }
  return Status{};
}

Status FreezeDetector::set_active(const std::string& component, bool active) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = entries_.find(component);
  if (it == entries_.end()) return Status::not_found("no watchdog '" + component + "'");

  Entry& e = it->second;
  if (active && !e.active) {
    e.last_heartbeat = SteadyClock::now();
    e.frozen = false;
    e.severe_reported = false;
  }
  e.active = active;
  return Status{};
}

void FreezeDetector::add_freeze_callback(FreezeCallback callback) {
  std::lock_guard<std::mutex> lk(mu_);
  global_callbacks_.push_back(std::move(callback));
}

void FreezeDetector::log_operation(const std::string& name, const JsonObject& details) {
  OperationRecord op;
  op.t_wall = wall_now();
  op.name = name;
  op.details = details.str();
  op.thread = this_thread_name();

  std::lock_guard<std::mutex> lk(ops_mu_);
  operations_.push_back(std::move(op));
  while (operations_.size() > cfg_.history_size) operations_.pop_front();
}

std::vector<OperationRecord> FreezeDetector::recent_operations(std::size_t count) const {
  std::lock_guard<std::mutex> lk(ops_mu_);
  const std::size_t n = std::min(count, operations_.size());
  return std::vector<OperationRecord>(operations_.end() - static_cast<std::ptrdiff_t>(n),
                                      operations_.end());
}

std::size_t FreezeDetector::check_now() {
  const auto now = SteadyClock::now();

  std::vector<Freeze> frozen;
  std::vector<std::pair<std::string, double>> severe;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& [name, e] : entries_) {
      if (!e.active) continue;

      const double silent = seconds_since(e.last_heartbeat, now);
      if (silent <= e.timeout_s) continue;

      if (!e.frozen) {
        e.frozen = true;
        e.frozen_at = now;
        ++e.freeze_count;
        ++freezes_;

        Freeze f;
        f.component = name;
        f.silent_s = silent;
        f.timeout_s = e.timeout_s;
        f.freeze_number = freezes_;
        f.component_count = e.freeze_count;
        f.callback = e.callback;
        frozen.push_back(std::move(f));
      } else if (silent > 2.0 * e.timeout_s && !e.severe_reported) {
        e.severe_reported = true;
        severe.emplace_back(name, silent);
      }
    }
  }

  for (const auto& f : frozen) handle_freeze_(f);

  for (const auto& [name, silent] : severe) {
    JsonObject o;
    o.add("type", "severe_freeze").add("component", name).add("silent_s", silent);
    (void)router_.enqueue(Category::kErrors, Level::kError, kSource, o);
    router_.system(Level::kError, kSource,
                   "SEVERE FREEZE: " + name + " no heartbeat for " + fmt1(silent) + "s");
  }
  return frozen.size();
}

void FreezeDetector::handle_freeze_(const Freeze& f) {
  router_.system(Level::kCritical, kSource,
                 "FREEZE DETECTED! " + f.component + " no heartbeat for " + fmt1(f.silent_s) +
                     "s (freeze #" + std::to_string(f.freeze_number) + ")");

  JsonObject d;
  d.add("component", f.component)
      .add("silent_s", f.silent_s)
      .add("timeout_s", f.timeout_s)
      .add("freeze_count", f.component_count);
  const Status s = events_.record(EventKind::kFreezeDetected, d, Level::kCritical);
  if (!s.ok()) {
    router_.system(Level::kError, kSource, "failed recording freeze event: " + s.message());
  }

  std::vector<FreezeCallback> callbacks;
  if (f.callback) callbacks.push_back(f.callback);
  {
    std::lock_guard<std::mutex> lk(mu_);
    callbacks.insert(callbacks.end(), global_callbacks_.begin(), global_callbacks_.end());
  }

  for (const auto& cb : callbacks) {
    try {
      cb(f.component, f.silent_s);
    } catch (const std::exception& e) {
      router_.system(Level::kError, kSource,
                     "freeze callback for '" + f.component + "' threw: " + e.what());
    }
  }

  if (cfg_.dump_diagnostics) dump_diagnostics_(f);
}

void FreezeDetector::dump_diagnostics_(const Freeze& f) {
  JsonArray threads;
  JsonObject system_info;
  if (!probe_) {
    system_info.add("error", "no resource probe");
  } else {
    Result<std::vector<ThreadInfo>> t = probe_->threads();
    if (t.ok()) {
      for (const auto& ti : *t) {
        JsonObject o;
        o.add("tid", ti.tid).add("name", ti.name).add("state", ti.state);
        threads.push(o);
      }
    }

    Result<ResourceSnapshot> r = probe_->peek();
    if (r.ok()) {
      system_info.add("memory_mb", r->memory_mb)
          .add("cpu_percent", r->cpu_percent)
          .add("num_threads", r->thread_count);
    } else {
      system_info.add("error", r.status().message());
    }
  }

  JsonArray ops;
  for (const auto& op : recent_operations(cfg_.dump_operations)) {
    JsonObject o;
    o.add("timestamp", iso8601_utc(op.t_wall))
        .add("operation", op.name)
        .add_raw("details", op.details)
        .add("thread", op.thread);
    ops.push(o);
  }

  JsonObject dump;
  dump.add("timestamp", iso8601_utc(wall_now()))
      .add("component", f.component)
      .add("freeze_count", f.freeze_number)
      .add("time_since_heartbeat", f.silent_s)
      .add("timeout_s", f.timeout_s)
      .add_raw("thread_info", threads.str())
      .add("system_info", system_info)
      .add_raw("recent_operations", ops.str())
      .add_raw("watchdogs", watchdogs_json_());

  const std::string file =
      "freeze_" + f.component + "_" + std::to_string(f.freeze_number) + ".json";
  const Status s = router_.write_artifact(file, dump.str() + "\n");
  if (!s.ok()) {
    router_.system(Level::kError, kSource, "failed to dump diagnostics: " + s.message());
    return;
  }
  router_.system(Level::kCritical, kSource,
                 "freeze diagnostics dumped to " + file + " (" + std::to_string(threads.size()) +
                     " threads, " + std::to_string(ops.size()) + " operations)");
}

std::string FreezeDetector::watchdogs_json_() const {
  JsonArray arr;
  for (const auto& w : stats().watchdogs) {
    JsonObject o;
    o.add("component", w.component)
        .add("timeout_s", w.timeout_s)
        .add("since_heartbeat_s", w.since_heartbeat_s)
        .add("active", w.active)
        .add("frozen", w.frozen)
        .add("freeze_count", w.freeze_count);
    arr.push(o);
  }
  return arr.str();
}

void FreezeDetector::start() {
  if (running_.exchange(true)) {
    router_.system(Level::kWarning, kSource, "freeze detector already running");
    return;
  }

  stop_.reset();
  const auto interval = seconds_to_duration(cfg_.poll_interval_s);
  poller_.start([this, interval] {
    while (!stop_.requested()) {
      (void)check_now();
      if (stop_.wait_for(interval)) break;
    }
  });
  router_.system(Level::kInfo, kSource, "freeze detection started");
}

void FreezeDetector::stop() {
  if (!running_.exchange(false)) return;

  stop_.request();
  if (!poller_.join_for(seconds_to_duration(2.0))) {
    router_.system(Level::kError, kSource, "watchdog thread did not stop cleanly");
    return;
  }
  router_.system(Level::kInfo, kSource, "freeze detection stopped");
}

FreezeStats FreezeDetector::stats() const {
  const auto now = SteadyClock::now();

  FreezeStats s;
  s.monitoring = running_.load();

  std::lock_guard<std::mutex> lk(mu_);
  s.freezes = freezes_;
  s.recoveries = recoveries_;
  s.heartbeats = heartbeats_;
  for (const auto& [name, e] : entries_) {
    WatchdogStatus w;
    w.component = name;
    w.timeout_s = e.timeout_s;
    w.since_heartbeat_s = seconds_since(e.last_heartbeat, now);
    w.active = e.active;
    w.frozen = e.frozen;
    w.freeze_count = e.freeze_count;
    w.heartbeats = e.heartbeats;
    s.watchdogs.push_back(std::move(w));
  }
  return s;
}

HealthReport FreezeDetector::health() const {
  const FreezeStats s = stats();

  HealthReport h;
  h.component = "freeze_detector";

  JsonArray triggered;
  for (const auto& w : s.watchdogs) {
    if (!w.frozen) continue;
    triggered.push(w.component);
    h.flag("watchdog '" + w.component + "' frozen for " + fmt1(w.since_heartbeat_s) + "s");
  }
  if (!s.monitoring) h.flag("monitoring not active");

  h.details.add("monitoring_active", s.monitoring)
      .add("watchdogs", s.watchdogs.size())
      .add_raw("triggered", triggered.str())
      .add("freezes", s.freezes)
      .add("recoveries", s.recoveries)
      .add("heartbeats", s.heartbeats);
  return h;
}

}  // namespace blast
