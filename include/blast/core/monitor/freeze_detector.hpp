// include/blast/core/monitor/freeze_detector.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "blast/core/config.hpp"
#include "blast/core/events/event_recorder.hpp"
#include "blast/core/health.hpp"
#include "blast/core/logging/log_router.hpp"
#include "blast/core/monitor/resource_probe.hpp"
#include "blast/core/status.hpp"
#include "blast/core/util/json.hpp"
#include "blast/core/util/time.hpp"
#include "blast/core/util/worker.hpp"

namespace blast {

// Invoked from the poll thread when a component enters FROZEN.
using FreezeCallback = std::function<void(const std::string& component, double silent_s)>;

struct WatchdogStatus {
  std::string component;
  double timeout_s = 0.0;
  double since_heartbeat_s = 0.0;
  bool active = true;
  bool frozen = false;
  std::uint64_t freeze_count = 0;
  std::uint64_t heartbeats = 0;
};

struct FreezeStats {
  std::uint64_t freezes = 0;
  std::uint64_t recoveries = 0;
  std::uint64_t heartbeats = 0;
  bool monitoring = false;
  std::vector<WatchdogStatus> watchdogs;
};

struct OperationRecord {
  TimestampNs t_wall;
  std::string name;
  std::string details;  // JSON object
  std::string thread;
};

// Per-component heartbeat watchdogs.
//
// NORMAL -> (silent > timeout) -> FROZEN -> (heartbeat) -> NORMAL
// One freeze alert per episode; one recovery event per episode.
// Observational only: never blocks or cancels the monitored component.
class FreezeDetector {
  // Construction goes through create().
  struct Token {
    explicit Token() = default;
  };

 public:
  // `probe` may be null; dumps then carry no resource snapshot.
  static Result<std::unique_ptr<FreezeDetector>> create(const WatchdogConfig& cfg,
                                                        LogRouter& router,
                                                        EventRecorder& events,
                                                        ResourceProbe* probe = nullptr);
  FreezeDetector(Token, const WatchdogConfig& cfg, LogRouter& router, EventRecorder& events,
                 ResourceProbe* probe);
  ~FreezeDetector();

  FreezeDetector(const FreezeDetector&) = delete;
  FreezeDetector& operator=(const FreezeDetector&) = delete;

  // timeout_s must be strictly greater than min_heartbeat_interval_s.
  Status register_watchdog(const std::string& component, double timeout_s,
                           FreezeCallback callback = {});

  Status heartbeat(const std::string& component);

  // Paused watchdogs are not checked. Resuming restarts the heartbeat clock.
  Status set_active(const std::string& component, bool active);

  void add_freeze_callback(FreezeCallback callback);

  // Bounded history, only used for freeze dumps.
  void log_operation(const std::string& name, const JsonObject& details = JsonObject{});
  [[nodiscard]] std::vector<OperationRecord> recent_operations(std::size_t count) const;

  // One poll pass. Returns the number of components that entered FROZEN.
  std::size_t check_now();

  void start();
  void stop();

  [[nodiscard]] FreezeStats stats() const;
  [[nodiscard]] HealthReport health() const;

 private:
  struct Entry {
    double timeout_s = 0.0;
    SteadyClock::time_point last_heartbeat;
    SteadyClock::time_point frozen_at;
    bool active = true;
    bool frozen = false;
    bool severe_reported = false;
    std::uint64_t freeze_count = 0;
    std::uint64_t heartbeats = 0;
    FreezeCallback callback;
  };

  struct Freeze {
    std::string component;
    double silent_s = 0.0;
    double timeout_s = 0.0;
    std::uint64_t freeze_number = 0;  // detector-wide
    std::uint64_t component_count = 0;
    FreezeCallback callback;
  };

  void handle_freeze_(const Freeze& f);
  void dump_diagnostics_(const Freeze& f);
  std::string watchdogs_json_() const;

  WatchdogConfig cfg_;
  LogRouter& router_;
  EventRecorder& events_;
  ResourceProbe* probe_;

  mutable std::mutex mu_;
  std::map<std::string, Entry> entries_;
  std::vector<FreezeCallback> global_callbacks_;
  std::uint64_t freezes_{0};
  std::uint64_t recoveries_{0};
  std::uint64_t heartbeats_{0};

  mutable std::mutex ops_mu_;
  std::deque<OperationRecord> operations_;

  StopSignal stop_;
  Worker poller_{"freeze_watchdog"};
  std::atomic<bool> running_{false};
};

}  // namespace blast
