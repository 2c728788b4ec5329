// include/blast/core/services.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "blast/core/comm/comm_logger.hpp"
#include "blast/core/config.hpp"
#include "blast/core/events/event_recorder.hpp"
#include "blast/core/health.hpp"
#include "blast/core/logging/log_router.hpp"
#include "blast/core/monitor/freeze_detector.hpp"
#include "blast/core/monitor/performance_monitor.hpp"
#include "blast/core/recovery/recovery_engine.hpp"
#include "blast/core/status.hpp"

namespace blast {

// Owns the resilience services for one run and their start/stop order.
//
// Construction order: router (run created, writer started) -> events -> performance
// -> freeze -> recovery -> comm. stop() halts the sampler, then the watchdog poll,
// and shuts the router down last so every final record is written.
class ResilienceServices {
  // Construction goes through create().
  struct Token {
    explicit Token() = default;
  };

 public:
  static Result<std::unique_ptr<ResilienceServices>> create(const Config& cfg,
                                                            const std::string& config_hash,
                                                            const EscalationHook& escalation = {});
  ResilienceServices(Token, const Config& cfg);
  ~ResilienceServices();

  ResilienceServices(const ResilienceServices&) = delete;
  ResilienceServices& operator=(const ResilienceServices&) = delete;

  // Startup event plus the background sampler and watchdog poll.
  void start();

  // Idempotent.
  void stop(const std::string& reason = "normal");

  LogRouter& router() { return *router_; }
  EventRecorder& events() { return *events_; }
  PerformanceMonitor& performance() { return *performance_; }
  FreezeDetector& freeze() { return *freeze_; }
  RecoveryEngine& recovery() { return *recovery_; }
  CommLogger& comm() { return *comm_; }

  [[nodiscard]] const Config& config() const noexcept { return cfg_; }

  [[nodiscard]] std::vector<HealthReport> health() const;

  // {"healthy": all healthy, "components": [...]}
  [[nodiscard]] std::string health_json() const;

 private:
  Config cfg_;
  bool started_{false};
  bool stopped_{false};

  // Declaration order is destruction order in reverse: the router outlives its producers.
  std::unique_ptr<LogRouter> router_;
  std::unique_ptr<EventRecorder> events_;
  std::unique_ptr<PerformanceMonitor> performance_;
  std::unique_ptr<FreezeDetector> freeze_;
  std::unique_ptr<RecoveryEngine> recovery_;
  std::unique_ptr<CommLogger> comm_;
};

}  // namespace blast
