// src/core/services.cpp
#include "blast/core/services.hpp"

#include <utility>

#include "blast/core/util/json.hpp"

namespace blast {

Result<std::unique_ptr<ResilienceServices>> ResilienceServices::create(
    const Config& cfg, const std::string& config_hash, const EscalationHook& escalation) {
  using R = Result<std::unique_ptr<ResilienceServices>>;

  const Status valid = validate_config(cfg);
  if (!valid.ok()) return R::err(valid);

  auto s = std::make_unique<ResilienceServices>(Token{}, cfg);

  s->router_ = std::make_unique<LogRouter>(cfg.logging);
  Status st = s->router_->create_run(cfg.node_id, config_hash);
  if (!st.ok()) return R::err(st);
  st = s->router_->start();
  if (!st.ok()) return R::err(st);

  s->events_ = std::make_unique<EventRecorder>(*s->router_);

  auto perf_r = PerformanceMonitor::create(cfg.performance, *s->router_);
  if (!perf_r.ok()) return R::err(perf_r.status());
  s->performance_ = perf_r.take_value();

  auto freeze_r = FreezeDetector::create(cfg.watchdog, *s->router_, *s->events_,
                                         &s->performance_->probe());
  if (!freeze_r.ok()) return R::err(freeze_r.status());
  s->freeze_ = freeze_r.take_value();

  auto rec_r = RecoveryEngine::create(
      cfg.recovery, default_recovery_actions(cfg.recovery, *s->router_, *s->events_, escalation),
      *s->router_, *s->events_);
  if (!rec_r.ok()) return R::err(rec_r.status());
  s->recovery_ = rec_r.take_value();

  auto comm_r = CommLogger::create(cfg.serial, *s->router_);
  if (!comm_r.ok()) return R::err(comm_r.status());
  s->comm_ = comm_r.take_value();

  return R::ok(std::move(s));
}

ResilienceServices::ResilienceServices(Token, const Config& cfg) : cfg_(cfg) {}

ResilienceServices::~ResilienceServices() { stop("destroyed"); }

void ResilienceServices::start() {
  if (started_ || stopped_) return;
  started_ = true;

  JsonObject d;
  d.add("node_id", cfg_.node_id)
      .add("run_dir", router_->run().dir)
      .add("resource_probe", performance_->probe().name())
      .add("watchdogs", freeze_->stats().watchdogs.size());
  (void)events_->log_startup(d);

  if (cfg_.performance.sampler_enabled) performance_->start();
  freeze_->start();
}

void ResilienceServices::stop(const std::string& reason) {
  if (stopped_) return;
  stopped_ = true;

  // A partially constructed set only has the router.
  if (events_) (void)events_->log_shutdown(reason);
  if (performance_) performance_->stop();
  if (freeze_) freeze_->stop();
  if (router_) router_->shutdown();
}

std::vector<HealthReport> ResilienceServices::health() const {
  std::vector<HealthReport> out;
  out.push_back(router_->health());
  out.push_back(performance_->health());
  out.push_back(freeze_->health());
  out.push_back(recovery_->health());
  out.push_back(comm_->health());
  return out;
}

std::string ResilienceServices::health_json() const {
  bool healthy = true;
  JsonArray components;
  for (const auto& h : health()) {
    healthy = healthy && h.healthy;
    components.push_raw(h.to_json());
  }

  JsonObject o;
  o.add("healthy", healthy).add_raw("components", components.str());
  return o.str();
}

}  // namespace blast
