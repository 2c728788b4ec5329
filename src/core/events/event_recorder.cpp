// src/core/events/event_recorder.cpp
#include "blast/core/events/event_recorder.hpp"

#include <cmath>
#include <utility>

namespace blast {
namespace {

constexpr const char* kSource = "event_recorder";

double round2(double v) { return std::round(v * 100.0) / 100.0; }

EventKind kind_for_zone(ThresholdZone zone) {
  switch (zone) {
    case ThresholdZone::kWarning: return EventKind::kThresholdWarning;
    case ThresholdZone::kDanger: return EventKind::kThresholdDanger;
    case ThresholdZone::kCritical: return EventKind::kThresholdCritical;
    case ThresholdZone::kNormal: break;
  }
  return EventKind::kSensorNormal;
}

Level level_for_zone(ThresholdZone zone) {
  switch (zone) {
    case ThresholdZone::kWarning: return Level::kWarning;
    case ThresholdZone::kDanger: return Level::kError;
    case ThresholdZone::kCritical: return Level::kCritical;
    case ThresholdZone::kNormal: break;
  }
  return Level::kInfo;
}

}  // namespace

const char* to_string(EventKind kind) {
  switch (kind) {
    case EventKind::kSerialConnect: return "serial_connect";
    case EventKind::kSerialDisconnect: return "serial_disconnect";
    case EventKind::kSerialError: return "serial_error";
    case EventKind::kSerialReconnect: return "serial_reconnect";
    case EventKind::kThresholdWarning: return "threshold_warning";
    case EventKind::kThresholdDanger: return "threshold_danger";
    case EventKind::kThresholdCritical: return "threshold_critical";
    case EventKind::kSensorNormal: return "sensor_normal";
    case EventKind::kSensorFailure: return "sensor_failure";
    case EventKind::kValveOpen: return "valve_open";
    case EventKind::kValveClose: return "valve_close";
    case EventKind::kValveError: return "valve_error";
    case EventKind::kValveCommand: return "valve_command";
    case EventKind::kModeChange: return "mode_change";
    case EventKind::kConfigReload: return "config_reload";
    case EventKind::kFreezeDetected: return "freeze_detected";
    case EventKind::kFreezeRecovered: return "freeze_recovered";
    case EventKind::kStartup: return "startup";
    case EventKind::kShutdown: return "shutdown";
    case EventKind::kErrorRecovery: return "error_recovery";
    case EventKind::kErrorEscalation: return "error_escalation";
    case EventKind::kPerformanceAlert: return "performance_alert";
    case EventKind::kClientConnect: return "client_connect";
    case EventKind::kClientDisconnect: return "client_disconnect";
    case EventKind::kClientThrottled: return "client_throttled";
    case EventKind::kClientRecovered: return "client_recovered";
  }
  return "unknown";
}

const char* to_string(ThresholdZone zone) {
  switch (zone) {
    case ThresholdZone::kNormal: return "normal";
    case ThresholdZone::kWarning: return "warning";
    case ThresholdZone::kDanger: return "danger";
    case ThresholdZone::kCritical: return "critical";
  }
  return "normal";
}

std::string EventSummary::to_json() const {
  JsonObject by_type;
  for (const auto& [type, n] : counts) by_type.add(type, n);

  JsonObject o;
  o.add("session_id", session_id)
      .add("duration_s", duration_s)
      .add("event_counts", by_type)
      .add("total_events", total);
  return o.str();
}

EventRecorder::EventRecorder(LogRouter& router)
    : router_(router), started_(SteadyClock::now()) {
  session_id_ = router_.run().id;
  if (session_id_.empty()) session_id_ = "session_" + run_stamp(wall_now());
}

Status EventRecorder::record(EventKind kind, const JsonObject& details, Level severity) {
  std::uint64_t seq = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    seq = ++sequence_[static_cast<int>(kind)];
  }

  JsonObject ev;
  ev.add("event_type", to_string(kind))
      .add("severity", to_string(severity))
      .add("session_id", session_id_)
      .add("event_sequence", seq)
      .add("details", details);

  BLAST_RETURN_IF_ERROR(router_.enqueue(Category::kEvents, severity, kSource, ev));
  if (severity >= Level::kError) {
    BLAST_RETURN_IF_ERROR(router_.enqueue(Category::kErrors, severity, kSource, ev));
  }
  return Status{};
}

Result<bool> EventRecorder::record_threshold(const std::string& sensor_id,
                                             const std::string& sensor_name, double value,
                                             double threshold, ThresholdZone zone,
                                             const std::string& unit) {
  ThresholdZone previous = ThresholdZone::kNormal;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sensor_zones_.find(sensor_id);
    if (it != sensor_zones_.end()) previous = it->second;

    // Danger and above are never deduplicated.
    const bool escalated = zone >= ThresholdZone::kDanger;
    if (zone == previous && !escalated) return Result<bool>::ok(false);
  }

  JsonObject d;
  d.add("sensor_id", sensor_id)
      .add("sensor_name", sensor_name)
      .add("value", round2(value))
      .add("threshold", threshold)
      .add("threshold_type", to_string(zone))
      .add("unit", unit)
      .add("state_change", std::string(to_string(previous)) + " -> " + to_string(zone));

  const Level severity = level_for_zone(zone);
  const Status s = record(kind_for_zone(zone), d, severity);
  // The zone moves only once the crossing is queued; a rejected record is retried
  // by the next sample.
  if (!s.ok()) return Result<bool>::err(s);
  {
    std::lock_guard<std::mutex> lk(mu_);
    sensor_zones_[sensor_id] = zone;
  }

  if (zone == ThresholdZone::kCritical) {
    router_.system(Level::kCritical, kSource,
                   sensor_name + " at " + json_number(value) + unit +
                       " exceeds critical threshold " + json_number(threshold) + unit);
  }
  return Result<bool>::ok(true);
}

Result<ThresholdZone> EventRecorder::check_threshold(const SensorThresholdConfig& sensor,
                                                     double value) {
  ThresholdZone zone = ThresholdZone::kNormal;
  double limit = sensor.warning;
  if (value >= sensor.critical) {
    zone = ThresholdZone::kCritical;
    limit = sensor.critical;
  } else if (value >= sensor.danger) {
    zone = ThresholdZone::kDanger;
    limit = sensor.danger;
  } else if (value >= sensor.warning) {
    zone = ThresholdZone::kWarning;
  }

  const std::string& name = sensor.name.empty() ? sensor.id : sensor.name;
  Result<bool> r = record_threshold(sensor.id, name, value, limit, zone, sensor.unit);
  if (!r.ok()) return Result<ThresholdZone>::err(r.status());
  return Result<ThresholdZone>::ok(zone);
}

ThresholdZone EventRecorder::zone_of(const std::string& sensor_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = sensor_zones_.find(sensor_id);
  return it == sensor_zones_.end() ? ThresholdZone::kNormal : it->second;
}

Status EventRecorder::log_valve_operation(const std::string& valve_id,
                                          const std::string& valve_name, bool open,
                                          const std::string& command_source, bool success) {
  std::string previous = "unknown";
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = valve_open_.find(valve_id);
    if (it != valve_open_.end()) previous = it->second ? "open" : "closed";
    if (success) valve_open_[valve_id] = open;
  }

  EventKind kind = open ? EventKind::kValveOpen : EventKind::kValveClose;
  if (!success) kind = EventKind::kValveError;

  JsonObject d;
  d.add("valve_id", valve_id)
      .add("valve_name", valve_name)
      .add("new_state", open ? "open" : "closed")
      .add("previous_state", previous)
      .add("command_source", command_source)
      .add("success", success);

  return record(kind, d, success ? Level::kInfo : Level::kError);
}

Status EventRecorder::log_connection_event(ConnectionEvent event, const JsonObject& details) {
  switch (event) {
    case ConnectionEvent::kConnect: return record(EventKind::kSerialConnect, details);
    case ConnectionEvent::kDisconnect: return record(EventKind::kSerialDisconnect, details);
    case ConnectionEvent::kReconnect: return record(EventKind::kSerialReconnect, details);
    case ConnectionEvent::kError: break;
  }
  return record(EventKind::kSerialError, details, Level::kError);
}

Status EventRecorder::log_client_event(const std::string& client_id, ClientEvent event,
                                       const JsonObject& details) {
  JsonObject d;
  d.add("client_id", client_id);
  if (!details.empty()) d.add("context", details);

  switch (event) {
    case ClientEvent::kConnect: return record(EventKind::kClientConnect, d.add("event", "connect"));
    case ClientEvent::kDisconnect:
      return record(EventKind::kClientDisconnect, d.add("event", "disconnect"));
    case ClientEvent::kRecovered:
      return record(EventKind::kClientRecovered, d.add("event", "recovered"));
    case ClientEvent::kThrottled: break;
  }
  return record(EventKind::kClientThrottled, d.add("event", "throttled"), Level::kWarning);
}

Status EventRecorder::log_mode_change(const std::string& from_mode, const std::string& to_mode,
                                      const std::string& reason) {
  JsonObject d;
  d.add("from_mode", from_mode).add("to_mode", to_mode).add("reason", reason);
  return record(EventKind::kModeChange, d);
}

Status EventRecorder::log_startup(const JsonObject& details) {
  return record(EventKind::kStartup, details);
}

Status EventRecorder::log_shutdown(const std::string& reason) {
  const EventSummary s = summary();

  JsonObject by_type;
  for (const auto& [type, n] : s.counts) by_type.add(type, n);

  JsonObject d;
  d.add("reason", reason)
      .add("uptime_s", s.duration_s)
      .add("event_counts", by_type)
      .add("total_events", s.total);
  return record(EventKind::kShutdown, d);
}

EventSummary EventRecorder::summary() const {
  EventSummary s;
  s.session_id = session_id_;
  s.duration_s = seconds_since(started_, SteadyClock::now());

  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& [kind, n] : sequence_) {
    s.counts[to_string(static_cast<EventKind>(kind))] = n;
    s.total += n;
  }
  return s;
}

}  // namespace blast
