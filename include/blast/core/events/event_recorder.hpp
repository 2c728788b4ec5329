// include/blast/core/events/event_recorder.hpp
#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include "blast/core/config.hpp"
#include "blast/core/logging/log_router.hpp"
#include "blast/core/status.hpp"
#include "blast/core/types.hpp"
#include "blast/core/util/json.hpp"
#include "blast/core/util/time.hpp"

namespace blast {

enum class EventKind : int {
  // Connection
  kSerialConnect = 0,
  kSerialDisconnect,
  kSerialError,
  kSerialReconnect,

  // Sensors
  kThresholdWarning,
  kThresholdDanger,
  kThresholdCritical,
  kSensorNormal,
  kSensorFailure,

  // Valves
  kValveOpen,
  kValveClose,
  kValveError,
  kValveCommand,

  // System
  kModeChange,
  kConfigReload,
  kFreezeDetected,
  kFreezeRecovered,
  kStartup,
  kShutdown,
  kErrorRecovery,
  kErrorEscalation,
  kPerformanceAlert,

  // Clients of the supervisory layer
  kClientConnect,
  kClientDisconnect,
  kClientThrottled,
  kClientRecovered,
};

const char* to_string(EventKind kind);

enum class ThresholdZone : int { kNormal = 0, kWarning, kDanger, kCritical };

const char* to_string(ThresholdZone zone);

enum class ConnectionEvent : int { kConnect = 0, kDisconnect, kError, kReconnect };
enum class ClientEvent : int { kConnect = 0, kDisconnect, kThrottled, kRecovered };

struct EventSummary {
  std::string session_id;
  double duration_s = 0.0;
  std::map<std::string, std::uint64_t> counts;  // by event_type
  std::uint64_t total = 0;

  std::string to_json() const;
};

// Typed domain events with per-kind sequence numbers.
//
// Events go to the events stream; ERROR and CRITICAL events are also copied to errors.
// Threshold events are deduplicated by zone, except danger/critical which always emit.
class EventRecorder {
 public:
  explicit EventRecorder(LogRouter& router);

  EventRecorder(const EventRecorder&) = delete;
  EventRecorder& operator=(const EventRecorder&) = delete;

  Status record(EventKind kind, const JsonObject& details, Level severity = Level::kInfo);

  // Returns true when a record was emitted for this sample.
  Result<bool> record_threshold(const std::string& sensor_id, const std::string& sensor_name,
                                double value, double threshold, ThresholdZone zone,
                                const std::string& unit);

  // Derives the zone from the sensor's limits and records it.
  Result<ThresholdZone> check_threshold(const SensorThresholdConfig& sensor, double value);

  [[nodiscard]] ThresholdZone zone_of(const std::string& sensor_id) const;

  Status log_valve_operation(const std::string& valve_id, const std::string& valve_name,
                             bool open, const std::string& command_source = "system",
                             bool success = true);
  Status log_connection_event(ConnectionEvent event, const JsonObject& details);
  Status log_client_event(const std::string& client_id, ClientEvent event,
                          const JsonObject& details = JsonObject{});
  Status log_mode_change(const std::string& from_mode, const std::string& to_mode,
                         const std::string& reason = "");

  Status log_startup(const JsonObject& details = JsonObject{});
  Status log_shutdown(const std::string& reason = "normal");

  [[nodiscard]] EventSummary summary() const;
  [[nodiscard]] const std::string& session_id() const noexcept { return session_id_; }

 private:
  LogRouter& router_;
  std::string session_id_;
  SteadyClock::time_point started_;

  mutable std::mutex mu_;
  std::unordered_map<int, std::uint64_t> sequence_;  // by EventKind
  std::unordered_map<std::string, ThresholdZone> sensor_zones_;
  std::unordered_map<std::string, bool> valve_open_;
};

}  // namespace blast
