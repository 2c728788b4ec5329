// include/blast/core/config.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <string>
#include <vector>

#include "blast/core/status.hpp"
#include "blast/core/types.hpp"

namespace blast {

// Units policy:
// - Durations in config are seconds (double); internal timing uses steady_clock
// - Sizes in bytes unless the field name says otherwise
// - Sensor values in the sensor's own unit (PSI, degC, lbs)

// -----------------------------
// Logging / run directory
// -----------------------------
struct LoggingConfig {
  // Runs are created as <base_dir>/run_<stamp>/ with a "latest" pointer beside them.
  std::string base_dir = "logs";

  // Bounded hand-off between producers and the writer thread.
  std::size_t queue_capacity = 10000;

  // Size-based rotation per category file.
  std::size_t max_file_bytes = 100u * 1024u * 1024u;
  std::size_t backup_count = 7;

  // Older run directories beyond this are removed after a new run is created.
  std::size_t keep_runs = 50;

  // Operator console threshold: debug | info | warning | error | critical.
  std::string console_level = "info";

  double shutdown_timeout_s = 2.0;
};

// -----------------------------
// Performance monitor
// -----------------------------
struct PerformanceConfig {
  double sample_interval_s = 1.0;
  double log_interval_s = 60.0;

  double slow_operation_ms = 500.0;
  double memory_ceiling_mb = 500.0;

  double cpu_warning_percent = 80.0;
  double cpu_critical_percent = 95.0;
  int thread_ceiling = 50;

  // Background resource sampler. Off means metrics only arrive via record_metric.
  bool sampler_enabled = true;
};

// -----------------------------
// Freeze / watchdog detector
// -----------------------------
struct WatchdogComponentConfig {
  std::string name;
  double timeout_s = 10.0;
};

struct WatchdogConfig {
  double poll_interval_s = 0.5;

  // Every watchdog timeout must be strictly greater than this.
  double min_heartbeat_interval_s = 1.0;

  std::size_t history_size = 100;    // operation ring for freeze dumps
  std::size_t dump_operations = 50;  // how many of those go into a dump
  bool dump_diagnostics = true;

  std::vector<WatchdogComponentConfig> components = {
      {"data_acquisition", 10.0},
      {"api_requests", 30.0},
      {"serial_communication", 15.0},
      {"system_health", 60.0},
  };
};

// -----------------------------
// Error recovery
// -----------------------------
struct RetryPolicyConfig {
  int max_attempts = 3;
  double initial_delay_s = 0.5;
  double max_delay_s = 10.0;
  double exponential_base = 2.0;
  bool jitter = true;

  // How long a circuit stays open once the failure threshold is reached.
  double cooldown_s = 60.0;
};

inline RetryPolicyConfig retry_policy(int max_attempts, double initial_delay_s) {
  RetryPolicyConfig p;
  p.max_attempts = max_attempts;
  p.initial_delay_s = initial_delay_s;
  return p;
}

struct RecoveryConfig {
  // Consecutive failed recoveries that open a category's circuit.
  int failure_threshold = 10;

  // Keyed by category name (see to_string(ErrorCategory)).
  std::map<std::string, RetryPolicyConfig> policies = {
      {"serial_timeout", retry_policy(5, 0.5)},
      {"serial_disconnect", retry_policy(3, 1.0)},
      {"parse_failure", retry_policy(3, 0.1)},
      {"file_write", retry_policy(3, 0.1)},
      {"network", retry_policy(5, 0.5)},
      {"resource_exhaustion", retry_policy(2, 2.0)},
      {"generic", retry_policy(3, 0.5)},
  };
};

// -----------------------------
// Serial link / communication logger
// -----------------------------
struct SerialConfig {
  std::string port = "/dev/ttyUSB0";
  int baudrate = 115200;

  // Circular buffer length per direction.
  std::size_t buffer_size = 1000;
};

// -----------------------------
// Sensor thresholds
// -----------------------------
struct SensorThresholdConfig {
  std::string id;    // pt1, tc2, lc1 ...
  std::string name;  // human readable
  std::string unit;

  // value >= limit enters the zone. Unset limits are +inf.
  double warning = std::numeric_limits<double>::infinity();
  double danger = std::numeric_limits<double>::infinity();
  double critical = std::numeric_limits<double>::infinity();
};

// -----------------------------
// Input (host application)
// -----------------------------
struct InputSynthConfig {
  std::uint32_t seed = 1;
  int num_pressure = 4;
  int num_thermocouple = 3;
  int num_load_cell = 2;

  // Every Nth read fails once with a timeout (0 disables).
  int fault_every_n = 0;

  // Pressure ramps towards this peak over ramp_s seconds, then holds.
  double pressure_peak = 800.0;
  double ramp_s = 30.0;
};

struct InputConfig {
  std::string type = "synth";  // synth only for now
  double tick_hz = 10.0;
  std::int64_t max_ticks = 0;  // 0 disables
  double max_run_s = 0.0;      // 0 disables

  InputSynthConfig synth;
};

// -----------------------------
// Root config
// -----------------------------
struct Config {
  NodeId node_id = "blast_stand";

  LoggingConfig logging;
  PerformanceConfig performance;
  WatchdogConfig watchdog;
  RecoveryConfig recovery;
  SerialConfig serial;
  std::vector<SensorThresholdConfig> sensors;
  InputConfig input;
};

// Strict validation; fail early. Defined in config_loader.cpp.
Status validate_config(const Config& cfg);

}  // namespace blast
