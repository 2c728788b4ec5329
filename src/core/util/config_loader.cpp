// src/core/util/config_loader.cpp
#include "blast/core/util/config_loader.hpp"

#include <cmath>
#include <filesystem>
#include <set>

#include <yaml-cpp/yaml.h>

#include "blast/core/recovery/strategies.hpp"

namespace blast {
namespace fs = std::filesystem;

static bool is_map(const YAML::Node& n) { return n && n.IsMap(); }

// Recursive merge: maps merge keys; scalars/sequences override.
static YAML::Node merge_yaml(const YAML::Node& base, const YAML::Node& override_) {
  if (!base) return override_;
  if (!override_) return base;

  if (base.IsMap() && override_.IsMap()) {
    YAML::Node out = YAML::Clone(base);
    for (auto it : override_) {
      const auto key = it.first.as<std::string>();
      const auto val = it.second;
      if (out[key]) out[key] = merge_yaml(out[key], val);
      else out[key] = val;
    }
    return out;
  }

  return override_;
}

template <typename T>
static void maybe_set(const YAML::Node& n, const char* key, T& out) {
  if (!n || !n[key]) return;
  out = n[key].as<T>();
}

static Result<YAML::Node> load_yaml_file(const fs::path& path) {
  try {
    if (!fs::exists(path)) {
      return Result<YAML::Node>::err(Status::not_found("config not found: " + path.string()));
    }
    return Result<YAML::Node>::ok(YAML::LoadFile(path.string()));
  } catch (const YAML::Exception& e) {
    return Result<YAML::Node>::err(Status::parse_error("YAML parse error in " + path.string() + ": " + e.what()));
  } catch (const std::exception& e) {
    return Result<YAML::Node>::err(Status::io_error("failed to load " + path.string() + ": " + e.what()));
  }
}

static Result<YAML::Node> load_with_includes(const fs::path& path, std::set<std::string>& chain) {
  const std::string key = fs::weakly_canonical(path).string();
  if (chain.count(key)) {
    return Result<YAML::Node>::err(Status::invalid_argument("include cycle at " + path.string()));
  }

  auto root_r = load_yaml_file(path);
  if (!root_r.ok()) return Result<YAML::Node>::err(root_r.status());
  YAML::Node root = root_r.take_value();

  YAML::Node merged;
  const fs::path dir = path.parent_path();

  if (root.IsMap() && root["includes"]) {
    const YAML::Node inc = root["includes"];
    if (!inc.IsSequence()) {
      return Result<YAML::Node>::err(Status::invalid_argument("includes must be a YAML sequence"));
    }

    chain.insert(key);
    for (std::size_t i = 0; i < inc.size(); ++i) {
      const auto rel = inc[i].as<std::string>();
      const fs::path child = fs::path(rel).is_absolute() ? fs::path(rel) : (dir / rel);
      auto child_r = load_with_includes(child, chain);
      if (!child_r.ok()) return Result<YAML::Node>::err(child_r.status());
      merged = merge_yaml(merged, child_r.take_value());
    }
    chain.erase(key);
    root.remove("includes");
  }

  merged = merge_yaml(merged, root);
  return Result<YAML::Node>::ok(merged);
}

static void read_policy(const YAML::Node& n, RetryPolicyConfig& p) {
  maybe_set(n, "max_attempts", p.max_attempts);
  maybe_set(n, "initial_delay_s", p.initial_delay_s);
  maybe_set(n, "max_delay_s", p.max_delay_s);
  maybe_set(n, "exponential_base", p.exponential_base);
  maybe_set(n, "jitter", p.jitter);
  maybe_set(n, "cooldown_s", p.cooldown_s);
}

static Status read_config(const YAML::Node& y, Config& cfg) {
  if (y && !y.IsMap()) return Status::invalid_argument("config root must be a YAML map");

  maybe_set(y, "node_id", cfg.node_id);

  // --- logging
  if (is_map(y["logging"])) {
    const auto l = y["logging"];
    maybe_set(l, "base_dir", cfg.logging.base_dir);
    maybe_set(l, "queue_capacity", cfg.logging.queue_capacity);
    maybe_set(l, "max_file_bytes", cfg.logging.max_file_bytes);
    maybe_set(l, "backup_count", cfg.logging.backup_count);
    maybe_set(l, "keep_runs", cfg.logging.keep_runs);
    maybe_set(l, "console_level", cfg.logging.console_level);
    maybe_set(l, "shutdown_timeout_s", cfg.logging.shutdown_timeout_s);
  }

  // --- performance
  if (is_map(y["performance"])) {
    const auto p = y["performance"];
    maybe_set(p, "sample_interval_s", cfg.performance.sample_interval_s);
    maybe_set(p, "log_interval_s", cfg.performance.log_interval_s);
    maybe_set(p, "slow_operation_ms", cfg.performance.slow_operation_ms);
    maybe_set(p, "memory_ceiling_mb", cfg.performance.memory_ceiling_mb);
    maybe_set(p, "cpu_warning_percent", cfg.performance.cpu_warning_percent);
    maybe_set(p, "cpu_critical_percent", cfg.performance.cpu_critical_percent);
    maybe_set(p, "thread_ceiling", cfg.performance.thread_ceiling);
    maybe_set(p, "sampler_enabled", cfg.performance.sampler_enabled);
  }

  // --- watchdog
  if (is_map(y["watchdog"])) {
    const auto w = y["watchdog"];
    maybe_set(w, "poll_interval_s", cfg.watchdog.poll_interval_s);
    maybe_set(w, "min_heartbeat_interval_s", cfg.watchdog.min_heartbeat_interval_s);
    maybe_set(w, "history_size", cfg.watchdog.history_size);
    maybe_set(w, "dump_operations", cfg.watchdog.dump_operations);
    maybe_set(w, "dump_diagnostics", cfg.watchdog.dump_diagnostics);

    // name -> timeout_s; replaces the default set when present.
    if (w["components"]) {
      const auto c = w["components"];
      if (!c.IsMap()) return Status::invalid_argument("watchdog.components must be a map of name: timeout_s");
      cfg.watchdog.components.clear();
      for (auto it : c) {
        cfg.watchdog.components.push_back({it.first.as<std::string>(), it.second.as<double>()});
      }
    }
  }

  // --- recovery
  if (is_map(y["recovery"])) {
    const auto r = y["recovery"];
    maybe_set(r, "failure_threshold", cfg.recovery.failure_threshold);

    if (r["policies"]) {
      const auto ps = r["policies"];
      if (!ps.IsMap()) return Status::invalid_argument("recovery.policies must be a map");
      for (auto it : ps) {
        const auto name = it.first.as<std::string>();
        if (!it.second.IsMap()) {
          return Status::invalid_argument("recovery.policies." + name + " must be a map");
        }
        // Unset fields keep the built-in policy for that category.
        read_policy(it.second, cfg.recovery.policies[name]);
      }
    }
  }

  // --- serial
  if (is_map(y["serial"])) {
    const auto s = y["serial"];
    maybe_set(s, "port", cfg.serial.port);
    maybe_set(s, "baudrate", cfg.serial.baudrate);
    maybe_set(s, "buffer_size", cfg.serial.buffer_size);
  }

  // --- sensors
  if (y["sensors"]) {
    const auto ss = y["sensors"];
    if (!ss.IsSequence()) return Status::invalid_argument("sensors must be a YAML sequence");
    cfg.sensors.clear();
    for (std::size_t i = 0; i < ss.size(); ++i) {
      const auto n = ss[i];
      if (!n.IsMap()) return Status::invalid_argument("sensors[" + std::to_string(i) + "] must be a map");
      SensorThresholdConfig sc;
      maybe_set(n, "id", sc.id);
      maybe_set(n, "name", sc.name);
      maybe_set(n, "unit", sc.unit);
      maybe_set(n, "warning", sc.warning);
      maybe_set(n, "danger", sc.danger);
      maybe_set(n, "critical", sc.critical);
      if (sc.name.empty()) sc.name = sc.id;
      cfg.sensors.push_back(sc);
    }
  }

  // --- input
  if (is_map(y["input"])) {
    const auto in = y["input"];
    maybe_set(in, "type", cfg.input.type);
    maybe_set(in, "tick_hz", cfg.input.tick_hz);
    maybe_set(in, "max_ticks", cfg.input.max_ticks);
    maybe_set(in, "max_run_s", cfg.input.max_run_s);

    if (is_map(in["synth"])) {
      const auto s = in["synth"];
      maybe_set(s, "seed", cfg.input.synth.seed);
      maybe_set(s, "num_pressure", cfg.input.synth.num_pressure);
      maybe_set(s, "num_thermocouple", cfg.input.synth.num_thermocouple);
      maybe_set(s, "num_load_cell", cfg.input.synth.num_load_cell);
      maybe_set(s, "fault_every_n", cfg.input.synth.fault_every_n);
      maybe_set(s, "pressure_peak", cfg.input.synth.pressure_peak);
      maybe_set(s, "ramp_s", cfg.input.synth.ramp_s);
    }
  }

  return Status::ok_status();
}

static Result<Config> build_config(const YAML::Node& y, const std::string& origin) {
  Config cfg;  // defaults
  try {
    const Status s = read_config(y, cfg);
    if (!s.ok()) return Result<Config>::err(s);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error("bad value in " + origin + ": " + e.what()));
  }

  // Final validation (fail early).
  const Status s = validate_config(cfg);
  if (!s.ok()) return Result<Config>::err(s);

  return Result<Config>::ok(cfg);
}

Status validate_config(const Config& cfg) {
  if (cfg.node_id.empty()) {
    return Status::invalid_argument("node_id must not be empty");
  }

  // logging
  if (cfg.logging.base_dir.empty()) {
    return Status::invalid_argument("logging.base_dir must not be empty");
  }
  if (cfg.logging.queue_capacity == 0) {
    return Status::invalid_argument("logging.queue_capacity must be > 0");
  }
  if (cfg.logging.max_file_bytes == 0) {
    return Status::invalid_argument("logging.max_file_bytes must be > 0");
  }
  if (cfg.logging.keep_runs == 0) {
    return Status::invalid_argument("logging.keep_runs must be > 0");
  }
  Level console = Level::kInfo;
  if (!parse_level(cfg.logging.console_level, &console)) {
    return Status::invalid_argument("logging.console_level unknown: " + cfg.logging.console_level);
  }
  if (cfg.logging.shutdown_timeout_s <= 0.0) {
    return Status::invalid_argument("logging.shutdown_timeout_s must be > 0");
  }

  // performance
  if (cfg.performance.sample_interval_s <= 0.0) {
    return Status::invalid_argument("performance.sample_interval_s must be > 0");
  }
  if (cfg.performance.log_interval_s <= 0.0) {
    return Status::invalid_argument("performance.log_interval_s must be > 0");
  }
  if (cfg.performance.slow_operation_ms <= 0.0) {
    return Status::invalid_argument("performance.slow_operation_ms must be > 0");
  }
  if (cfg.performance.memory_ceiling_mb <= 0.0) {
    return Status::invalid_argument("performance.memory_ceiling_mb must be > 0");
  }
  if (cfg.performance.cpu_warning_percent <= 0.0 ||
      cfg.performance.cpu_critical_percent < cfg.performance.cpu_warning_percent) {
    return Status::invalid_argument("performance cpu thresholds must satisfy 0 < warning <= critical");
  }
  if (cfg.performance.thread_ceiling <= 0) {
    return Status::invalid_argument("performance.thread_ceiling must be > 0");
  }

  // watchdog
  const auto& w = cfg.watchdog;
  if (w.poll_interval_s <= 0.0) {
    return Status::invalid_argument("watchdog.poll_interval_s must be > 0");
  }
  if (w.min_heartbeat_interval_s <= 0.0) {
    return Status::invalid_argument("watchdog.min_heartbeat_interval_s must be > 0");
  }
  if (w.history_size == 0) {
    return Status::invalid_argument("watchdog.history_size must be > 0");
  }
  std::set<std::string> seen;
  for (const auto& c : w.components) {
    if (c.name.empty()) return Status::invalid_argument("watchdog component name must not be empty");
    if (!seen.insert(c.name).second) {
      return Status::invalid_argument("watchdog component listed twice: " + c.name);
    }
    if (c.timeout_s <= w.min_heartbeat_interval_s) {
      return Status::invalid_argument("watchdog." + c.name +
                                      " timeout must be greater than min_heartbeat_interval_s");
    }
  }

  // recovery
  if (cfg.recovery.failure_threshold < 1) {
    return Status::invalid_argument("recovery.failure_threshold must be >= 1");
  }
  for (const auto& [name, p] : cfg.recovery.policies) {
    ErrorCategory cat = ErrorCategory::kGeneric;
    if (!parse_error_category(name, &cat)) {
      return Status::invalid_argument("recovery.policies: unknown category: " + name);
    }
    if (p.max_attempts < 1) {
      return Status::invalid_argument("recovery.policies." + name + ".max_attempts must be >= 1");
    }
    if (p.initial_delay_s < 0.0 || p.max_delay_s < p.initial_delay_s) {
      return Status::invalid_argument("recovery.policies." + name +
                                      " delays must satisfy 0 <= initial_delay_s <= max_delay_s");
    }
    if (p.exponential_base < 1.0) {
      return Status::invalid_argument("recovery.policies." + name + ".exponential_base must be >= 1");
    }
    if (p.cooldown_s < 0.0) {
      return Status::invalid_argument("recovery.policies." + name + ".cooldown_s must be >= 0");
    }
  }

  // serial
  if (cfg.serial.port.empty()) {
    return Status::invalid_argument("serial.port must not be empty");
  }
  if (cfg.serial.baudrate <= 0) {
    return Status::invalid_argument("serial.baudrate must be > 0");
  }
  if (cfg.serial.buffer_size == 0) {
    return Status::invalid_argument("serial.buffer_size must be > 0");
  }

  // sensors
  seen.clear();
  for (const auto& s : cfg.sensors) {
    if (s.id.empty()) return Status::invalid_argument("sensor id must not be empty");
    if (!seen.insert(s.id).second) return Status::invalid_argument("sensor listed twice: " + s.id);
    if (std::isnan(s.warning) || std::isnan(s.danger) || std::isnan(s.critical)) {
      return Status::invalid_argument("sensor " + s.id + " thresholds must be numbers");
    }
    if (s.danger < s.warning) {
      return Status::invalid_argument("sensor " + s.id + ": danger threshold below warning threshold");
    }
    if (s.critical < s.danger) {
      return Status::invalid_argument("sensor " + s.id + ": critical threshold below danger threshold");
    }
  }

  // input
  if (cfg.input.type != "synth") {
    return Status::invalid_argument("input.type must be 'synth'");
  }
  if (cfg.input.tick_hz <= 0.0) {
    return Status::invalid_argument("input.tick_hz must be > 0");
  }
  if (cfg.input.max_ticks < 0) {
    return Status::invalid_argument("input.max_ticks must be >= 0");
  }
  if (cfg.input.max_run_s < 0.0) {
    return Status::invalid_argument("input.max_run_s must be >= 0");
  }
  const auto& sy = cfg.input.synth;
  if (sy.num_pressure < 0 || sy.num_thermocouple < 0 || sy.num_load_cell < 0) {
    return Status::invalid_argument("input.synth sensor counts must be >= 0");
  }
  if (sy.fault_every_n < 0) {
    return Status::invalid_argument("input.synth.fault_every_n must be >= 0");
  }
  if (sy.ramp_s <= 0.0) {
    return Status::invalid_argument("input.synth.ramp_s must be > 0");
  }
  return Status::ok_status();
}

Result<Config> load_config(const std::string& path_str) {
  const fs::path path = fs::path(path_str);

  std::set<std::string> chain;
  auto yaml_r = load_with_includes(path, chain);
  if (!yaml_r.ok()) return Result<Config>::err(yaml_r.status());
  return build_config(yaml_r.take_value(), path.string());
}

Result<Config> parse_config(const std::string& yaml_text) {
  YAML::Node y;
  try {
    y = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    return Result<Config>::err(Status::parse_error(std::string("YAML parse error: ") + e.what()));
  }
  if (y.IsMap() && y["includes"]) {
    return Result<Config>::err(Status::invalid_argument("includes are only supported by load_config"));
  }
  return build_config(y, "<string>");
}

}  // namespace blast
