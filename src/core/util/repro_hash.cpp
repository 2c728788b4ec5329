// File: src/core/util/repro_hash.cpp
#include "blast/core/util/repro_hash.hpp"

#include <bit>
#include <cstdint>
#include <string>

namespace blast {
namespace {

// FNV-1a 64-bit. Not cryptographic; stable across runs of the same build.
struct Fnv1a64 {
  std::uint64_t h = 1469598103934665603ull;

  void add_bytes(const void* data, std::size_t n) {
    const auto* p = static_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < n; ++i) {
      h ^= static_cast<std::uint64_t>(p[i]);
      h *= 1099511628211ull;
    }
  }

  void add_u64(std::uint64_t v) { add_bytes(&v, sizeof(v)); }
  void add_i64(std::int64_t v)  { add_bytes(&v, sizeof(v)); }
  void add_u32(std::uint32_t v) { add_bytes(&v, sizeof(v)); }
  void add_i32(std::int32_t v)  { add_bytes(&v, sizeof(v)); }

  void add_bool(bool v) {
    const std::uint8_t b = v ? 1u : 0u;
    add_bytes(&b, sizeof(b));
  }

  void add_string(const std::string& s) {
    // Include length so ("ab","c") != ("a","bc") in concatenations.
    add_u64(static_cast<std::uint64_t>(s.size()));
    add_bytes(s.data(), s.size());
  }

  void add_double(double v) {
    const std::uint64_t bits = std::bit_cast<std::uint64_t>(v);
    add_u64(bits);
  }
};

std::string to_hex(std::uint64_t v) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xF];
    v >>= 4;
  }
  return out;
}

void add_policy(Fnv1a64& h, const std::string& name, const RetryPolicyConfig& p) {
  h.add_string(name);
  h.add_i32(p.max_attempts);
  h.add_double(p.initial_delay_s);
  h.add_double(p.max_delay_s);
  h.add_double(p.exponential_base);
  h.add_bool(p.jitter);
  h.add_double(p.cooldown_s);
}

}  // namespace

std::string compute_config_hash(const Config& cfg) {
  Fnv1a64 h;

  h.add_string(cfg.node_id);

  // Logging.
  h.add_string(cfg.logging.base_dir);
  h.add_u64(cfg.logging.queue_capacity);
  h.add_u64(cfg.logging.max_file_bytes);
  h.add_u64(cfg.logging.backup_count);
  h.add_u64(cfg.logging.keep_runs);
  h.add_string(cfg.logging.console_level);
  h.add_double(cfg.logging.shutdown_timeout_s);

  // Performance.
  h.add_double(cfg.performance.sample_interval_s);
  h.add_double(cfg.performance.log_interval_s);
  h.add_double(cfg.performance.slow_operation_ms);
  h.add_double(cfg.performance.memory_ceiling_mb);
  h.add_double(cfg.performance.cpu_warning_percent);
  h.add_double(cfg.performance.cpu_critical_percent);
  h.add_i32(cfg.performance.thread_ceiling);
  h.add_bool(cfg.performance.sampler_enabled);

  // Watchdog. Component order is part of the fingerprint.
  h.add_double(cfg.watchdog.poll_interval_s);
  h.add_double(cfg.watchdog.min_heartbeat_interval_s);
  h.add_u64(cfg.watchdog.history_size);
  h.add_u64(cfg.watchdog.dump_operations);
  h.add_bool(cfg.watchdog.dump_diagnostics);
  h.add_u64(cfg.watchdog.components.size());
  for (const auto& c : cfg.watchdog.components) {
    h.add_string(c.name);
    h.add_double(c.timeout_s);
  }

  // Recovery (std::map iterates in key order).
  h.add_i32(cfg.recovery.failure_threshold);
  h.add_u64(cfg.recovery.policies.size());
  for (const auto& [name, p] : cfg.recovery.policies) add_policy(h, name, p);

  // Serial.
  h.add_string(cfg.serial.port);
  h.add_i32(cfg.serial.baudrate);
  h.add_u64(cfg.serial.buffer_size);

  // Sensors.
  h.add_u64(cfg.sensors.size());
  for (const auto& s : cfg.sensors) {
    h.add_string(s.id);
    h.add_string(s.name);
    h.add_string(s.unit);
    h.add_double(s.warning);
    h.add_double(s.danger);
    h.add_double(s.critical);
  }

  // Input.
  h.add_string(cfg.input.type);
  h.add_double(cfg.input.tick_hz);
  h.add_i64(cfg.input.max_ticks);
  h.add_double(cfg.input.max_run_s);

  h.add_u32(cfg.input.synth.seed);
  h.add_i32(cfg.input.synth.num_pressure);
  h.add_i32(cfg.input.synth.num_thermocouple);
  h.add_i32(cfg.input.synth.num_load_cell);
  h.add_i32(cfg.input.synth.fault_every_n);
  h.add_double(cfg.input.synth.pressure_peak);
  h.add_double(cfg.input.synth.ramp_s);

  return to_hex(h.h);
}

}  // namespace blast
