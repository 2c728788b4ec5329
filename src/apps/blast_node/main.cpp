// File: src/apps/blast_node/main.cpp
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>

#include "blast/adapters/synth/synth_telemetry_source.hpp"
#include "blast/core/io/telemetry_source.hpp"
#include "blast/core/services.hpp"
#include "blast/core/util/config_loader.hpp"
#include "blast/core/util/repro_hash.hpp"

namespace {

constexpr const char* kSource = "blast_node";

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) { g_stop = 1; }

struct Args {
  std::string config_path;
  bool help{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    a.help = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "blast_node\n"
            << "  --config <path>\n";
}

std::unique_ptr<blast::ITelemetrySource> make_source_from_config(const blast::Config& cfg) {
  if (cfg.input.type == "synth") {
    blast::SynthSourceConfig sc;
    sc.tick_hz = cfg.input.tick_hz;
    sc.seed = cfg.input.synth.seed;
    sc.num_pressure = cfg.input.synth.num_pressure;
    sc.num_thermocouple = cfg.input.synth.num_thermocouple;
    sc.num_load_cell = cfg.input.synth.num_load_cell;
    sc.pressure_peak = cfg.input.synth.pressure_peak;
    sc.ramp_s = cfg.input.synth.ramp_s;
    sc.fault_every_n = cfg.input.synth.fault_every_n;
    return std::make_unique<blast::SynthTelemetrySource>(sc);
  }
  return nullptr;
}

blast::Bytes to_bytes(const std::string& s) { return blast::Bytes(s.begin(), s.end()); }

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = blast::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  const blast::Config cfg = cfg_r.take_value();

  std::unique_ptr<blast::ITelemetrySource> source = make_source_from_config(cfg);
  if (!source) {
    std::cerr << "Unknown input.type: " << cfg.input.type << "\n";
    return 2;
  }

  std::atomic<int> escalations{0};
  auto services_r = blast::ResilienceServices::create(
      cfg, blast::compute_config_hash(cfg),
      [&escalations](blast::ErrorCategory, const std::string&) { escalations.fetch_add(1); });
  if (!services_r.ok()) {
    std::cerr << services_r.status().message() << "\n";
    return 2;
  }
  std::unique_ptr<blast::ResilienceServices> services = services_r.take_value();

  auto& router = services->router();
  auto& events = services->events();
  auto& perf = services->performance();
  auto& freeze = services->freeze();
  auto& recovery = services->recovery();
  auto& comm = services->comm();

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  services->start();

  std::map<std::string, const blast::SensorThresholdConfig*> sensors;
  for (const auto& s : cfg.sensors) sensors[s.id] = &s;

  (void)comm.log_connection_attempt(cfg.serial.port, cfg.serial.baudrate);
  (void)comm.log_connection_success(cfg.serial.port, cfg.serial.baudrate);
  {
    blast::JsonObject d;
    d.add("port", cfg.serial.port).add("baudrate", cfg.serial.baudrate).add("source", source->name());
    (void)events.log_connection_event(blast::ConnectionEvent::kConnect, d);
  }

  std::cout << "Run: " << router.run().dir << "\n";
  std::cout << "Input: " << cfg.input.type << "  tick_hz=" << cfg.input.tick_hz
            << "  sensors=" << cfg.sensors.size() << "\n\n";

  blast::RecoveryContext ctx;
  ctx.port = cfg.serial.port;
  ctx.reset_parser = [&source]() { return source->reset(); };

  using clock = std::chrono::steady_clock;

  const auto tick_period = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(1.0 / cfg.input.tick_hz));

  const auto t_start = clock::now();
  auto next_tick = t_start + tick_period;

  std::int64_t tick_count = 0;
  std::int64_t failed_reads = 0;
  std::string stop_reason = "normal";

  while (true) {
    const auto now = clock::now();

    if (g_stop) {
      stop_reason = "signal";
      break;
    }
    if (cfg.input.max_ticks > 0 && tick_count >= cfg.input.max_ticks) {
      stop_reason = "max_ticks reached";
      break;
    }
    if (cfg.input.max_run_s > 0.0 &&
        now - t_start >= blast::seconds_to_duration(cfg.input.max_run_s)) {
      stop_reason = "max_runtime reached";
      break;
    }

    (void)freeze.heartbeat("data_acquisition");
    (void)freeze.heartbeat("serial_communication");
    (void)freeze.heartbeat("system_health");

    blast::Result<blast::TelemetryFrame> frame_r =
        blast::Result<blast::TelemetryFrame>::err(blast::Status::internal("not read"));
    {
      auto timer = perf.measure("read_frame");
      frame_r = recovery.retry_with_backoff<blast::TelemetryFrame>(
          [&]() -> blast::Result<blast::TelemetryFrame> {
            (void)comm.log_sent(to_bytes("READ\n"), "READ");
            blast::TelemetryFrame f;
            const blast::Status s = source->next(&f);
            if (!s.ok()) return blast::Result<blast::TelemetryFrame>::err(s);
            return blast::Result<blast::TelemetryFrame>::ok(std::move(f));
          },
          blast::ErrorCategory::kSerialTimeout, ctx);
    }

    if (frame_r.ok()) {
      const blast::TelemetryFrame& frame = *frame_r;

      (void)comm.log_received(frame.raw, "seq=" + std::to_string(frame.sequence) +
                                             " readings=" + std::to_string(frame.readings.size()));

      blast::JsonObject values;
      for (const auto& r : frame.readings) values.add(r.id, r.value);
      blast::JsonObject rec;
      rec.add("sequence", frame.sequence)
          .add("t_ms", frame.t_ns.ns / 1000000)
          .add("readings", values);
      (void)router.enqueue(blast::Category::kData, blast::Level::kInfo, kSource, rec);

      for (const auto& r : frame.readings) {
        const auto it = sensors.find(r.id);
        if (it == sensors.end()) continue;
        (void)events.check_threshold(*it->second, r.value);
      }

      perf.record_metric("frame_bytes", static_cast<double>(frame.raw.size()), "bytes");

      blast::JsonObject op;
      op.add("sequence", frame.sequence);
      freeze.log_operation("read_frame", op);
    } else if (frame_r.status().code() == blast::Status::Code::kOutOfRange) {
      stop_reason = "input eof";
      break;
    } else {
      ++failed_reads;
      (void)comm.log_timeout(1.0 / cfg.input.tick_hz, frame_r.status().message());
    }

    ++tick_count;

    const auto after = clock::now();
    if (after < next_tick) {
      std::this_thread::sleep_until(next_tick);
      next_tick += tick_period;
    } else {
      next_tick = after + tick_period;
    }
  }

  router.system(blast::Level::kInfo, kSource,
                "stopping: " + stop_reason + " ticks=" + std::to_string(tick_count) +
                    " failed_reads=" + std::to_string(failed_reads));

  (void)comm.log_disconnection(cfg.serial.port, stop_reason);
  (void)comm.dump("serial_dump_final.json");

  const std::string health = services->health_json();
  services->stop(stop_reason);

  std::cout << health << "\n";
  if (escalations.load() > 0) {
    std::cout << "DEGRADED (" << escalations.load() << " escalations)\n";
    return 3;
  }
  std::cout << "OK\n";
  return 0;
}
