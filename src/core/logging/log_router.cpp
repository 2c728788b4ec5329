// src/core/logging/log_router.cpp
#include "blast/core/logging/log_router.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "blast/core/util/time.hpp"

namespace blast {
namespace {

namespace fs = std::filesystem;

constexpr auto kIdleFlush = std::chrono::milliseconds(200);
constexpr int kMaxRunSuffix = 1000;

struct StreamLayout {
  const char* subdir;
  const char* file;
};

// Indexed by Category (stream categories only).
constexpr std::array<StreamLayout, kStreamCategoryCount> kLayout = {{
    {"events", "events.jsonl"},
    {"errors", "errors.jsonl"},
    {"performance", "performance.jsonl"},
    {"serial", "serial.jsonl"},
    {"system", "system.log"},
    {"data", "data.jsonl"},
}};

std::size_t index_of(Category c) { return static_cast<std::size_t>(c); }

spdlog::level::level_enum to_spdlog(Level level) {
  switch (level) {
    case Level::kDebug: return spdlog::level::debug;
    case Level::kInfo: return spdlog::level::info;
    case Level::kWarning: return spdlog::level::warn;
    case Level::kError: return spdlog::level::err;
    case Level::kCritical: return spdlog::level::critical;
  }
  return spdlog::level::info;
}

bool is_run_dir_name(const std::string& name) { return name.rfind("run_", 0) == 0; }

// {"ts":...,"t_wall_ns":...,"level":...,"source":... + producer fields
std::string json_line(const LogRecord& rec) {
  JsonObject head;
  head.add("ts", iso8601_utc(rec.t_wall))
      .add("t_wall_ns", rec.t_wall.ns)
      .add("level", to_string(rec.level))
      .add("source", rec.source);

  std::string line = head.str();
  const std::string& p = rec.payload;
  if (p.size() > 2 && p.front() == '{' && p.back() == '}') {
    line.pop_back();
    line += ",";
    line.append(p, 1, std::string::npos);
  } else if (!p.empty() && p != "{}") {
    // Not an object: keep it, but as a string field.
    line.pop_back();
    line += ",\"message\":\"" + json_escape(p) + "\"}";
  }
  return line;
}

std::string text_line(const LogRecord& rec) {
  return local_time_text(rec.t_wall) + " [" + to_string(rec.level) + "] " + rec.source + ": " +
         rec.payload;
}

}  // namespace

LogRouter::LogRouter(LoggingConfig cfg) : cfg_(std::move(cfg)), queue_(cfg_.queue_capacity) {
  if (!parse_level(cfg_.console_level, &console_level_)) console_level_ = Level::kInfo;

  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_ = std::make_shared<spdlog::logger>("blast", std::move(sink));
  console_->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  console_->set_level(to_spdlog(console_level_));
}

LogRouter::~LogRouter() {
  shutdown();
  // A writer that outlived the bounded join still uses the streams and the queue.
  consumer_.join();
}

Status LogRouter::create_run(const NodeId& node_id, const std::string& config_hash) {
  {
    std::lock_guard<std::mutex> lk(run_mu_);
    if (run_) return Status::invalid_argument("run already created: " + run_->id);
  }

  std::error_code ec;
  fs::create_directories(cfg_.base_dir, ec);
  if (ec) {
    return Status::io_error("failed creating log dir '" + cfg_.base_dir + "': " + ec.message());
  }

  RunInfo run;
  run.wall_start = wall_now();
  run.config_hash = config_hash;

  // Same-millisecond restarts get a -N suffix. create_directory() is the claim:
  // another process may take a name between our attempts.
  const std::string base_id = "run_" + run_stamp(run.wall_start);
  std::string id = base_id;
  fs::path dir = fs::path(cfg_.base_dir) / id;
  for (int n = 1; !fs::create_directory(dir, ec); ++n) {
    if (ec) {
      return Status::io_error("failed creating run dir '" + dir.string() + "': " + ec.message());
    }
    if (n > kMaxRunSuffix) {
      return Status::io_error("failed creating run dir under '" + cfg_.base_dir +
                              "': too many runs named " + base_id);
    }
    id = base_id + "-" + std::to_string(n);
    dir = fs::path(cfg_.base_dir) / id;
  }
  run.id = id;
  run.dir = dir.string();

  {
    std::lock_guard<std::mutex> lk(run_mu_);
    run_ = run;
  }

  const Status opened = open_streams_();
  if (!opened.ok()) {
    std::lock_guard<std::mutex> lk(run_mu_);
    run_.reset();
    return opened;
  }

  const Status latest = point_latest_();
  if (!latest.ok()) {
    console_->warn("log_router: {}", latest.message());
  }

  prune_runs_();

  const std::string header = "run " + run.id + " started node_id=" + node_id +
                             " config_hash=" + config_hash + " dir=" + run.dir;
  system(Level::kInfo, "log_router", header);

  JsonObject started;
  started.add("event_type", "run_started")
      .add("run_id", run.id)
      .add("node_id", node_id)
      .add("config_hash", config_hash)
      .add("run_dir", run.dir);
  return enqueue(Category::kEvents, Level::kInfo, "log_router", started);
}

Status LogRouter::open_streams_() {
  const fs::path dir(run_->dir);

  for (std::size_t i = 0; i < kLayout.size(); ++i) {
    std::error_code ec;
    const fs::path sub = dir / kLayout[i].subdir;
    fs::create_directories(sub, ec);
    if (ec) return Status::io_error("failed creating '" + sub.string() + "': " + ec.message());

    const std::string path = (sub / kLayout[i].file).string();

    std::shared_ptr<spdlog::logger> stream;
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_st>(
          path, cfg_.max_file_bytes, cfg_.backup_count);
      stream = std::make_shared<spdlog::logger>(kLayout[i].subdir, std::move(sink));
    } catch (const spdlog::spdlog_ex& e) {
      return Status::io_error("failed opening '" + path + "': " + e.what());
    }

    stream->set_pattern("%v");
    stream->set_level(spdlog::level::trace);
    stream->flush_on(spdlog::level::off);
    stream->set_error_handler([this](const std::string& msg) {
      write_errors_.fetch_add(1, std::memory_order_relaxed);
      console_->error("log_router: write failed: {}", msg);
    });

    paths_[i] = path;
    streams_[i] = std::move(stream);
  }
  return Status{};
}

Status LogRouter::point_latest_() {
  const fs::path base(cfg_.base_dir);
  const fs::path link = base / "latest";
  const fs::path pointer = base / "latest.txt";

  std::error_code ec;
  fs::remove(link, ec);
  ec.clear();

  fs::create_directory_symlink(fs::path(run_->id), link, ec);
  if (!ec) {
    fs::remove(pointer, ec);
    return Status{};
  }

  // No symlink support: a pointer file holding the run path.
  std::ofstream f(pointer, std::ios::out | std::ios::trunc);
  if (!f.is_open()) return Status::io_error("failed writing '" + pointer.string() + "'");
  f << run_->dir << "\n";
  if (!f.good()) return Status::io_error("failed writing '" + pointer.string() + "'");
  return Status{};
}

void LogRouter::prune_runs_() {
  std::error_code ec;
  std::vector<fs::path> runs;
  for (const auto& it : fs::directory_iterator(cfg_.base_dir, ec)) {
    if (ec) return;
    if (it.is_symlink(ec) || !it.is_directory(ec)) continue;
    const std::string name = it.path().filename().string();
    if (!is_run_dir_name(name) || name == run_->id) continue;
    runs.push_back(it.path());
  }

  // The current run always counts as one kept run.
  const std::size_t keep_others = cfg_.keep_runs > 0 ? cfg_.keep_runs - 1 : 0;
  if (runs.size() <= keep_others) return;

  // Newest first, delete the tail. Stamps sort lexicographically.
  std::sort(runs.begin(), runs.end(), [](const fs::path& a, const fs::path& b) {
    return a.filename().string() > b.filename().string();
  });

  for (std::size_t i = keep_others; i < runs.size(); ++i) {
    fs::remove_all(runs[i], ec);
    if (ec) {
      console_->warn("log_router: failed pruning '{}': {}", runs[i].string(), ec.message());
      ec.clear();
    }
  }
}

Status LogRouter::start() {
  if (!has_run()) return Status::invalid_argument("LogRouter::start called before create_run");
  if (closed_.load()) return Status::unavailable("log router is shut down");
  if (started_.exchange(true)) return Status{};

  consumer_.start([this] { consume_(); });
  return Status{};
}

Status LogRouter::enqueue(LogRecord record) {
  if (!has_run()) return Status::invalid_argument("LogRouter::enqueue called before create_run");
  if (closed_.load()) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    return Status::unavailable("log router is shut down");
  }

  if (record.t_wall.ns == 0) record.t_wall = wall_now();

  if (!queue_.try_push(Item(std::move(record)))) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    // Lost the race with shutdown(): the sentinel is already queued.
    if (queue_.closed()) return Status::unavailable("log router is shut down");
    return Status::resource_exhausted("Log queue is full");
  }
  accepted_.fetch_add(1, std::memory_order_relaxed);
  return Status{};
}

Status LogRouter::enqueue(Category category, Level level, std::string source,
                          const JsonObject& payload) {
  LogRecord rec;
  rec.category = category;
  rec.t_wall = wall_now();
  rec.level = level;
  rec.source = std::move(source);
  rec.payload = payload.str();
  return enqueue(std::move(rec));
}

void LogRouter::system(Level level, const std::string& source, const std::string& message) {
  console_->log(to_spdlog(level), "{}: {}", source, message);

  // Before the run exists there is only the console.
  if (!has_run()) return;

  LogRecord rec;
  rec.category = Category::kSystem;
  rec.t_wall = wall_now();
  rec.level = level;
  rec.source = source;
  rec.payload = message;
  (void)enqueue(std::move(rec));
}

Status LogRouter::write_artifact(const std::string& file_name, std::string content) {
  if (file_name.empty() || file_name.find('/') != std::string::npos || file_name == "." ||
      file_name == "..") {
    return Status::invalid_argument("bad artifact name '" + file_name + "'");
  }

  LogRecord rec;
  rec.category = Category::kArtifact;
  rec.t_wall = wall_now();
  rec.level = Level::kInfo;
  rec.source = file_name;
  rec.payload = std::move(content);
  return enqueue(std::move(rec));
}

void LogRouter::shutdown() {
  if (closed_.exchange(true)) return;

  if (!has_run()) return;

  (void)queue_.close(std::nullopt);

  if (!started_.load()) {
    // Never started: drain on the caller's thread.
    consume_();
    return;
  }

  const auto timeout = seconds_to_duration(cfg_.shutdown_timeout_s);
  if (!consumer_.join_for(timeout)) {
    console_->error("log_router: writer thread did not stop cleanly within {:.1f}s",
                    cfg_.shutdown_timeout_s);
  }
}

void LogRouter::consume_() {
  for (;;) {
    std::optional<Item> item = queue_.pop_wait(kIdleFlush);
    if (!item) {
      flush_all_();
      continue;
    }
    if (!item->has_value()) break;  // sentinel

    write_(**item);
    if (queue_.size() == 0) flush_all_();
  }
  flush_all_();
}

void LogRouter::write_(const LogRecord& rec) {
  if (rec.category == Category::kArtifact) {
    const fs::path path = fs::path(run_->dir) / rec.source;
    std::ofstream f(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (f.is_open()) f << rec.payload;
    if (!f.is_open() || !f.good()) {
      write_errors_.fetch_add(1, std::memory_order_relaxed);
      console_->error("log_router: failed writing artifact '{}'", path.string());
      return;
    }
    artifacts_.fetch_add(1, std::memory_order_relaxed);
    written_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  const std::size_t i = index_of(rec.category);
  const std::string line = is_json_category(rec.category) ? json_line(rec) : text_line(rec);

  const std::uint64_t errors_before = write_errors_.load(std::memory_order_relaxed);
  streams_[i]->log(spdlog::level::info, "{}", line);
  if (write_errors_.load(std::memory_order_relaxed) != errors_before) return;

  written_.fetch_add(1, std::memory_order_relaxed);
  written_by_category_[i].fetch_add(1, std::memory_order_relaxed);
}

void LogRouter::flush_all_() {
  for (auto& s : streams_) {
    if (s) s->flush();
  }
}

bool LogRouter::has_run() const {
  std::lock_guard<std::mutex> lk(run_mu_);
  return run_.has_value();
}

RunInfo LogRouter::run() const {
  std::lock_guard<std::mutex> lk(run_mu_);
  return run_ ? *run_ : RunInfo{};
}

std::string LogRouter::path_for(Category category) const {
  if (!has_run()) return {};
  if (category == Category::kArtifact) return run().dir;
  return paths_[index_of(category)];
}

RouterStats LogRouter::stats() const {
  RouterStats s;
  s.accepted = accepted_.load();
  s.written = written_.load();
  s.rejected = rejected_.load();
  s.write_errors = write_errors_.load();
  s.artifacts_written = artifacts_.load();
  for (std::size_t i = 0; i < written_by_category_.size(); ++i) {
    s.written_by_category[i] = written_by_category_[i].load();
  }
  s.queue_depth = queue_.size();
  return s;
}

HealthReport LogRouter::health() const {
  const RouterStats s = stats();

  HealthReport h;
  h.component = "log_router";
  if (!has_run()) h.flag("no run directory");
  if (s.rejected > 0) h.flag(std::to_string(s.rejected) + " records rejected (queue full)");
  if (s.write_errors > 0) h.flag(std::to_string(s.write_errors) + " write errors");

  const RunInfo r = run();
  h.details.add("run_id", r.id)
      .add("run_dir", r.dir)
      .add("accepted", s.accepted)
      .add("written", s.written)
      .add("rejected", s.rejected)
      .add("write_errors", s.write_errors)
      .add("queue_depth", s.queue_depth)
      .add("queue_capacity", queue_.capacity());
  return h;
}

}  // namespace blast
