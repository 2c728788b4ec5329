// include/blast/core/logging/log_router.hpp
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <spdlog/fwd.h>

#include "blast/core/config.hpp"
#include "blast/core/health.hpp"
#include "blast/core/logging/log_record.hpp"
#include "blast/core/status.hpp"
#include "blast/core/types.hpp"
#include "blast/core/util/bounded_queue.hpp"
#include "blast/core/util/json.hpp"
#include "blast/core/util/worker.hpp"

namespace blast {

struct RunInfo {
  std::string id;   // run_20261016_103001_250
  std::string dir;  // <base_dir>/<id>
  TimestampNs wall_start;
  std::string config_hash;
};

struct RouterStats {
  std::uint64_t accepted = 0;
  std::uint64_t written = 0;
  std::uint64_t rejected = 0;
  std::uint64_t write_errors = 0;
  std::array<std::uint64_t, kStreamCategoryCount> written_by_category{};
  std::uint64_t artifacts_written = 0;
  std::size_t queue_depth = 0;
};

// Owns the run directory and every category stream.
//
// Producers call enqueue() from any thread; it never blocks and never touches disk.
// A single consumer thread drains the queue and appends to the rotating category files.
// Lifecycle: create_run() -> start() -> enqueue()... -> shutdown().
class LogRouter {
 public:
  explicit LogRouter(LoggingConfig cfg);
  ~LogRouter();

  LogRouter(const LogRouter&) = delete;
  LogRouter& operator=(const LogRouter&) = delete;

  // Creates <base_dir>/run_<stamp>/ with one subdirectory and file per stream,
  // retargets "latest", prunes old runs and queues the run header.
  Status create_run(const NodeId& node_id, const std::string& config_hash);

  Status start();

  // kInvalidArgument before create_run(), kResourceExhausted when the queue is full,
  // kUnavailable after shutdown().
  Status enqueue(LogRecord record);
  Status enqueue(Category category, Level level, std::string source, const JsonObject& payload);

  // Console (spdlog) plus the system stream. Overload is counted in stats, not reported.
  void system(Level level, const std::string& source, const std::string& message);

  // Whole-file artifact inside the run directory, written by the consumer.
  Status write_artifact(const std::string& file_name, std::string content);

  // Sentinel through the queue, bounded join. Safe to call more than once.
  void shutdown();

  [[nodiscard]] bool has_run() const;
  [[nodiscard]] RunInfo run() const;
  [[nodiscard]] std::string path_for(Category category) const;
  [[nodiscard]] RouterStats stats() const;
  [[nodiscard]] HealthReport health() const;

  [[nodiscard]] const LoggingConfig& config() const noexcept { return cfg_; }

 private:
  using Item = std::optional<LogRecord>;  // nullopt is the shutdown sentinel

  Status open_streams_();
  Status point_latest_();
  void prune_runs_();

  void consume_();
  void write_(const LogRecord& rec);
  void flush_all_();

  LoggingConfig cfg_;
  Level console_level_ = Level::kInfo;
  std::shared_ptr<spdlog::logger> console_;

  mutable std::mutex run_mu_;
  std::optional<RunInfo> run_;
  std::array<std::string, kStreamCategoryCount> paths_;
  std::array<std::shared_ptr<spdlog::logger>, kStreamCategoryCount> streams_;

  BoundedQueue<Item> queue_;
  Worker consumer_{"log_router"};
  std::atomic<bool> started_{false};
  std::atomic<bool> closed_{false};

  std::atomic<std::uint64_t> accepted_{0};
  std::atomic<std::uint64_t> written_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> write_errors_{0};
  std::atomic<std::uint64_t> artifacts_{0};
  std::array<std::atomic<std::uint64_t>, kStreamCategoryCount> written_by_category_{};
};

}  // namespace blast
