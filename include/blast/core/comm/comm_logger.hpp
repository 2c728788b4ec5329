// include/blast/core/comm/comm_logger.hpp
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "blast/core/config.hpp"
#include "blast/core/health.hpp"
#include "blast/core/logging/log_router.hpp"
#include "blast/core/status.hpp"
#include "blast/core/util/json.hpp"
#include "blast/core/util/time.hpp"

namespace blast {

enum class Direction : int { kTx = 0, kRx };
enum class ProtocolErrorKind : int { kJsonParse = 0, kMalformed, kChecksum };

const char* to_string(Direction d);
const char* to_string(ProtocolErrorKind kind);

// Lowercase hex, two characters per byte, no separators.
std::string hex_dump(const Bytes& data);

// Printable ASCII kept, everything else as \xNN.
std::string sanitize_ascii(const Bytes& data);

struct CommEntry {
  Direction direction = Direction::kTx;
  std::uint64_t sequence = 0;
  TimestampNs t_wall;
  std::optional<double> since_last_ms;
  std::optional<double> rtt_ms;  // RX only: receive minus most recent send
  std::string label;             // TX command or RX parsed summary
  std::string hex;
  std::string ascii;
  std::size_t length = 0;
  bool valid = true;

  JsonObject to_json() const;
};

struct RecentComms {
  std::vector<CommEntry> tx;
  std::vector<CommEntry> rx;
};

struct CommStats {
  std::uint64_t total_tx = 0;
  std::uint64_t total_rx = 0;
  std::uint64_t json_parse_errors = 0;
  std::uint64_t malformed_messages = 0;
  std::uint64_t checksum_errors = 0;
  std::uint64_t timeouts = 0;

  std::uint64_t connection_attempts = 0;
  std::uint64_t connection_failures = 0;
  std::uint64_t disconnections = 0;
  std::uint64_t reconnections = 0;

  double error_rate = 0.0;  // protocol errors / total_rx

  // Over the buffered RX window.
  std::optional<double> rtt_min_ms;
  std::optional<double> rtt_avg_ms;
  std::optional<double> rtt_max_ms;

  JsonObject to_json() const;
};

// Heuristic only: annotates dumps, never drives decoding.
struct ProtocolAnalysis {
  std::size_t length = 0;
  std::string starts_with;  // hex of the first <= 4 bytes
  std::string ends_with;    // hex of the last <= 4 bytes
  bool contains_json = false;
  std::string line_endings;  // CRLF | LF | CR | empty
  std::string potential_format = "unknown";

  JsonObject to_json() const;
};

ProtocolAnalysis analyze_protocol(const Bytes& data);

// Protocol-level TX/RX log for the serial link.
// Per-direction sequence numbers and ring buffers; summary lines go to the serial stream.
class CommLogger {
  // Construction goes through create().
  struct Token {
    explicit Token() = default;
  };

 public:
  static Result<std::unique_ptr<CommLogger>> create(const SerialConfig& cfg, LogRouter& router);

  CommLogger(Token, const SerialConfig& cfg, LogRouter& router);

  CommLogger(const CommLogger&) = delete;
  CommLogger& operator=(const CommLogger&) = delete;

  Status log_sent(const Bytes& data, const std::string& command = "");

  // `parsed` is a short summary of the decoded message; absent means decoding failed.
  Status log_received(const Bytes& data, const std::optional<std::string>& parsed = std::nullopt);

  Status log_timeout(double duration_s, const std::string& context = "");
  Status log_protocol_error(ProtocolErrorKind kind, const Bytes& data, const std::string& error);

  Status log_connection_attempt(const std::string& port, int baudrate);
  Status log_connection_success(const std::string& port, int baudrate);
  Status log_connection_failure(const std::string& port, int baudrate, const std::string& error);
  Status log_disconnection(const std::string& port, const std::string& reason);
  Status log_reconnection(int attempts, bool success);

  [[nodiscard]] CommStats statistics() const;
  [[nodiscard]] RecentComms recent(std::size_t count = 10) const;

  // Both buffers and statistics as a run artifact. Empty name picks serial_dump_<stamp>.json.
  Status dump(const std::string& name = "");

  [[nodiscard]] HealthReport health() const;

 private:
  Status emit_(Level level, const JsonObject& record);

  SerialConfig cfg_;
  LogRouter& router_;

  mutable std::mutex mu_;
  std::deque<CommEntry> tx_;
  std::deque<CommEntry> rx_;
  std::uint64_t tx_seq_{0};
  std::uint64_t rx_seq_{0};
  std::optional<SteadyClock::time_point> last_tx_;
  std::optional<SteadyClock::time_point> last_rx_;
  std::optional<SteadyClock::time_point> connected_at_;
  CommStats stats_;
};

}  // namespace blast
