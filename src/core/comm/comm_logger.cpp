// src/core/comm/comm_logger.cpp
#include "blast/core/comm/comm_logger.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <utility>

namespace blast {
namespace {

constexpr const char* kSource = "comm_logger";

constexpr std::size_t kHexSummaryChars = 100;
constexpr std::size_t kAsciiSummaryChars = 50;

std::string head(const std::string& s, std::size_t n) { return s.size() <= n ? s : s.substr(0, n); }

std::string fmt1(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(1) << v;
  return ss.str();
}

void add_optional(JsonObject& o, const std::string& key, const std::optional<double>& v) {
  if (v) {
    o.add(key, *v);
  } else {
    o.add_null(key);
  }
}

bool contains(const Bytes& data, const char* needle, std::size_t n) {
  return std::search(data.begin(), data.end(), needle, needle + n) != data.end();
}

}  // namespace

const char* to_string(Direction d) { return d == Direction::kTx ? "tx" : "rx"; }

const char* to_string(ProtocolErrorKind kind) {
  switch (kind) {
    case ProtocolErrorKind::kJsonParse: return "json_parse";
    case ProtocolErrorKind::kMalformed: return "malformed";
    case ProtocolErrorKind::kChecksum: return "checksum";
  }
  return "malformed";
}

std::string hex_dump(const Bytes& data) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (std::uint8_t b : data) {
    out += kDigits[b >> 4];
    out += kDigits[b & 0x0f];
  }
  return out;
}

std::string sanitize_ascii(const Bytes& data) {
  std::string out;
  out.reserve(data.size());
  for (std::uint8_t b : data) {
    if (b >= 32 && b <= 126) {
      out += static_cast<char>(b);
    } else {
      char buf[5];
      std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(b));
      out += buf;
    }
  }
  return out;
}

JsonObject CommEntry::to_json() const {
  JsonObject o;
  o.add("direction", to_string(direction))
      .add("sequence", sequence)
      .add("timestamp", iso8601_utc(t_wall));
  add_optional(o, "since_last_ms", since_last_ms);
  if (direction == Direction::kRx) add_optional(o, "rtt_ms", rtt_ms);
  o.add(direction == Direction::kTx ? "command" : "parsed", label)
      .add("hex", hex)
      .add("ascii", ascii)
      .add("length", length)
      .add("valid", valid);
  return o;
}

JsonObject CommStats::to_json() const {
  JsonObject o;
  o.add("total_tx", total_tx)
      .add("total_rx", total_rx)
      .add("json_parse_errors", json_parse_errors)
      .add("malformed_messages", malformed_messages)
      .add("checksum_errors", checksum_errors)
      .add("timeouts", timeouts)
      .add("connection_attempts", connection_attempts)
      .add("connection_failures", connection_failures)
      .add("disconnections", disconnections)
      .add("reconnections", reconnections)
      .add("error_rate", error_rate);
  add_optional(o, "min_response_time_ms", rtt_min_ms);
  add_optional(o, "avg_response_time_ms", rtt_avg_ms);
  add_optional(o, "max_response_time_ms", rtt_max_ms);
  return o;
}

JsonObject ProtocolAnalysis::to_json() const {
  JsonObject o;
  o.add("length", length)
      .add("starts_with", starts_with)
      .add("ends_with", ends_with)
      .add("contains_json", contains_json);
  if (line_endings.empty()) {
    o.add_null("line_endings");
  } else {
    o.add("line_endings", line_endings);
  }
  o.add("potential_format", potential_format);
  return o;
}

ProtocolAnalysis analyze_protocol(const Bytes& data) {
  ProtocolAnalysis a;
  a.length = data.size();

  const std::size_t n = std::min<std::size_t>(4, data.size());
  a.starts_with = hex_dump(Bytes(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n)));
  a.ends_with = hex_dump(Bytes(data.end() - static_cast<std::ptrdiff_t>(n), data.end()));

  const auto open = std::find(data.begin(), data.end(), '{');
  if (open != data.end() && std::find(open, data.end(), '}') != data.end()) {
    a.contains_json = true;
    a.potential_format = "json";
  }

  if (contains(data, "\r\n", 2)) {
    a.line_endings = "CRLF";
  } else if (std::find(data.begin(), data.end(), '\n') != data.end()) {
    a.line_endings = "LF";
  } else if (std::find(data.begin(), data.end(), '\r') != data.end()) {
    a.line_endings = "CR";
  }

  // Leading sentinels win over the JSON guess.
  if (!data.empty() && data[0] == '$') {
    a.potential_format = "NMEA";
  } else if (data.size() >= 2 && data[0] == 'A' && data[1] == 'T') {
    a.potential_format = "AT_COMMAND";
  } else if (std::find(data.begin(), data.end(), 0x02) != data.end() &&
             std::find(data.begin(), data.end(), 0x03) != data.end()) {
    a.potential_format = "STX_ETX";
  }
  return a;
}

Result<std::unique_ptr<CommLogger>> CommLogger::create(const SerialConfig& cfg, LogRouter& router) {
  using R = Result<std::unique_ptr<CommLogger>>;
  if (cfg.buffer_size == 0) return R::err(Status::invalid_argument("serial.buffer_size must be > 0"));

  auto c = std::make_unique<CommLogger>(Token{}, cfg, router);
  router.system(Level::kInfo, kSource,
                "initialized with buffer size " + std::to_string(cfg.buffer_size));
  return R::ok(std::move(c));
}

CommLogger::CommLogger(Token, const SerialConfig& cfg, LogRouter& router)
    : cfg_(cfg), router_(router) {}

Status CommLogger::emit_(Level level, const JsonObject& record) {
  return router_.enqueue(Category::kSerial, level, kSource, record);
}

Status CommLogger::log_sent(const Bytes& data, const std::string& command) {
  const auto now = SteadyClock::now();

  CommEntry e;
  e.direction = Direction::kTx;
  e.t_wall = wall_now();
  e.label = command.empty() ? "DATA" : command;
  e.hex = hex_dump(data);
  e.ascii = sanitize_ascii(data);
  e.length = data.size();
  {
    std::lock_guard<std::mutex> lk(mu_);
    e.sequence = ++tx_seq_;
    ++stats_.total_tx;
    if (last_tx_) e.since_last_ms = seconds_since(*last_tx_, now) * 1000.0;
    last_tx_ = now;

    tx_.push_back(e);
    while (tx_.size() > cfg_.buffer_size) tx_.pop_front();
  }

  JsonObject o;
  o.add("direction", "tx")
      .add("sequence", e.sequence)
      .add("command", e.label)
      .add("length", e.length)
      .add("hex", head(e.hex, kHexSummaryChars))
      .add("ascii", head(e.ascii, kAsciiSummaryChars));
  add_optional(o, "since_last_ms", e.since_last_ms);
  o.add_null("rtt_ms").add("valid", true);
  return emit_(Level::kInfo, o);
}

Status CommLogger::log_received(const Bytes& data, const std::optional<std::string>& parsed) {
  const auto now = SteadyClock::now();

  CommEntry e;
  e.direction = Direction::kRx;
  e.t_wall = wall_now();
  e.label = parsed.value_or("");
  e.hex = hex_dump(data);
  e.ascii = sanitize_ascii(data);
  e.length = data.size();
  e.valid = parsed.has_value();
  {
    std::lock_guard<std::mutex> lk(mu_);
    e.sequence = ++rx_seq_;
    ++stats_.total_rx;
    if (last_rx_) e.since_last_ms = seconds_since(*last_rx_, now) * 1000.0;
    if (last_tx_) e.rtt_ms = seconds_since(*last_tx_, now) * 1000.0;
    last_rx_ = now;

    rx_.push_back(e);
    while (rx_.size() > cfg_.buffer_size) rx_.pop_front();
  }

  JsonObject o;
  o.add("direction", "rx")
      .add("sequence", e.sequence)
      .add("length", e.length)
      .add("hex", head(e.hex, kHexSummaryChars))
      .add("ascii", head(e.ascii, kAsciiSummaryChars));
  add_optional(o, "since_last_ms", e.since_last_ms);
  add_optional(o, "rtt_ms", e.rtt_ms);
  o.add("valid", e.valid);
  if (parsed) o.add("parsed", head(*parsed, 200));
  return emit_(e.valid ? Level::kInfo : Level::kWarning, o);
}

Status CommLogger::log_timeout(double duration_s, const std::string& context) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.timeouts;
  }

  JsonObject o;
  o.add("type", "timeout").add("duration_s", duration_s).add("context", context);
  router_.system(Level::kWarning, kSource,
                 "TIMEOUT after " + fmt1(duration_s) + "s" + (context.empty() ? "" : ": " + context));
  return emit_(Level::kWarning, o);
}

Status CommLogger::log_protocol_error(ProtocolErrorKind kind, const Bytes& data,
                                      const std::string& error) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    switch (kind) {
      case ProtocolErrorKind::kJsonParse: ++stats_.json_parse_errors; break;
      case ProtocolErrorKind::kMalformed: ++stats_.malformed_messages; break;
      case ProtocolErrorKind::kChecksum: ++stats_.checksum_errors; break;
    }
  }

  JsonObject o;
  o.add("type", "protocol_error")
      .add("error_type", to_string(kind))
      .add("error", error)
      .add("data", head(sanitize_ascii(data), 100))
      .add("analysis", analyze_protocol(data).to_json());
  return emit_(Level::kError, o);
}

Status CommLogger::log_connection_attempt(const std::string& port, int baudrate) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.connection_attempts;
  }
  JsonObject o;
  o.add("type", "connection_attempt").add("port", port).add("baudrate", baudrate);
  return emit_(Level::kInfo, o);
}

Status CommLogger::log_connection_success(const std::string& port, int baudrate) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    connected_at_ = SteadyClock::now();
  }
  JsonObject o;
  o.add("type", "connection_success").add("port", port).add("baudrate", baudrate);
  return emit_(Level::kInfo, o);
}

Status CommLogger::log_connection_failure(const std::string& port, int baudrate,
                                          const std::string& error) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.connection_failures;
  }
  JsonObject o;
  o.add("type", "connection_failure").add("port", port).add("baudrate", baudrate).add("error", error);
  return emit_(Level::kError, o);
}

Status CommLogger::log_disconnection(const std::string& port, const std::string& reason) {
  std::optional<double> uptime;
  {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.disconnections;
    if (connected_at_) uptime = seconds_since(*connected_at_, SteadyClock::now());
    connected_at_.reset();
  }
  JsonObject o;
  o.add("type", "disconnection").add("port", port).add("reason", reason);
  add_optional(o, "uptime_s", uptime);
  return emit_(Level::kWarning, o);
}

Status CommLogger::log_reconnection(int attempts, bool success) {
  if (success) {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.reconnections;
    connected_at_ = SteadyClock::now();
  }
  JsonObject o;
  o.add("type", "reconnection").add("attempts", attempts).add("success", success);
  router_.system(success ? Level::kInfo : Level::kError, kSource,
                 std::string(success ? "RECONNECTED" : "RECONNECTION FAILED") + " after " +
                     std::to_string(attempts) + " attempts");
  return emit_(success ? Level::kInfo : Level::kError, o);
}

CommStats CommLogger::statistics() const {
  std::lock_guard<std::mutex> lk(mu_);
  CommStats s = stats_;

  const std::uint64_t errors = s.json_parse_errors + s.malformed_messages + s.checksum_errors;
  s.error_rate = s.total_rx > 0 ? static_cast<double>(errors) / static_cast<double>(s.total_rx) : 0.0;

  double sum = 0.0;
  std::size_t n = 0;
  for (const auto& e : rx_) {
    if (!e.rtt_ms) continue;
    const double v = *e.rtt_ms;
    s.rtt_min_ms = s.rtt_min_ms ? std::min(*s.rtt_min_ms, v) : v;
    s.rtt_max_ms = s.rtt_max_ms ? std::max(*s.rtt_max_ms, v) : v;
    sum += v;
    ++n;
  }
  if (n > 0) s.rtt_avg_ms = sum / static_cast<double>(n);
  return s;
}

RecentComms CommLogger::recent(std::size_t count) const {
  std::lock_guard<std::mutex> lk(mu_);
  RecentComms r;
  const std::size_t nt = std::min(count, tx_.size());
  const std::size_t nr = std::min(count, rx_.size());
  r.tx.assign(tx_.end() - static_cast<std::ptrdiff_t>(nt), tx_.end());
  r.rx.assign(rx_.end() - static_cast<std::ptrdiff_t>(nr), rx_.end());
  return r;
}

Status CommLogger::dump(const std::string& name) {
  JsonArray tx;
  JsonArray rx;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& e : tx_) tx.push(e.to_json());
    for (const auto& e : rx_) rx.push(e.to_json());
  }

  JsonObject o;
  o.add("timestamp", iso8601_utc(wall_now()))
      .add_raw("tx_buffer", tx.str())
      .add_raw("rx_buffer", rx.str())
      .add("statistics", statistics().to_json());

  const std::string file = name.empty() ? "serial_dump_" + run_stamp(wall_now()) + ".json" : name;
  const Status s = router_.write_artifact(file, o.str() + "\n");
  if (!s.ok()) {
    router_.system(Level::kError, kSource, "Failed to dump serial data: " + s.message());
    return s;
  }
  router_.system(Level::kInfo, kSource, "Serial communications dumped to " + file);
  return Status{};
}

HealthReport CommLogger::health() const {
  const CommStats s = statistics();

  HealthReport h;
  h.component = "comm_logger";
  if (s.total_rx > 0 && s.error_rate > 0.1) h.flag("serial error rate " + fmt1(s.error_rate * 100.0) + "%");
  h.details = s.to_json();
  return h;
}

}  // namespace blast
