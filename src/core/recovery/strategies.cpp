// src/core/recovery/strategies.cpp
#include "blast/core/recovery/strategies.hpp"

namespace blast {
namespace {

bool is_disk_full(const Status& error) {
  const std::string& m = error.message();
  return m.find("No space left") != std::string::npos || m.find("ENOSPC") != std::string::npos;
}

}  // namespace

const char* to_string(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kSerialTimeout: return "serial_timeout";
    case ErrorCategory::kSerialDisconnect: return "serial_disconnect";
    case ErrorCategory::kParseFailure: return "parse_failure";
    case ErrorCategory::kFileWrite: return "file_write";
    case ErrorCategory::kNetwork: return "network";
    case ErrorCategory::kResourceExhaustion: return "resource_exhaustion";
    case ErrorCategory::kGeneric: return "generic";
  }
  return "generic";
}

bool parse_error_category(const std::string& s, ErrorCategory* out) {
  for (int i = 0; i < kErrorCategoryCount; ++i) {
    const auto c = static_cast<ErrorCategory>(i);
    if (s == to_string(c)) {
      *out = c;
      return true;
    }
  }
  return false;
}

bool SerialTimeoutStrategy::recover(const Status& error, RecoveryContext& ctx) {
  log_(Level::kInfo, "Attempting to recover from serial timeout");

  JsonObject d;
  d.add("error_type", "timeout").add("port", ctx.port).add("message", error.message());
  (void)events_.log_connection_event(ConnectionEvent::kError, d);
  return true;
}

bool SerialDisconnectStrategy::recover(const Status& error, RecoveryContext& ctx) {
  log_(Level::kWarning, "Serial device disconnected");

  JsonObject d;
  d.add("port", ctx.port).add("error", error.message());
  (void)events_.log_connection_event(ConnectionEvent::kDisconnect, d);

  if (ctx.reconnect) {
    const Status r = ctx.reconnect();
    if (r.ok()) {
      JsonObject rd;
      rd.add("port", ctx.port);
      (void)events_.log_connection_event(ConnectionEvent::kReconnect, rd);
      return true;
    }
    log_(Level::kError, "Reconnection failed: " + r.message());
  }

  if (ctx.fallback) {
    const Status f = ctx.fallback();
    if (f.ok()) {
      (void)events_.log_mode_change("serial", "simulator", "Serial error: " + error.message());
      return true;
    }
    log_(Level::kError, "Fallback failed: " + f.message());
  }
  return false;
}

bool ParseFailureStrategy::recover(const Status& error, RecoveryContext& ctx) {
  log_(Level::kWarning, "Parse failure: " + error.message());
  if (!ctx.reset_parser) return true;

  const Status r = ctx.reset_parser();
  if (!r.ok()) log_(Level::kError, "Parser reset failed: " + r.message());
  return r.ok();
}

bool FileWriteStrategy::recover(const Status& error, RecoveryContext& ctx) {
  log_(Level::kWarning, "File write error: " + error.message());

  if (is_disk_full(error)) {
    log_(Level::kCritical, "Disk full - cannot write logs!");
    if (!ctx.cleanup) return false;
    const Status c = ctx.cleanup();
    if (!c.ok()) log_(Level::kError, "Cleanup failed: " + c.message());
    return c.ok();
  }

  if (!ctx.buffer) return false;
  const Status b = ctx.buffer(ctx.data);
  if (!b.ok()) {
    log_(Level::kError, "Buffering failed: " + b.message());
    return false;
  }
  log_(Level::kInfo, "Data buffered for later write");
  return true;
}

bool NetworkStrategy::recover(const Status& error, RecoveryContext& ctx) {
  log_(Level::kWarning, "Network error: " + error.message());

  JsonObject d;
  d.add("error_type", "network").add("port", ctx.port).add("message", error.message());
  (void)events_.log_connection_event(ConnectionEvent::kError, d);
  return true;
}

bool ResourceExhaustionStrategy::recover(const Status& error, RecoveryContext& ctx) {
  log_(Level::kCritical, "Resource exhaustion: " + error.message());
  if (!ctx.cleanup) return false;

  const Status c = ctx.cleanup();
  if (!c.ok()) log_(Level::kError, "Cleanup failed: " + c.message());
  return c.ok();
}

bool GenericStrategy::recover(const Status& error, RecoveryContext&) {
  log_(Level::kWarning, "Generic error recovery for: " + error.message());
  return false;
}

std::unique_ptr<RecoveryStrategy> make_default_strategy(ErrorCategory category, LogRouter& router,
                                                        EventRecorder& events) {
  switch (category) {
    case ErrorCategory::kSerialTimeout: return std::make_unique<SerialTimeoutStrategy>(router, events);
    case ErrorCategory::kSerialDisconnect:
      return std::make_unique<SerialDisconnectStrategy>(router, events);
    case ErrorCategory::kParseFailure: return std::make_unique<ParseFailureStrategy>(router, events);
    case ErrorCategory::kFileWrite: return std::make_unique<FileWriteStrategy>(router, events);
    case ErrorCategory::kNetwork: return std::make_unique<NetworkStrategy>(router, events);
    case ErrorCategory::kResourceExhaustion:
      return std::make_unique<ResourceExhaustionStrategy>(router, events);
    case ErrorCategory::kGeneric: break;
  }
  return std::make_unique<GenericStrategy>(router, events);
}

}  // namespace blast
