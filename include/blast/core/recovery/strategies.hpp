// include/blast/core/recovery/strategies.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>

#include "blast/core/events/event_recorder.hpp"
#include "blast/core/logging/log_router.hpp"
#include "blast/core/status.hpp"

namespace blast {

enum class ErrorCategory : int {
  kSerialTimeout = 0,
  kSerialDisconnect,  // connection loss
  kParseFailure,
  kFileWrite,
  kNetwork,
  kResourceExhaustion,
  kGeneric,
};

inline constexpr int kErrorCategoryCount = 7;

const char* to_string(ErrorCategory category);
bool parse_error_category(const std::string& s, ErrorCategory* out);

// Host-supplied hooks and facts about the failing operation. Every hook is optional.
struct RecoveryContext {
  std::string port = "unknown";
  std::string data;  // payload a failed write wanted to persist

  std::function<Status()> reconnect;
  std::function<Status()> fallback;  // e.g. switch to the simulator
  std::function<Status()> cleanup;   // free disk / memory
  std::function<Status()> reset_parser;
  std::function<Status(const std::string& data)> buffer;
};

// One remedy per error category. Returns true when the condition is considered handled.
class RecoveryStrategy {
 public:
  virtual ~RecoveryStrategy() = default;

  virtual const char* name() const = 0;
  virtual bool recover(const Status& error, RecoveryContext& ctx) = 0;
};

// Base for the built-in strategies: they report through the router and the recorder.
class ReportingStrategy : public RecoveryStrategy {
 public:
  ReportingStrategy(LogRouter& router, EventRecorder& events) : router_(router), events_(events) {}

 protected:
  void log_(Level level, const std::string& message) { router_.system(level, "error_recovery", message); }

  LogRouter& router_;
  EventRecorder& events_;
};

// Timeouts: retrying is the remedy.
class SerialTimeoutStrategy final : public ReportingStrategy {
 public:
  using ReportingStrategy::ReportingStrategy;
  const char* name() const override { return "retry_read"; }
  bool recover(const Status& error, RecoveryContext& ctx) override;
};

// Reconnect, then fall back to an alternate data source.
class SerialDisconnectStrategy final : public ReportingStrategy {
 public:
  using ReportingStrategy::ReportingStrategy;
  const char* name() const override { return "reconnect_or_fallback"; }
  bool recover(const Status& error, RecoveryContext& ctx) override;
};

class ParseFailureStrategy final : public ReportingStrategy {
 public:
  using ReportingStrategy::ReportingStrategy;
  const char* name() const override { return "reset_parser"; }
  bool recover(const Status& error, RecoveryContext& ctx) override;
};

// Disk full: cleanup. Anything else: buffer the data for a later write.
class FileWriteStrategy final : public ReportingStrategy {
 public:
  using ReportingStrategy::ReportingStrategy;
  const char* name() const override { return "cleanup_or_buffer"; }
  bool recover(const Status& error, RecoveryContext& ctx) override;
};

class NetworkStrategy final : public ReportingStrategy {
 public:
  using ReportingStrategy::ReportingStrategy;
  const char* name() const override { return "retry_network"; }
  bool recover(const Status& error, RecoveryContext& ctx) override;
};

class ResourceExhaustionStrategy final : public ReportingStrategy {
 public:
  using ReportingStrategy::ReportingStrategy;
  const char* name() const override { return "free_resources"; }
  bool recover(const Status& error, RecoveryContext& ctx) override;
};

// No generic remedy.
class GenericStrategy final : public ReportingStrategy {
 public:
  using ReportingStrategy::ReportingStrategy;
  const char* name() const override { return "none"; }
  bool recover(const Status& error, RecoveryContext& ctx) override;
};

std::unique_ptr<RecoveryStrategy> make_default_strategy(ErrorCategory category, LogRouter& router,
                                                        EventRecorder& events);

}  // namespace blast
