// include/blast/core/recovery/recovery_engine.hpp
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "blast/core/config.hpp"
#include "blast/core/events/event_recorder.hpp"
#include "blast/core/health.hpp"
#include "blast/core/logging/log_router.hpp"
#include "blast/core/recovery/strategies.hpp"
#include "blast/core/status.hpp"
#include "blast/core/util/time.hpp"

namespace blast {

// Called when recovery keeps failing after max_attempts: the component needs
// external intervention (degraded mode, operator alert).
using EscalationHook = std::function<void(ErrorCategory category, const std::string& message)>;

using SleepFn = std::function<void(std::chrono::nanoseconds)>;

struct RecoveryAction {
  ErrorCategory category = ErrorCategory::kGeneric;
  RetryPolicyConfig policy;  // max_attempts, backoff, cooldown_s
  std::unique_ptr<RecoveryStrategy> strategy;
  EscalationHook escalation;
};

// One action per category with the built-in strategies and policies from `cfg`.
std::vector<RecoveryAction> default_recovery_actions(const RecoveryConfig& cfg, LogRouter& router,
                                                     EventRecorder& events,
                                                     const EscalationHook& escalation = {});

struct CircuitState {
  int consecutive_failures = 0;
  bool open = false;
  double open_remaining_s = 0.0;
};

struct CategoryStats {
  ErrorCategory category = ErrorCategory::kGeneric;
  std::string strategy;
  std::uint64_t attempts = 0;
  std::uint64_t successes = 0;
  std::uint64_t failures = 0;
  std::uint64_t escalations = 0;
  std::uint64_t short_circuits = 0;
  CircuitState circuit;
};

struct RecoveryStats {
  std::vector<CategoryStats> categories;
  std::uint64_t attempts = 0;
  std::uint64_t successes = 0;
  std::uint64_t failures = 0;
  std::uint64_t escalations = 0;
  double success_rate = 0.0;  // successes / max(1, attempts)
};

// Retry with backoff plus a circuit breaker per error category.
//
// Circuit: CLOSED -> (consecutive failures >= threshold) -> OPEN(until)
//          -> (first recover() at/after until) -> CLOSED
// Any successful recovery resets the failure count and closes the circuit.
// Actions are fixed at construction.
class RecoveryEngine {
  // Construction goes through create().
  struct Token {
    explicit Token() = default;
  };

 public:
  static Result<std::unique_ptr<RecoveryEngine>> create(const RecoveryConfig& cfg,
                                                        std::vector<RecoveryAction> actions,
                                                        LogRouter& router, EventRecorder& events,
                                                        SleepFn sleep = {});

  RecoveryEngine(Token, const RecoveryConfig& cfg, std::vector<RecoveryAction> actions,
                 LogRouter& router, EventRecorder& events, SleepFn sleep);

  RecoveryEngine(const RecoveryEngine&) = delete;
  RecoveryEngine& operator=(const RecoveryEngine&) = delete;

  // Runs the category's strategy unless its circuit is open.
  bool recover(const Status& error, ErrorCategory category, RecoveryContext& ctx);
  bool recover(const Status& error, ErrorCategory category);

  // Blocks the caller between attempts. On exhaustion the last error goes through
  // recover() and is returned. kUnavailable without calling `op` while the circuit is open.
  Status retry_with_backoff(const std::function<Status()>& op, ErrorCategory category,
                            RecoveryContext ctx = RecoveryContext{});

  template <typename T>
  Result<T> retry_with_backoff(const std::function<Result<T>()>& op, ErrorCategory category,
                               RecoveryContext ctx = RecoveryContext{}) {
    std::optional<T> value;
    const Status s = retry_with_backoff(
        [&]() -> Status {
          Result<T> r = op();
          if (!r.ok()) return r.status();
          value.emplace(r.take_value());
          return Status{};
        },
        category, std::move(ctx));
    if (!s.ok()) return Result<T>::err(s);
    return Result<T>::ok(std::move(*value));
  }

  // min(initial * base^attempt, max) * jitter_factor
  static double backoff_delay_s(const RetryPolicyConfig& policy, int attempt, double jitter_factor);

  [[nodiscard]] bool has_action(ErrorCategory category) const;
  [[nodiscard]] CircuitState circuit(ErrorCategory category) const;
  [[nodiscard]] RecoveryStats stats() const;
  [[nodiscard]] HealthReport health() const;

 private:
  struct State {
    std::uint64_t attempts = 0;  // since the last success
    std::uint64_t total_attempts = 0;
    std::uint64_t successes = 0;
    std::uint64_t failures = 0;
    std::uint64_t escalations = 0;
    std::uint64_t short_circuits = 0;
    int consecutive_failures = 0;
    bool open = false;
    SteadyClock::time_point open_until;
  };

  const RecoveryAction* action_(ErrorCategory category) const;
  double jitter_();
  CircuitState circuit_locked_(const State& st, SteadyClock::time_point now) const;

  RecoveryConfig cfg_;
  std::array<std::optional<RecoveryAction>, kErrorCategoryCount> actions_;
  LogRouter& router_;
  EventRecorder& events_;
  SleepFn sleep_;

  mutable std::mutex mu_;
  std::array<State, kErrorCategoryCount> state_{};

  std::mutex rng_mu_;
  std::mt19937 rng_;
};

}  // namespace blast
