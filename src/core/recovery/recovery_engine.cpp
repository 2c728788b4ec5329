// src/core/recovery/recovery_engine.cpp
#include "blast/core/recovery/recovery_engine.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>
#include <thread>
#include <utility>

namespace blast {
namespace {

constexpr const char* kSource = "error_recovery";

std::size_t index_of(ErrorCategory c) { return static_cast<std::size_t>(c); }

std::string fmt2(double v) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << v;
  return ss.str();
}

Status validate_policy(ErrorCategory c, const RetryPolicyConfig& p) {
  const std::string where = std::string("recovery.") + to_string(c);
  if (p.max_attempts < 1) return Status::invalid_argument(where + ".max_attempts must be >= 1");
  if (!(p.initial_delay_s >= 0.0)) return Status::invalid_argument(where + ".initial_delay_s must be >= 0");
  if (!(p.max_delay_s >= p.initial_delay_s)) {
    return Status::invalid_argument(where + ".max_delay_s must be >= initial_delay_s");
  }
  if (!(p.exponential_base >= 1.0)) return Status::invalid_argument(where + ".exponential_base must be >= 1");
  if (!(p.cooldown_s >= 0.0)) return Status::invalid_argument(where + ".cooldown_s must be >= 0");
  return Status{};
}

}  // namespace

std::vector<RecoveryAction> default_recovery_actions(const RecoveryConfig& cfg, LogRouter& router,
                                                     EventRecorder& events,
                                                     const EscalationHook& escalation) {
  std::vector<RecoveryAction> out;
  out.reserve(kErrorCategoryCount);
  for (int i = 0; i < kErrorCategoryCount; ++i) {
    const auto c = static_cast<ErrorCategory>(i);

    RecoveryAction a;
    a.category = c;
    auto it = cfg.policies.find(to_string(c));
    if (it != cfg.policies.end()) a.policy = it->second;
    a.strategy = make_default_strategy(c, router, events);
    a.escalation = escalation;
    out.push_back(std::move(a));
  }
  return out;
}

Result<std::unique_ptr<RecoveryEngine>> RecoveryEngine::create(const RecoveryConfig& cfg,
                                                               std::vector<RecoveryAction> actions,
                                                               LogRouter& router,
                                                               EventRecorder& events,
                                                               SleepFn sleep) {
  using R = Result<std::unique_ptr<RecoveryEngine>>;
  if (cfg.failure_threshold < 1) {
    return R::err(Status::invalid_argument("recovery.failure_threshold must be >= 1"));
  }

  std::array<bool, kErrorCategoryCount> seen{};
  for (const auto& a : actions) {
    const std::size_t i = index_of(a.category);
    if (seen[i]) {
      return R::err(Status::invalid_argument(std::string("duplicate recovery action for ") +
                                             to_string(a.category)));
    }
    seen[i] = true;
    if (!a.strategy) {
      return R::err(Status::invalid_argument(std::string("recovery action for ") +
                                             to_string(a.category) + " has no strategy"));
    }
    const Status s = validate_policy(a.category, a.policy);
    if (!s.ok()) return R::err(s);
  }

  if (!sleep) {
    sleep = [](std::chrono::nanoseconds d) { std::this_thread::sleep_for(d); };
  }

  auto e = std::make_unique<RecoveryEngine>(Token{}, cfg, std::move(actions), router, events,
                                            std::move(sleep));
  router.system(Level::kInfo, kSource,
                "initialized (failure_threshold=" + std::to_string(cfg.failure_threshold) + ")");
  return R::ok(std::move(e));
}

RecoveryEngine::RecoveryEngine(Token, const RecoveryConfig& cfg, std::vector<RecoveryAction> actions,
                               LogRouter& router, EventRecorder& events, SleepFn sleep)
    : cfg_(cfg), router_(router), events_(events), sleep_(std::move(sleep)),
      rng_(std::random_device{}()) {
  for (auto& a : actions) {
    const std::size_t i = index_of(a.category);
    actions_[i] = std::move(a);
  }
}

const RecoveryAction* RecoveryEngine::action_(ErrorCategory category) const {
  const auto& a = actions_[index_of(category)];
  return a ? &*a : nullptr;
}

bool RecoveryEngine::has_action(ErrorCategory category) const { return action_(category) != nullptr; }

double RecoveryEngine::backoff_delay_s(const RetryPolicyConfig& policy, int attempt,
                                       double jitter_factor) {
  const double raw = policy.initial_delay_s * std::pow(policy.exponential_base, attempt);
  return std::min(raw, policy.max_delay_s) * jitter_factor;
}

double RecoveryEngine::jitter_() {
  std::lock_guard<std::mutex> lk(rng_mu_);
  std::uniform_real_distribution<double> dist(0.5, 1.5);
  return dist(rng_);
}

bool RecoveryEngine::recover(const Status& error, ErrorCategory category) {
  RecoveryContext ctx;
  return recover(error, category, ctx);
}

bool RecoveryEngine::recover(const Status& error, ErrorCategory category, RecoveryContext& ctx) {
  const char* cat = to_string(category);
  const RecoveryAction* action = action_(category);

  JsonObject rec;
  rec.add("type", "recovery_attempt")
      .add("category", cat)
      .add("error_code", to_string(error.code()))
      .add("message", error.message())
      .add("port", ctx.port);

  if (!action) {
    (void)router_.enqueue(Category::kErrors, Level::kError, kSource,
                          rec.add("outcome", "no_action"));
    router_.system(Level::kError, kSource, std::string("No recovery action registered for ") + cat);
    return false;
  }

  std::uint64_t attempt = 0;
  bool short_circuit = false;
  bool closed = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    State& st = state_[index_of(category)];
    if (st.open) {
      if (SteadyClock::now() >= st.open_until) {
        st.open = false;
        closed = true;
      } else {
        ++st.short_circuits;
        short_circuit = true;
      }
    }
    if (!short_circuit) {
      attempt = ++st.attempts;
      ++st.total_attempts;
    }
  }

  if (closed) router_.system(Level::kInfo, kSource, std::string("Circuit breaker closed for ") + cat);

  if (short_circuit) {
    (void)router_.enqueue(Category::kErrors, Level::kWarning, kSource,
                          rec.add("outcome", "circuit_open"));
    router_.system(Level::kWarning, kSource, std::string("Circuit breaker open for ") + cat);
    return false;
  }

  (void)router_.enqueue(Category::kErrors, Level::kError, kSource,
                        rec.add("attempt", attempt).add("strategy", action->strategy->name()));

  bool success = false;
  try {
    success = action->strategy->recover(error, ctx);
  } catch (const std::exception& e) {
    router_.system(Level::kError, kSource,
                   std::string("Recovery failed for ") + cat + ": " + e.what());
    success = false;
  }

  bool opened = false;
  bool escalate = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    State& st = state_[index_of(category)];
    if (success) {
      ++st.successes;
      st.consecutive_failures = 0;
      st.attempts = 0;
      st.open = false;
    } else {
      ++st.failures;
      ++st.consecutive_failures;
      if (st.consecutive_failures >= cfg_.failure_threshold && !st.open) {
        st.open = true;
        st.open_until = SteadyClock::now() + seconds_to_duration(action->policy.cooldown_s);
        opened = true;
      }
      if (st.attempts >= static_cast<std::uint64_t>(action->policy.max_attempts) &&
          action->escalation) {
        ++st.escalations;
        escalate = true;
      }
    }
  }

  if (success) {
    router_.system(Level::kInfo, kSource, std::string("Successfully recovered from ") + cat);
    JsonObject d;
    d.add("error_type", cat)
        .add("recovery_action", action->strategy->name())
        .add("attempt_number", attempt);
    (void)events_.record(EventKind::kErrorRecovery, d);
    return true;
  }

  if (opened) {
    router_.system(Level::kWarning, kSource,
                   std::string("Circuit breaker opened for ") + cat + " (" +
                       fmt2(action->policy.cooldown_s) + "s)");
  }

  if (escalate) {
    router_.system(Level::kCritical, kSource,
                   std::string("ESCALATED ERROR: ") + cat + " - " + error.message());
    JsonObject d;
    d.add("error_type", cat)
        .add("original_message", error.message())
        .add("failed_recovery_attempts", attempt);
    (void)events_.record(EventKind::kErrorEscalation, d, Level::kCritical);

    try {
      action->escalation(category, error.message());
    } catch (const std::exception& e) {
      router_.system(Level::kError, kSource, std::string("Escalation action failed: ") + e.what());
    }
  }
  return false;
}

Status RecoveryEngine::retry_with_backoff(const std::function<Status()>& op,
                                          ErrorCategory category, RecoveryContext ctx) {
  const char* cat = to_string(category);
  const RecoveryAction* action = action_(category);
  if (!action) return Status::invalid_argument(std::string("no recovery action for ") + cat);

  if (circuit(category).open) {
    std::lock_guard<std::mutex> lk(mu_);
    ++state_[index_of(category)].short_circuits;
    return Status::unavailable(std::string("circuit open for ") + cat);
  }

  const RetryPolicyConfig& p = action->policy;
  Status last;
  for (int attempt = 0; attempt < p.max_attempts; ++attempt) {
    try {
      last = op();
    } catch (const std::exception& e) {
      last = Status::internal(e.what());
    }

    if (last.ok()) {
      if (attempt > 0) {
        router_.system(Level::kInfo, kSource, "Succeeded on retry " + std::to_string(attempt + 1));
      }
      return last;
    }

    router_.system(Level::kWarning, kSource,
                   "Attempt " + std::to_string(attempt + 1) + "/" + std::to_string(p.max_attempts) +
                       " failed: " + last.message());

    if (attempt < p.max_attempts - 1) {
      const double delay = backoff_delay_s(p, attempt, p.jitter ? jitter_() : 1.0);
      router_.system(Level::kDebug, kSource, "Retrying in " + fmt2(delay) + " seconds...");
      sleep_(seconds_to_duration(delay));
    }
  }

  JsonObject o;
  o.add("type", "retries_exhausted")
      .add("category", cat)
      .add("attempts", p.max_attempts)
      .add("error_code", to_string(last.code()))
      .add("message", last.message());
  (void)router_.enqueue(Category::kErrors, Level::kError, kSource, o);
  router_.system(Level::kError, kSource,
                 "All " + std::to_string(p.max_attempts) + " attempts failed for " + cat);

  (void)recover(last, category, ctx);
  return last;
}

CircuitState RecoveryEngine::circuit_locked_(const State& st, SteadyClock::time_point now) const {
  CircuitState c;
  c.consecutive_failures = st.consecutive_failures;
  c.open = st.open && now < st.open_until;
  if (c.open) c.open_remaining_s = seconds_since(now, st.open_until);
  return c;
}

CircuitState RecoveryEngine::circuit(ErrorCategory category) const {
  std::lock_guard<std::mutex> lk(mu_);
  return circuit_locked_(state_[index_of(category)], SteadyClock::now());
}

RecoveryStats RecoveryEngine::stats() const {
  const auto now = SteadyClock::now();

  RecoveryStats s;
  std::lock_guard<std::mutex> lk(mu_);
  for (int i = 0; i < kErrorCategoryCount; ++i) {
    const auto c = static_cast<ErrorCategory>(i);
    const RecoveryAction* a = action_(c);
    if (!a) continue;

    const State& st = state_[static_cast<std::size_t>(i)];
    CategoryStats cs;
    cs.category = c;
    cs.strategy = a->strategy->name();
    cs.attempts = st.total_attempts;
    cs.successes = st.successes;
    cs.failures = st.failures;
    cs.escalations = st.escalations;
    cs.short_circuits = st.short_circuits;
    cs.circuit = circuit_locked_(st, now);
    s.categories.push_back(cs);

    s.attempts += st.total_attempts;
    s.successes += st.successes;
    s.failures += st.failures;
    s.escalations += st.escalations;
  }
  s.success_rate = static_cast<double>(s.successes) /
                   static_cast<double>(std::max<std::uint64_t>(1, s.attempts));
  return s;
}

HealthReport RecoveryEngine::health() const {
  const RecoveryStats s = stats();

  HealthReport h;
  h.component = "error_recovery";

  JsonObject by_category;
  for (const auto& c : s.categories) {
    if (c.circuit.open) h.flag(std::string("circuit open for ") + to_string(c.category));

    JsonObject o;
    o.add("strategy", c.strategy)
        .add("attempts", c.attempts)
        .add("successes", c.successes)
        .add("failures", c.failures)
        .add("escalations", c.escalations)
        .add("short_circuits", c.short_circuits)
        .add("consecutive_failures", c.circuit.consecutive_failures)
        .add("circuit_open", c.circuit.open)
        .add("open_remaining_s", c.circuit.open_remaining_s);
    by_category.add(to_string(c.category), o);
  }
  if (s.escalations > 3) h.flag(std::to_string(s.escalations) + " escalations");

  h.details.add("attempts", s.attempts)
      .add("successes", s.successes)
      .add("failures", s.failures)
      .add("escalations", s.escalations)
      .add("success_rate", s.success_rate)
      .add("by_category", by_category);
  return h;
}

}  // namespace blast
