// tests/test_recovery_engine.cpp
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "blast/core/recovery/recovery_engine.hpp"
#include "test_util.hpp"

namespace blast {
namespace {

// Strategy whose outcome the test controls.
class ScriptedStrategy final : public RecoveryStrategy {
 public:
  const char* name() const override { return "scripted"; }
  bool recover(const Status&, RecoveryContext&) override {
    calls.fetch_add(1);
    return succeed.load();
  }

  std::atomic<int> calls{0};
  std::atomic<bool> succeed{false};
};

RetryPolicyConfig quick_policy(int max_attempts) {
  RetryPolicyConfig p;
  p.max_attempts = max_attempts;
  p.initial_delay_s = 0.1;
  p.max_delay_s = 1.0;
  p.exponential_base = 2.0;
  p.jitter = false;
  p.cooldown_s = 0.1;
  return p;
}

class RecoveryEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    router_ = std::make_unique<LogRouter>(test::logging_in(dir_));
    ASSERT_TRUE(router_->create_run("stand", "h").ok());
    ASSERT_TRUE(router_->start().ok());
    events_ = std::make_unique<EventRecorder>(*router_);
  }

  // Single scripted action for `category`; sleeps are recorded, not taken.
  std::unique_ptr<RecoveryEngine> scripted(ErrorCategory category, const RetryPolicyConfig& policy,
                                           int failure_threshold = 10,
                                           EscalationHook escalation = {}) {
    auto strategy = std::make_unique<ScriptedStrategy>();
    strategy_ = strategy.get();

    std::vector<RecoveryAction> actions;
    RecoveryAction a;
    a.category = category;
    a.policy = policy;
    a.strategy = std::move(strategy);
    a.escalation = std::move(escalation);
    actions.push_back(std::move(a));

    RecoveryConfig cfg;
    cfg.failure_threshold = failure_threshold;
    auto r = RecoveryEngine::create(cfg, std::move(actions), *router_, *events_,
                                    [this](std::chrono::nanoseconds d) { sleeps_.push_back(d); });
    EXPECT_TRUE(r.ok()) << r.status().message();
    return r.ok() ? r.take_value() : nullptr;
  }

  std::vector<std::string> lines(Category c) {
    router_->shutdown();
    return test::read_lines(router_->path_for(c));
  }

  test::TempDir dir_;
  std::unique_ptr<LogRouter> router_;
  std::unique_ptr<EventRecorder> events_;
  ScriptedStrategy* strategy_ = nullptr;
  std::vector<std::chrono::nanoseconds> sleeps_;
};

double as_seconds(std::chrono::nanoseconds d) { return std::chrono::duration<double>(d).count(); }

TEST_F(RecoveryEngineTest, BackoffDelayGrowsAndCaps) {
  RetryPolicyConfig p;
  p.initial_delay_s = 0.5;
  p.max_delay_s = 10.0;
  p.exponential_base = 2.0;

  EXPECT_DOUBLE_EQ(RecoveryEngine::backoff_delay_s(p, 0, 1.0), 0.5);
  EXPECT_DOUBLE_EQ(RecoveryEngine::backoff_delay_s(p, 3, 1.0), 4.0);
  EXPECT_DOUBLE_EQ(RecoveryEngine::backoff_delay_s(p, 10, 1.0), 10.0);
  EXPECT_DOUBLE_EQ(RecoveryEngine::backoff_delay_s(p, 1, 1.5), 1.5);
  EXPECT_DOUBLE_EQ(RecoveryEngine::backoff_delay_s(p, 10, 0.5), 5.0);
}

TEST_F(RecoveryEngineTest, CreateValidatesActions) {
  RecoveryConfig cfg;
  {
    std::vector<RecoveryAction> actions;
    RecoveryAction a;
    a.category = ErrorCategory::kNetwork;
    actions.push_back(std::move(a));
    EXPECT_EQ(RecoveryEngine::create(cfg, std::move(actions), *router_, *events_).status().code(),
              Status::Code::kInvalidArgument);
  }
  {
    std::vector<RecoveryAction> actions;
    for (int i = 0; i < 2; ++i) {
      RecoveryAction a;
      a.category = ErrorCategory::kNetwork;
      a.strategy = std::make_unique<ScriptedStrategy>();
      actions.push_back(std::move(a));
    }
    EXPECT_FALSE(RecoveryEngine::create(cfg, std::move(actions), *router_, *events_).ok());
  }
  {
    std::vector<RecoveryAction> actions;
    RecoveryAction a;
    a.category = ErrorCategory::kNetwork;
    a.strategy = std::make_unique<ScriptedStrategy>();
    a.policy.max_attempts = 0;
    actions.push_back(std::move(a));
    EXPECT_FALSE(RecoveryEngine::create(cfg, std::move(actions), *router_, *events_).ok());
  }
  {
    RecoveryConfig bad;
    bad.failure_threshold = 0;
    EXPECT_FALSE(RecoveryEngine::create(bad, {}, *router_, *events_).ok());
  }
}

TEST_F(RecoveryEngineTest, DefaultActionsCoverEveryCategory) {
  auto r = RecoveryEngine::create(RecoveryConfig{},
                                  default_recovery_actions(RecoveryConfig{}, *router_, *events_),
                                  *router_, *events_);
  ASSERT_TRUE(r.ok());
  auto engine = r.take_value();
  for (int i = 0; i < kErrorCategoryCount; ++i) {
    EXPECT_TRUE(engine->has_action(static_cast<ErrorCategory>(i)));
  }
  EXPECT_EQ(engine->stats().categories.size(), static_cast<std::size_t>(kErrorCategoryCount));
}

TEST_F(RecoveryEngineTest, RetrySucceedsAfterTransientFailures) {
  auto engine = scripted(ErrorCategory::kSerialTimeout, quick_policy(5));
  ASSERT_TRUE(engine);

  int calls = 0;
  const Status s = engine->retry_with_backoff(
      [&]() -> Status {
        ++calls;
        return calls <= 2 ? Status::io_error("timeout") : Status{};
      },
      ErrorCategory::kSerialTimeout);

  EXPECT_TRUE(s.ok());
  EXPECT_EQ(calls, 3);
  ASSERT_EQ(sleeps_.size(), 2u);
  EXPECT_NEAR(as_seconds(sleeps_[0]), 0.1, 1e-6);
  EXPECT_NEAR(as_seconds(sleeps_[1]), 0.2, 1e-6);
  EXPECT_EQ(strategy_->calls.load(), 0);
}

TEST_F(RecoveryEngineTest, ExhaustedRetriesRouteLastErrorThroughRecover) {
  auto engine = scripted(ErrorCategory::kSerialTimeout, quick_policy(3));
  ASSERT_TRUE(engine);

  int calls = 0;
  const Status s = engine->retry_with_backoff(
      [&]() -> Status {
        ++calls;
        return Status::io_error("timeout " + std::to_string(calls));
      },
      ErrorCategory::kSerialTimeout);

  EXPECT_EQ(s.code(), Status::Code::kIoError);
  EXPECT_EQ(s.message(), "timeout 3");
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(sleeps_.size(), 2u);
  EXPECT_EQ(strategy_->calls.load(), 1);

  const auto errs = lines(Category::kErrors);
  EXPECT_EQ(test::count_containing(errs, "\"type\":\"retries_exhausted\""), 1u);
  EXPECT_EQ(test::count_containing(errs, "\"type\":\"recovery_attempt\""), 1u);
}

TEST_F(RecoveryEngineTest, JitterStaysWithinBounds) {
  RetryPolicyConfig p = quick_policy(4);
  p.jitter = true;
  auto engine = scripted(ErrorCategory::kNetwork, p);
  ASSERT_TRUE(engine);

  (void)engine->retry_with_backoff([]() { return Status::unavailable("down"); },
                                   ErrorCategory::kNetwork);
  ASSERT_EQ(sleeps_.size(), 3u);
  for (std::size_t i = 0; i < sleeps_.size(); ++i) {
    const double base = RecoveryEngine::backoff_delay_s(p, static_cast<int>(i), 1.0);
    EXPECT_GE(as_seconds(sleeps_[i]), base * 0.5 - 1e-9);
    EXPECT_LT(as_seconds(sleeps_[i]), base * 1.5 + 1e-9);
  }
}

TEST_F(RecoveryEngineTest, TypedRetryReturnsValue) {
  auto engine = scripted(ErrorCategory::kParseFailure, quick_policy(3));
  ASSERT_TRUE(engine);

  int calls = 0;
  const Result<int> r = engine->retry_with_backoff<int>(
      [&]() -> Result<int> {
        if (++calls == 1) return Result<int>::err(Status::parse_error("bad frame"));
        return Result<int>::ok(42);
      },
      ErrorCategory::kParseFailure);

  ASSERT_TRUE(r.ok());
  EXPECT_EQ(*r, 42);
  EXPECT_EQ(calls, 2);
}

TEST_F(RecoveryEngineTest, ThrowingOperationBecomesInternalError) {
  auto engine = scripted(ErrorCategory::kGeneric, quick_policy(1));
  ASSERT_TRUE(engine);

  const Status s = engine->retry_with_backoff(
      []() -> Status { throw std::runtime_error("boom"); }, ErrorCategory::kGeneric);
  EXPECT_EQ(s.code(), Status::Code::kInternal);
  EXPECT_EQ(s.message(), "boom");
  EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RecoveryEngineTest, MissingActionIsReported) {
  auto engine = scripted(ErrorCategory::kNetwork, quick_policy(2));
  ASSERT_TRUE(engine);

  EXPECT_FALSE(engine->has_action(ErrorCategory::kFileWrite));
  EXPECT_FALSE(engine->recover(Status::io_error("disk"), ErrorCategory::kFileWrite));

  bool invoked = false;
  const Status s = engine->retry_with_backoff(
      [&]() -> Status {
        invoked = true;
        return Status{};
      },
      ErrorCategory::kFileWrite);
  EXPECT_EQ(s.code(), Status::Code::kInvalidArgument);
  EXPECT_FALSE(invoked);

  EXPECT_EQ(test::count_containing(lines(Category::kErrors), "\"outcome\":\"no_action\""), 1u);
}

TEST_F(RecoveryEngineTest, CircuitOpensShortCircuitsAndClosesAfterCooldown) {
  auto engine = scripted(ErrorCategory::kSerialDisconnect, quick_policy(100), 3);
  ASSERT_TRUE(engine);
  const Status err = Status::io_error("port gone");

  for (int i = 0; i < 3; ++i) EXPECT_FALSE(engine->recover(err, ErrorCategory::kSerialDisconnect));
  EXPECT_EQ(strategy_->calls.load(), 3);
  EXPECT_TRUE(engine->circuit(ErrorCategory::kSerialDisconnect).open);
  EXPECT_FALSE(engine->health().healthy);

  // Open: the strategy is not consulted.
  EXPECT_FALSE(engine->recover(err, ErrorCategory::kSerialDisconnect));
  EXPECT_FALSE(engine->recover(err, ErrorCategory::kSerialDisconnect));
  EXPECT_EQ(strategy_->calls.load(), 3);

  bool invoked = false;
  const Status s = engine->retry_with_backoff(
      [&]() -> Status {
        invoked = true;
        return Status{};
      },
      ErrorCategory::kSerialDisconnect);
  EXPECT_EQ(s.code(), Status::Code::kUnavailable);
  EXPECT_FALSE(invoked);

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_FALSE(engine->circuit(ErrorCategory::kSerialDisconnect).open);

  strategy_->succeed = true;
  EXPECT_TRUE(engine->recover(err, ErrorCategory::kSerialDisconnect));
  EXPECT_EQ(strategy_->calls.load(), 4);

  const CircuitState c = engine->circuit(ErrorCategory::kSerialDisconnect);
  EXPECT_FALSE(c.open);
  EXPECT_EQ(c.consecutive_failures, 0);

  const RecoveryStats st = engine->stats();
  ASSERT_EQ(st.categories.size(), 1u);
  EXPECT_EQ(st.categories[0].short_circuits, 3u);
  EXPECT_EQ(st.attempts, 4u);
  EXPECT_EQ(st.successes, 1u);
  EXPECT_EQ(st.failures, 3u);
  EXPECT_DOUBLE_EQ(st.success_rate, 0.25);
}

TEST_F(RecoveryEngineTest, FailureAfterCooldownReopensCircuit) {
  auto engine = scripted(ErrorCategory::kNetwork, quick_policy(100), 2);
  ASSERT_TRUE(engine);
  const Status err = Status::unavailable("unreachable");

  EXPECT_FALSE(engine->recover(err, ErrorCategory::kNetwork));
  EXPECT_FALSE(engine->recover(err, ErrorCategory::kNetwork));
  ASSERT_TRUE(engine->circuit(ErrorCategory::kNetwork).open);

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  EXPECT_FALSE(engine->recover(err, ErrorCategory::kNetwork));
  EXPECT_EQ(strategy_->calls.load(), 3);
  EXPECT_TRUE(engine->circuit(ErrorCategory::kNetwork).open);
}

TEST_F(RecoveryEngineTest, EscalatesOnceAttemptsReachMaximum) {
  std::vector<std::string> escalated;
  auto engine = scripted(ErrorCategory::kGeneric, quick_policy(2), 10,
                         [&](ErrorCategory c, const std::string& msg) {
                           escalated.push_back(std::string(to_string(c)) + ":" + msg);
                         });
  ASSERT_TRUE(engine);
  const Status err = Status::internal("stuck");

  EXPECT_FALSE(engine->recover(err, ErrorCategory::kGeneric));
  EXPECT_TRUE(escalated.empty());
  EXPECT_FALSE(engine->recover(err, ErrorCategory::kGeneric));
  ASSERT_EQ(escalated.size(), 1u);
  EXPECT_EQ(escalated[0], "generic:stuck");

  // A success starts the count over.
  strategy_->succeed = true;
  EXPECT_TRUE(engine->recover(err, ErrorCategory::kGeneric));
  strategy_->succeed = false;
  EXPECT_FALSE(engine->recover(err, ErrorCategory::kGeneric));
  EXPECT_EQ(escalated.size(), 1u);
  EXPECT_EQ(engine->stats().escalations, 1u);

  const auto ev = lines(Category::kEvents);
  EXPECT_EQ(test::count_containing(ev, "\"event_type\":\"error_escalation\""), 1u);
  EXPECT_EQ(test::count_containing(ev, "\"event_type\":\"error_recovery\""), 1u);
  const auto sys = test::read_lines(router_->path_for(Category::kSystem));
  EXPECT_EQ(test::count_containing(sys, "ESCALATED ERROR: generic - stuck"), 1u);
}

TEST_F(RecoveryEngineTest, ThrowingEscalationHookIsContained) {
  auto engine = scripted(ErrorCategory::kGeneric, quick_policy(1), 10,
                         [](ErrorCategory, const std::string&) { throw std::runtime_error("pager down"); });
  ASSERT_TRUE(engine);
  EXPECT_FALSE(engine->recover(Status::internal("x"), ErrorCategory::kGeneric));
  EXPECT_EQ(test::count_containing(lines(Category::kSystem), "Escalation action failed: pager down"), 1u);
}

// -----------------------------
// Built-in strategies
// -----------------------------

class StrategyTest : public RecoveryEngineTest {};

TEST_F(StrategyTest, DisconnectFallsBackWhenReconnectFails) {
  SerialDisconnectStrategy s(*router_, *events_);
  RecoveryContext ctx;
  ctx.port = "/dev/ttyACM0";
  int reconnects = 0;
  int fallbacks = 0;
  ctx.reconnect = [&]() {
    ++reconnects;
    return Status::io_error("no device");
  };
  ctx.fallback = [&]() {
    ++fallbacks;
    return Status{};
  };

  EXPECT_TRUE(s.recover(Status::io_error("EOF"), ctx));
  EXPECT_EQ(reconnects, 1);
  EXPECT_EQ(fallbacks, 1);

  const auto ev = lines(Category::kEvents);
  EXPECT_EQ(test::count_containing(ev, "\"from_mode\":\"serial\",\"to_mode\":\"simulator\""), 1u);
  EXPECT_EQ(test::count_containing(ev, "\"event_type\":\"serial_disconnect\""), 1u);
}

TEST_F(StrategyTest, DisconnectWithoutHooksFails) {
  SerialDisconnectStrategy s(*router_, *events_);
  RecoveryContext ctx;
  EXPECT_FALSE(s.recover(Status::io_error("EOF"), ctx));
}

TEST_F(StrategyTest, FileWriteCleansUpWhenDiskIsFull) {
  FileWriteStrategy s(*router_, *events_);
  RecoveryContext ctx;
  int cleanups = 0;
  std::vector<std::string> buffered;
  ctx.data = "{\"seq\":1}";
  ctx.cleanup = [&]() {
    ++cleanups;
    return Status{};
  };
  ctx.buffer = [&](const std::string& d) {
    buffered.push_back(d);
    return Status{};
  };

  EXPECT_TRUE(s.recover(Status::io_error("write failed: No space left on device"), ctx));
  EXPECT_EQ(cleanups, 1);
  EXPECT_TRUE(buffered.empty());

  EXPECT_TRUE(s.recover(Status::io_error("permission denied"), ctx));
  EXPECT_EQ(cleanups, 1);
  ASSERT_EQ(buffered.size(), 1u);
  EXPECT_EQ(buffered[0], "{\"seq\":1}");
}

TEST_F(StrategyTest, ParseFailureUsesResetHook) {
  ParseFailureStrategy s(*router_, *events_);
  RecoveryContext ctx;
  EXPECT_TRUE(s.recover(Status::parse_error("bad json"), ctx));

  ctx.reset_parser = []() { return Status::internal("stuck"); };
  EXPECT_FALSE(s.recover(Status::parse_error("bad json"), ctx));
}

TEST_F(StrategyTest, ResourceExhaustionNeedsCleanup) {
  ResourceExhaustionStrategy s(*router_, *events_);
  RecoveryContext ctx;
  EXPECT_FALSE(s.recover(Status::resource_exhausted("oom"), ctx));
  ctx.cleanup = []() { return Status{}; };
  EXPECT_TRUE(s.recover(Status::resource_exhausted("oom"), ctx));
}

TEST_F(StrategyTest, CategoryNamesRoundTrip) {
  for (int i = 0; i < kErrorCategoryCount; ++i) {
    const auto c = static_cast<ErrorCategory>(i);
    ErrorCategory parsed = ErrorCategory::kGeneric;
    ASSERT_TRUE(parse_error_category(to_string(c), &parsed));
    EXPECT_EQ(parsed, c);
  }
  ErrorCategory out;
  EXPECT_FALSE(parse_error_category("meteor_strike", &out));
}

}  // namespace
}  // namespace blast
