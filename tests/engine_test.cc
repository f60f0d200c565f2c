#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace miniflow;

// Registered in the process-wide factory, unlike TestRunner.
class NoopRunner : public ActionRunner {
 public:
  std::string Name() const override { return "noop"; }
  ActionResult Run(const ParamNode&, const CancelSignal&) override {
    return Outcome{{{"ran", "yes"}}};
  }
};
REGISTER_RUNNER(NoopRunner, "noop");

// Thread-safe log capture for runner output, which arrives on pool threads.
class LogCapture {
 public:
  LogFn Fn() {
    return [this](LogLevel, const std::string& msg) {
      std::lock_guard<std::mutex> lock(mu_);
      lines_.push_back(msg);
    };
  }

  bool Contains(const std::string& needle) {
    std::lock_guard<std::mutex> lock(mu_);
    return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& l) {
      return l.find(needle) != std::string::npos;
    });
  }

 private:
  std::mutex mu_;
  std::vector<std::string> lines_;
};

static size_t PositionOf(const std::vector<std::string>& order,
                         const std::string& id) {
  return std::find(order.begin(), order.end(), id) - order.begin();
}

// ============================================================
// A. ThreadPool Tests
// ============================================================

TEST(ThreadPool, BasicEnqueueAndComplete) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(4);
    for (int i = 0; i < 10; ++i) {
      pool.Enqueue([&counter] { counter.fetch_add(1); });
    }
  }  // destructor drains and joins
  EXPECT_EQ(counter.load(), 10);
}

TEST(ThreadPool, DestructorJoinsAllThreads) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(4);
    for (int i = 0; i < 100; ++i) {
      pool.Enqueue([&counter] {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
        counter.fetch_add(1);
      });
    }
  }
  EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPool, SingleThreadSerializesExecution) {
  std::vector<int> order;
  std::mutex mu;
  {
    ThreadPool pool(1);
    for (int i = 0; i < 10; ++i) {
      pool.Enqueue([&order, &mu, i] {
        std::lock_guard<std::mutex> lock(mu);
        order.push_back(i);
      });
    }
  }
  ASSERT_EQ(order.size(), 10u);
  for (int i = 0; i < 10; ++i) {
    EXPECT_EQ(order[i], i);
  }
}

TEST(ThreadPool, ZeroThreadsClampsToOne) {
  ThreadPool pool(0);
  EXPECT_EQ(pool.Size(), 1u);
}

TEST(ThreadPool, AbandonLeavesBusyWorkerBehind) {
  auto release = std::make_shared<CancelSignal>();
  auto finished = std::make_shared<std::atomic<bool>>(false);
  auto dropped = std::make_shared<std::atomic<bool>>(false);

  auto t0 = std::chrono::steady_clock::now();
  {
    ThreadPool pool(1);
    pool.Enqueue([release, finished] {
      release->WaitFor(std::chrono::seconds(5));
      finished->store(true);
    });
    pool.Enqueue([dropped] { dropped->store(true); });
    for (int i = 0; i < 200 && pool.Busy() == 0; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(pool.Busy(), 1u);

    EXPECT_EQ(pool.Abandon(), 1u);
    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_THROW(pool.Enqueue([] {}), std::runtime_error);
  }  // nothing left to join
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(2));
  EXPECT_FALSE(finished->load());

  // The detached worker still finishes its task, and only that one.
  release->Set();
  for (int i = 0; i < 400 && !finished->load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_TRUE(finished->load());
  EXPECT_FALSE(dropped->load());
}

// ============================================================
// B. Runner contract Tests
// ============================================================

TEST(CancelSignal, WaitForTimesOutThenObservesSet) {
  CancelSignal cancel;
  EXPECT_FALSE(cancel.IsSet());
  EXPECT_FALSE(cancel.WaitFor(std::chrono::milliseconds(5)));

  std::thread setter([&cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    cancel.Set();
  });
  EXPECT_TRUE(cancel.WaitFor(std::chrono::seconds(5)));
  setter.join();
  EXPECT_TRUE(cancel.IsSet());
}

TEST(CompletionChannel, WakeUnblocksEmptyDrain) {
  CompletionChannel channel;
  channel.Wake();
  EXPECT_TRUE(channel.Drain(std::nullopt).empty());

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(5);
  EXPECT_TRUE(channel.Drain(deadline).empty());

  channel.Push({3, Outcome{}});
  auto batch = channel.Drain(std::nullopt);
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch[0].index, 3);
}

TEST(InvokeRunner, ExceptionBecomesFailure) {
  auto recorder = std::make_shared<RunRecorder>();
  TestRunner runner(recorder);
  ParamNode params;
  params.AddMapItem("throw").SetScalar("true");
  CancelSignal cancel;
  auto result = InvokeRunner(runner, params, cancel);
  auto* failure = std::get_if<RunFailure>(&result);
  ASSERT_NE(failure, nullptr);
  EXPECT_EQ(failure->cause, "test runner error: boom");
  EXPECT_FALSE(failure->exit_code.has_value());
}

TEST(CheckDeclaredOutcomes, ClosedSet) {
  ActionResult exact = Outcome{{{"a", "1"}}};
  EXPECT_TRUE(std::holds_alternative<Outcome>(
      CheckDeclaredOutcomes(exact, {"a"})));

  ActionResult off = Outcome{{{"a", "1"}, {"b", "2"}}};
  auto checked = CheckDeclaredOutcomes(off, {"a", "c"});
  auto* failure = std::get_if<RunFailure>(&checked);
  ASSERT_NE(failure, nullptr);
  EXPECT_NE(failure->cause.find("missing: [c]"), std::string::npos);
  EXPECT_NE(failure->cause.find("undeclared: [b]"), std::string::npos);

  // Nothing declared, nothing checked.
  EXPECT_TRUE(std::holds_alternative<Outcome>(CheckDeclaredOutcomes(off, {})));
  ActionResult failed = RunFailure{"x", 2};
  EXPECT_TRUE(std::holds_alternative<RunFailure>(
      CheckDeclaredOutcomes(failed, {"a"})));
}

TEST(RunnerFactory, RegisteredKindsAreCreatable) {
  auto recorder = std::make_shared<RunRecorder>();
  auto factory = MakeTestFactory(recorder);
  EXPECT_TRUE(factory->Has("test"));
  EXPECT_FALSE(factory->Has("noop"));
  EXPECT_EQ(factory->Create("test")->Name(), "test");
  EXPECT_THROW(factory->Create("missing"), std::runtime_error);
  EXPECT_EQ(factory->Kinds(), (std::vector<std::string>{"test"}));
}

TEST(RunnerFactory, StaticRegistrationReachesGlobalFactory) {
  EXPECT_TRUE(RunnerFactory::Get().Has("noop"));
}

// ============================================================
// C. ExecutionEngine Tests
// ============================================================

class EngineTest : public ::testing::Test {
 protected:
  std::shared_ptr<RunRecorder> recorder_ = std::make_shared<RunRecorder>();
  std::shared_ptr<RunnerFactory> factory_ = MakeTestFactory(recorder_);

  std::unique_ptr<ExecutionEngine> Make(std::vector<ActionDescriptor> actions,
                                        EngineConfig config = {},
                                        LogFn log = silent) {
    auto graph = DependencyGraph::Build(std::move(actions), silent);
    return std::make_unique<ExecutionEngine>(graph, std::move(config), log,
                                             *factory_);
  }
};

TEST_F(EngineTest, DiamondSucceedsAndResolvesOutcomes) {
  // A -> B, A -> C, (B, C) -> D
  auto engine = Make({
      TestAction("A", {}, {}, {{"path", "/tmp"}}),
      TestAction("B", {"A"}, {{"cmd", "ls @{A.path}"}}),
      TestAction("C", {"A"}, {{"sleep_ms", "20"}}),
      TestAction("D", {"B", "C"},
                 {{"summary", "@{A.path}:@{status.B}:@{status.C}"}}),
  });
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  for (const auto& id : {"A", "B", "C", "D"}) {
    EXPECT_EQ(StateOf(result, id), ActionState::kSuccess) << id;
  }
  EXPECT_EQ(recorder_->Seen("B")["cmd"].Scalar(), "ls /tmp");
  EXPECT_EQ(recorder_->Seen("D")["summary"].Scalar(), "/tmp:SUCCESS:SUCCESS");

  auto order = recorder_->Started();
  EXPECT_GT(PositionOf(order, "D"), PositionOf(order, "B"));
  EXPECT_GT(PositionOf(order, "D"), PositionOf(order, "C"));
  EXPECT_EQ(result.outcomes.at("A").at("path"), "/tmp");
  EXPECT_EQ(engine->Ledger().Get("A", "path"), std::optional<std::string>("/tmp"));
}

TEST_F(EngineTest, FailureSkipsDescendantsUnderFree) {
  auto engine = Make({
      TestAction("A"),
      TestAction("B", {"A"}, {{"fail", "true"}}),
      TestAction("C", {"A"}, {{"sleep_ms", "20"}}),
      TestAction("D", {"B", "C"}),
  });
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kFailure);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kFailure);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kSuccess);
  EXPECT_EQ(StateOf(result, "D"), ActionState::kSkipped);
  EXPECT_FALSE(recorder_->WasStarted("D"));

  const auto* b = result.Find("B");
  EXPECT_EQ(b->cause, "fail requested");
  EXPECT_EQ(b->exit_code, std::optional<int>(7));
  EXPECT_EQ(result.Find("D")->cause, "dependency 'B' ended FAILURE");
  EXPECT_EQ(result.Find("D")->duration_us, 0);
}

TEST_F(EngineTest, ReportedStatesMatchFinalStates) {
  auto engine = Make({
      TestAction("A"),
      TestAction("B", {"A"}, {{"fail", "true"}}),
      TestAction("D", {"B"}),
  });
  auto result = engine->Run();

  ASSERT_EQ(result.actions.size(), engine->States().size());
  for (size_t i = 0; i < result.actions.size(); ++i) {
    EXPECT_EQ(result.actions[i].state, engine->States()[i])
        << result.actions[i].id;
  }
  EXPECT_EQ(StateOf(result, "A"), ActionState::kSuccess);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kFailure);
  EXPECT_EQ(StateOf(result, "D"), ActionState::kSkipped);
  EXPECT_EQ(result.verdict, RunVerdict::kFailure);
  EXPECT_EQ(ExitCodeFor(result.verdict), kExitFailure);
}

TEST_F(EngineTest, UnknownDependencyRejectedBeforeRunning) {
  try {
    Make({TestAction("A", {"ghost"})});
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.Kind(), ValidationErrorKind::kUnknownDependency);
    EXPECT_EQ(e.Ids(), (std::vector<std::string>{"ghost"}));
  }
  EXPECT_TRUE(recorder_->Started().empty());
}

TEST_F(EngineTest, CancelWhileRunning) {
  auto engine = Make({
      TestAction("A", {}, {{"wait_cancel", "true"}}),
      TestAction("B", {}, {{"wait_cancel", "true"}}),
      TestAction("C", {"A"}),
  });
  RunResult result;
  {
    Trigger cancel_when_busy(recorder_, 2, [&engine] { engine->Cancel(); });
    result = engine->Run();
  }

  EXPECT_EQ(result.verdict, RunVerdict::kCancelled);
  EXPECT_EQ(StateOf(result, "A"), ActionState::kCancelled);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kCancelled);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kCancelled);
  EXPECT_EQ(result.Find("A")->cause, "cancelled");
  EXPECT_EQ(result.Find("C")->cause, "run cancelled before dispatch");
  EXPECT_FALSE(recorder_->WasStarted("C"));
}

TEST_F(EngineTest, CancelBeforeRunDispatchesNothing) {
  auto engine = Make({TestAction("A"), TestAction("B", {"A"})});
  engine->Cancel();
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kCancelled);
  EXPECT_EQ(StateOf(result, "A"), ActionState::kCancelled);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kCancelled);
  EXPECT_TRUE(recorder_->Started().empty());
}

TEST_F(EngineTest, GracePeriodExpiresForStubbornRunner) {
  EngineConfig config;
  config.cancel_grace = std::chrono::milliseconds(50);
  auto engine = Make({TestAction("A", {}, {{"stubborn_ms", "600"}})}, config);
  RunResult result;
  {
    Trigger cancel_when_busy(recorder_, 1, [&engine] { engine->Cancel(); });
    result = engine->Run();
  }
  EXPECT_EQ(result.verdict, RunVerdict::kCancelled);
  EXPECT_EQ(result.Find("A")->cause, "did not stop within grace period");
  // The late Outcome is discarded.
  EXPECT_TRUE(result.outcomes.empty());
}

TEST_F(EngineTest, DestroyingEngineDoesNotWaitForStubbornRunner) {
  EngineConfig config;
  config.cancel_grace = std::chrono::milliseconds(50);
  auto engine = Make({TestAction("A", {}, {{"stubborn_ms", "1500"}})}, config);

  auto t0 = std::chrono::steady_clock::now();
  RunResult result;
  {
    Trigger cancel_when_busy(recorder_, 1, [&engine] { engine->Cancel(); });
    result = engine->Run();
  }
  engine.reset();
  auto elapsed = std::chrono::steady_clock::now() - t0;

  EXPECT_EQ(result.verdict, RunVerdict::kCancelled);
  EXPECT_EQ(ExitCodeFor(result.verdict), kExitCancelled);
  EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}

TEST_F(EngineTest, CancelMidBatchStopsRemainingDispatches) {
  auto engine = Make({
      TestAction("A", {}, {{"wait_cancel", "true"}}),
      TestAction("B", {}, {{"wait_cancel", "true"}}),
      TestAction("C"),
  });
  ExecutionEngine* raw = engine.get();
  engine->SetEventListener([raw](const LifecycleEvent& ev) {
    if (ev.action_id == "A" && ev.to == ActionState::kRunning) raw->Cancel();
  });
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kCancelled);
  EXPECT_EQ(StateOf(result, "A"), ActionState::kCancelled);
  for (const auto& id : {"B", "C"}) {
    EXPECT_EQ(StateOf(result, id), ActionState::kCancelled) << id;
    EXPECT_EQ(result.Find(id)->cause, "run cancelled before dispatch") << id;
    EXPECT_FALSE(recorder_->WasStarted(id)) << id;
  }
}

TEST_F(EngineTest, FreeRunsIndependentActionsConcurrently) {
  auto engine = Make({
      TestAction("A", {}, {{"await_peers", "3"}}),
      TestAction("B", {}, {{"await_peers", "3"}}),
      TestAction("C", {}, {{"await_peers", "3"}}),
  });
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(recorder_->MaxRunning(), 3);
}

TEST_F(EngineTest, ConcurrencyLimitBoundsRunningActions) {
  EngineConfig config;
  config.concurrency_limit = 2;
  auto engine = Make(
      {
          TestAction("A", {}, {{"await_peers", "2"}}),
          TestAction("B", {}, {{"await_peers", "2"}}),
          TestAction("C", {}, {{"sleep_ms", "10"}}),
          TestAction("D", {}, {{"sleep_ms", "10"}}),
      },
      config);
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(recorder_->MaxRunning(), 2);
}

TEST_F(EngineTest, StrictRunsOneActionAtATime) {
  EngineConfig config;
  config.strategy = "strict";
  config.concurrency_limit = 4;
  auto engine = Make(
      {
          TestAction("A", {}, {{"sleep_ms", "5"}}),
          TestAction("B", {}, {{"sleep_ms", "5"}}),
          TestAction("C", {"A"}, {{"sleep_ms", "5"}}),
          TestAction("D", {}, {{"sleep_ms", "5"}}),
      },
      config);
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(recorder_->MaxRunning(), 1);
  EXPECT_EQ(recorder_->Started(), (std::vector<std::string>{"A", "B", "C", "D"}));
  EXPECT_EQ(engine->Strategy().Name(), "strict");
}

TEST_F(EngineTest, StrictHaltsAfterFirstFailure) {
  EngineConfig config;
  config.strategy = "strict";
  auto engine = Make(
      {
          TestAction("A"),
          TestAction("B", {}, {{"fail", "true"}}),
          TestAction("C"),
          TestAction("D", {"A"}),
      },
      config);
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kFailure);
  EXPECT_EQ(StateOf(result, "A"), ActionState::kSuccess);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kFailure);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kSkipped);
  EXPECT_EQ(StateOf(result, "D"), ActionState::kSkipped);
  EXPECT_EQ(result.Find("C")->cause, "run halted after failure of 'B'");
  EXPECT_FALSE(recorder_->WasStarted("C"));
  EXPECT_FALSE(recorder_->WasStarted("D"));
}

TEST_F(EngineTest, SkipPropagatesThroughChain) {
  auto engine = Make({
      TestAction("A", {}, {{"fail", "true"}}),
      TestAction("B", {"A"}),
      TestAction("C", {"B"}),
      TestAction("D"),
  });
  auto result = engine->Run();
  EXPECT_EQ(StateOf(result, "B"), ActionState::kSkipped);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kSkipped);
  EXPECT_EQ(StateOf(result, "D"), ActionState::kSuccess);
  EXPECT_EQ(result.Find("C")->cause, "dependency 'B' ended SKIPPED");
}

TEST_F(EngineTest, SequentialSkipsOnlyDescendants) {
  EngineConfig config;
  config.strategy = "sequential";
  auto engine = Make(
      {
          TestAction("A", {}, {{"fail", "true"}}),
          TestAction("B", {"A"}),
          TestAction("C", {}, {{"sleep_ms", "5"}}),
          TestAction("D", {}, {{"sleep_ms", "5"}}),
      },
      config);
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kFailure);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kSkipped);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kSuccess);
  EXPECT_EQ(StateOf(result, "D"), ActionState::kSuccess);
  EXPECT_EQ(recorder_->MaxRunning(), 1);
}

TEST_F(EngineTest, StrictRenderFailsActionOnMissingOutcome) {
  EngineConfig config;
  config.render_policy = RenderPolicy::kStrict;
  auto engine = Make(
      {
          TestAction("A"),
          TestAction("B", {"A"}, {{"cmd", "value=@{A.missing}"}}),
          TestAction("C", {"B"}),
      },
      config);
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kFailure);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kFailure);
  EXPECT_EQ(result.Find("B")->cause.rfind("render failed: ", 0), 0u);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kSkipped);
  EXPECT_FALSE(recorder_->WasStarted("B"));
}

TEST_F(EngineTest, LenientRenderUsesEmptyString) {
  auto engine = Make({
      TestAction("A"),
      TestAction("B", {"A"}, {{"cmd", "value=@{A.missing}"}}),
  });
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(recorder_->Seen("B")["cmd"].Scalar(), "value=");
}

TEST_F(EngineTest, ContextValuesReachParams) {
  auto engine = Make({TestAction("A", {}, {{"target", "@{ctx.env_name}"}})});
  engine->SetContext({{"env_name", "staging"}});
  engine->Run();
  EXPECT_EQ(recorder_->Seen("A")["target"].Scalar(), "staging");
}

TEST_F(EngineTest, DeclaredOutcomesEnforced) {
  auto extra = TestAction("A", {}, {}, {{"path", "/x"}, {"extra", "1"}});
  extra.outcomes = {"path"};
  auto missing = TestAction("B");
  missing.outcomes = {"count"};
  auto exact = TestAction("C", {}, {}, {{"k", "v"}});
  exact.outcomes = {"k"};

  EngineConfig config;
  config.enforce_declared_outcomes = true;
  auto engine = Make({extra, missing, exact}, config);
  auto result = engine->Run();

  EXPECT_EQ(StateOf(result, "A"), ActionState::kFailure);
  EXPECT_NE(result.Find("A")->cause.find("undeclared: [extra]"),
            std::string::npos);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kFailure);
  EXPECT_NE(result.Find("B")->cause.find("missing: [count]"), std::string::npos);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kSuccess);
  EXPECT_FALSE(engine->Ledger().Get("A", "path").has_value());
}

TEST_F(EngineTest, DeclaredOutcomesAdvisoryByDefault) {
  auto extra = TestAction("A", {}, {}, {{"path", "/x"}, {"extra", "1"}});
  extra.outcomes = {"path"};
  auto engine = Make({extra});
  auto result = engine->Run();
  EXPECT_EQ(StateOf(result, "A"), ActionState::kSuccess);
  EXPECT_EQ(engine->Ledger().OutcomesOf("A").size(), 2u);
}

TEST_F(EngineTest, RunnerExceptionBecomesFailure) {
  auto engine = Make({TestAction("A", {}, {{"throw", "true"}})});
  auto result = engine->Run();
  EXPECT_EQ(StateOf(result, "A"), ActionState::kFailure);
  EXPECT_EQ(result.Find("A")->cause, "test runner error: boom");
}

TEST_F(EngineTest, UnknownRunnerKindRejected) {
  auto odd = TestAction("A");
  odd.kind = "teleport";
  try {
    Make({TestAction("ok"), odd});
    FAIL() << "expected ValidationError";
  } catch (const ValidationError& e) {
    EXPECT_EQ(e.Kind(), ValidationErrorKind::kUnknownRunnerKind);
    EXPECT_EQ(e.Ids(), (std::vector<std::string>{"A"}));
    EXPECT_NE(std::string(e.what()).find("teleport"), std::string::npos);
  }
}

TEST_F(EngineTest, UnknownStrategyRejected) {
  EngineConfig config;
  config.strategy = "fastest";
  EXPECT_THROW(Make({TestAction("A")}, config), ConfigError);
}

TEST_F(EngineTest, LifecycleEventsInOrder) {
  auto engine = Make({TestAction("A")});
  std::vector<std::pair<ActionState, ActionState>> seen;
  engine->SetEventListener([&seen](const LifecycleEvent& ev) {
    EXPECT_EQ(ev.action_id, "A");
    seen.emplace_back(ev.from, ev.to);
  });
  engine->Run();

  std::vector<std::pair<ActionState, ActionState>> expected = {
      {ActionState::kPending, ActionState::kReady},
      {ActionState::kReady, ActionState::kRunning},
      {ActionState::kRunning, ActionState::kSuccess},
  };
  EXPECT_EQ(seen, expected);
  EXPECT_EQ(engine->States()[0], ActionState::kSuccess);
}

TEST_F(EngineTest, ThrowingListenerDoesNotStopRun) {
  LogCapture logs;
  auto engine = Make({TestAction("A"), TestAction("B", {"A"})}, {}, logs.Fn());
  engine->SetEventListener(
      [](const LifecycleEvent&) { throw std::runtime_error("listener down"); });
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_TRUE(logs.Contains("Event listener threw: listener down"));
}

TEST_F(EngineTest, RunnerOutputIsLoggedWithActionPrefix) {
  LogCapture logs;
  auto engine = Make({TestAction("build")}, {}, logs.Fn());
  engine->Run();
  EXPECT_TRUE(logs.Contains("[build] running build"));
}

TEST_F(EngineTest, DurationsRecorded) {
  auto engine = Make({TestAction("A", {}, {{"sleep_ms", "20"}})});
  auto result = engine->Run();
  EXPECT_GE(result.Find("A")->duration_us, 20000);
  EXPECT_GE(result.total_us, result.Find("A")->duration_us);
}

TEST_F(EngineTest, SecondRunThrows) {
  auto engine = Make({TestAction("A")});
  engine->Run();
  EXPECT_THROW(engine->Run(), std::logic_error);
}

TEST(ExecutionEngine, DefaultFactoryUsesStaticRegistrations) {
  ActionDescriptor desc;
  desc.id = "only";
  desc.kind = "noop";
  auto graph = DependencyGraph::Build({desc}, silent);
  ExecutionEngine engine(graph, EngineConfig{}, silent);
  auto result = engine.Run();
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(result.outcomes.at("only").at("ran"), "yes");
}

// ============================================================
// D. Severity, omission and loose dependencies
// ============================================================

static ActionDescriptor LowSeverity(ActionDescriptor desc) {
  desc.severity = Severity::kLow;
  return desc;
}

static ActionDescriptor StrictOn(ActionDescriptor desc,
                                 std::set<std::string> deps) {
  desc.strict_dependencies = std::move(deps);
  return desc;
}

TEST_F(EngineTest, LowSeverityFailureEndsWarning) {
  auto engine = Make({
      LowSeverity(TestAction("lint", {}, {{"fail", "true"}})),
      TestAction("build", {"lint"}),
      StrictOn(TestAction("publish", {"lint"}), {"lint"}),
  });
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(StateOf(result, "lint"), ActionState::kWarning);
  EXPECT_EQ(result.Find("lint")->cause, "fail requested");
  EXPECT_EQ(result.Find("lint")->exit_code, std::optional<int>(7));
  EXPECT_EQ(StateOf(result, "build"), ActionState::kSuccess);
  EXPECT_EQ(StateOf(result, "publish"), ActionState::kSkipped);
  EXPECT_EQ(result.Find("publish")->cause, "dependency 'lint' ended WARNING");
}

TEST_F(EngineTest, LowSeverityRenderFailureEndsWarning) {
  EngineConfig config;
  config.render_policy = RenderPolicy::kStrict;
  auto engine = Make(
      {
          TestAction("A"),
          LowSeverity(TestAction("B", {"A"}, {{"cmd", "@{A.missing}"}})),
      },
      config);
  auto result = engine->Run();
  EXPECT_EQ(StateOf(result, "B"), ActionState::kWarning);
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
}

TEST_F(EngineTest, StrictTreatsWarningAsBlockingWithoutHalting) {
  EngineConfig config;
  config.strategy = "strict";
  auto engine = Make(
      {
          LowSeverity(TestAction("A", {}, {{"fail", "true"}})),
          TestAction("B", {"A"}),
          TestAction("C"),
      },
      config);
  auto result = engine->Run();
  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(StateOf(result, "A"), ActionState::kWarning);
  EXPECT_EQ(StateOf(result, "B"), ActionState::kSkipped);
  EXPECT_EQ(StateOf(result, "C"), ActionState::kSuccess);
}

TEST_F(EngineTest, DisabledActionIsOmitted) {
  auto a = TestAction("A", {}, {}, {{"path", "/srv"}});
  a.enabled = false;
  auto engine = Make({a, TestAction("B", {"A"}, {{"cmd", "[@{A.path}]"}})});
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kSuccess);
  EXPECT_EQ(StateOf(result, "A"), ActionState::kOmitted);
  EXPECT_EQ(result.Find("A")->cause, "disabled");
  EXPECT_FALSE(recorder_->WasStarted("A"));
  EXPECT_EQ(StateOf(result, "B"), ActionState::kSuccess);
  EXPECT_EQ(recorder_->Seen("B")["cmd"].Scalar(), "[]");
}

TEST_F(EngineTest, LooseRunsDependentsOfFailedProducers) {
  EngineConfig config;
  config.strategy = "loose";
  auto engine = Make(
      {
          TestAction("fetch", {}, {{"fail", "true"}}),
          TestAction("report", {"fetch"}, {{"msg", "got '@{fetch.path}'"}}),
          StrictOn(TestAction("deploy", {"fetch"}), {"fetch"}),
          TestAction("notify", {"report"}),
      },
      config);
  auto result = engine->Run();

  EXPECT_EQ(result.verdict, RunVerdict::kFailure);
  EXPECT_EQ(StateOf(result, "report"), ActionState::kSuccess);
  EXPECT_EQ(recorder_->Seen("report")["msg"].Scalar(), "got ''");
  EXPECT_EQ(StateOf(result, "deploy"), ActionState::kSkipped);
  EXPECT_EQ(result.Find("deploy")->cause, "dependency 'fetch' ended FAILURE");
  EXPECT_EQ(StateOf(result, "notify"), ActionState::kSuccess);
}
