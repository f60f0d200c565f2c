#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "miniflow/action_state.hpp"
#include "miniflow/errors.hpp"
#include "miniflow/graph.hpp"
#include "miniflow/interpolator.hpp"
#include "miniflow/ledger.hpp"
#include "miniflow/logging.hpp"
#include "miniflow/report.hpp"
#include "miniflow/runner.hpp"
#include "miniflow/strategy.hpp"
#include "miniflow/thread_pool.hpp"

namespace miniflow {

// ==========================================
// Execution Engine
// ==========================================
struct EngineConfig {
  std::string strategy = "free";
  size_t concurrency_limit = 0;  // 0: unbounded
  RenderPolicy render_policy = RenderPolicy::kLenient;
  bool enforce_declared_outcomes = false;
  std::chrono::milliseconds cancel_grace{5000};
};

struct LifecycleEvent {
  std::string action_id;
  ActionState from;
  ActionState to;
  std::chrono::system_clock::time_point timestamp;
  std::string cause;
};

using EventFn = std::function<void(const LifecycleEvent&)>;

// Completions flow from pool workers to the single engine loop.
class CompletionChannel {
 public:
  struct Completion {
    int index;
    ActionResult result;
  };

  void Push(Completion c) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      items_.push_back(std::move(c));
    }
    cv_.notify_one();
  }

  // Unblocks a pending Drain() without delivering anything.
  void Wake() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      woken_ = true;
    }
    cv_.notify_one();
  }

  // Blocks until something was pushed, Wake() was called, or the deadline
  // passed. May return an empty batch.
  std::vector<Completion> Drain(
      std::optional<std::chrono::steady_clock::time_point> deadline) {
    std::unique_lock<std::mutex> lock(mu_);
    auto ready = [this] { return woken_ || !items_.empty(); };
    if (deadline) {
      cv_.wait_until(lock, *deadline, ready);
    } else {
      cv_.wait(lock, ready);
    }
    woken_ = false;
    std::vector<Completion> out(std::make_move_iterator(items_.begin()),
                                std::make_move_iterator(items_.end()));
    items_.clear();
    return out;
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Completion> items_;
  bool woken_ = false;
};

// One engine per run. The engine thread (the caller of Run) is the only
// mutator of action state and of the ledger; runner bodies execute on the
// pool and hand their results back through the completion channel.
class ExecutionEngine {
 public:
  ExecutionEngine(std::shared_ptr<const DependencyGraph> graph,
                  EngineConfig config, LogFn log = {},
                  const RunnerFactory& factory = RunnerFactory::Get())
      : graph_(std::move(graph)),
        config_(std::move(config)),
        log_(std::move(log)),
        interpolator_(config_.render_policy),
        states_(graph_->Size(), ActionState::kPending),
        reports_(graph_->Size()),
        started_at_(graph_->Size()),
        cancel_(std::make_shared<CancelSignal>()),
        channel_(std::make_shared<CompletionChannel>()) {
    CreateRunners(factory);
    strategy_ = StrategyFactory::Get().Create(config_.strategy,
                                              config_.concurrency_limit);
    interpolator_.SetStatusLookup(
        [this](const std::string& id) -> std::optional<std::string> {
          int index = graph_->IndexOf(id);
          if (index < 0) return std::nullopt;
          return std::string(ToString(states_[index]));
        });
    for (size_t i = 0; i < graph_->Size(); ++i) {
      reports_[i].id = graph_->Descriptor(static_cast<int>(i)).id;
    }
  }

  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  // Runners that outlived the cancel grace period are not waited for: their
  // workers are detached and their late results go nowhere.
  ~ExecutionEngine() {
    if (pool_ && abandon_pool_) {
      size_t stragglers = pool_->Abandon();
      if (stragglers > 0) {
        LogMsg(LogLevel::kWarn, "[Engine] Leaving " +
                                    std::to_string(stragglers) +
                                    " runner(s) behind after cancellation");
      }
    }
  }

  void SetEventListener(EventFn fn) { listener_ = std::move(fn); }

  void SetContext(std::map<std::string, std::string> context) {
    interpolator_.SetContext(std::move(context));
  }

  // Safe from any thread, including before Run().
  void Cancel() {
    cancel_->Set();
    channel_->Wake();
  }

  const OutcomeLedger& Ledger() const { return ledger_; }
  const std::vector<ActionState>& States() const { return states_; }
  const ExecutionStrategy& Strategy() const { return *strategy_; }

  RunResult Run() {
    if (ran_) {
      throw std::logic_error("ExecutionEngine::Run may only be called once");
    }
    ran_ = true;

    auto t0 = std::chrono::steady_clock::now();
    size_t workers = config_.concurrency_limit != 0 ? config_.concurrency_limit
                                                    : graph_->Size();
    pool_ = std::make_unique<ThreadPool>(workers);
    LogMsg(LogLevel::kInfo, "[Engine] Run started. Strategy: " +
                                strategy_->Name() + ", Actions: " +
                                std::to_string(graph_->Size()) +
                                ", Workers: " + std::to_string(pool_->Size()));
    OmitDisabled();
    try {
      Loop();
    } catch (...) {
      // In-flight runners must stop; nobody waits for them any more.
      cancel_->Set();
      abandon_pool_ = true;
      throw;
    }

    RunResult result;
    result.actions = reports_;
    result.verdict = ComputeVerdict(result.actions);
    result.outcomes = ledger_.Snapshot();
    result.total_us = ElapsedUs(t0);
    LogMsg(LogLevel::kInfo, std::string("[Engine] Run finished: ") +
                                ToString(result.verdict) + " (" +
                                std::to_string(result.total_us) + "us)");
    return result;
  }

 private:
  std::shared_ptr<const DependencyGraph> graph_;
  EngineConfig config_;
  LogFn log_;
  EventFn listener_;
  std::vector<std::shared_ptr<ActionRunner>> runners_;
  std::unique_ptr<ExecutionStrategy> strategy_;
  Interpolator interpolator_;
  OutcomeLedger ledger_;
  std::vector<ActionState> states_;
  std::vector<ActionReport> reports_;
  std::vector<std::chrono::steady_clock::time_point> started_at_;
  std::shared_ptr<CancelSignal> cancel_;
  std::shared_ptr<CompletionChannel> channel_;
  size_t in_flight_ = 0;
  bool ran_ = false;
  bool abandon_pool_ = false;
  std::string first_failure_;
  // Declared last: destroyed first. Joins its workers unless abandoned.
  std::unique_ptr<ThreadPool> pool_;

  void LogMsg(LogLevel level, const std::string& msg) const {
    if (log_) log_(level, msg);
  }

  static int64_t ElapsedUs(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::steady_clock::now() - since)
        .count();
  }

  void CreateRunners(const RunnerFactory& factory) {
    std::set<std::string> unknown;
    std::vector<std::string> offenders;
    for (const auto& desc : graph_->Descriptors()) {
      if (!factory.Has(desc.kind)) {
        unknown.insert(desc.kind);
        offenders.push_back(desc.id);
      }
    }
    if (!unknown.empty()) {
      throw ValidationError(
          ValidationErrorKind::kUnknownRunnerKind,
          "Unknown action kinds: [" +
              JoinIds(std::vector<std::string>(unknown.begin(), unknown.end())) +
              "] used by [" + JoinIds(offenders) + "]",
          offenders);
    }
    runners_.reserve(graph_->Size());
    for (const auto& desc : graph_->Descriptors()) {
      auto runner = factory.Create(desc.kind);
      runner->SetOutputSink([log = log_, id = desc.id](const std::string& line) {
        if (log) log(LogLevel::kInfo, "[" + id + "] " + line);
      });
      runners_.push_back(std::move(runner));
    }
  }

  bool AllTerminal() const {
    for (ActionState s : states_) {
      if (!IsTerminal(s)) return false;
    }
    return true;
  }

  void OmitDisabled() {
    for (size_t i = 0; i < states_.size(); ++i) {
      if (!graph_->Descriptor(static_cast<int>(i)).enabled) {
        Transition(static_cast<int>(i), ActionState::kOmitted, "disabled");
      }
    }
  }

  void Loop() {
    while (!AllTerminal()) {
      if (cancel_->IsSet()) {
        DrainCancelled();
        return;
      }
      bool progressed = Schedule();
      if (AllTerminal()) break;
      if (cancel_->IsSet()) continue;
      if (in_flight_ == 0) {
        if (!progressed) {
          throw std::logic_error("[Engine] Strategy '" + strategy_->Name() +
                                 "' stalled with no action in flight");
        }
        continue;
      }
      for (auto& c : channel_->Drain(std::nullopt)) {
        Complete(c.index, std::move(c.result));
      }
    }
  }

  // One planning round. Returns true if any action was skipped, dispatched
  // or failed during dispatch.
  bool Schedule() {
    std::vector<int> ready;
    for (int idx : graph_->TopologicalOrder()) {
      if (states_[idx] != ActionState::kPending &&
          states_[idx] != ActionState::kReady) {
        continue;
      }
      bool deps_done = true;
      for (int p : graph_->Parents(idx)) {
        if (!IsTerminal(states_[p])) {
          deps_done = false;
          break;
        }
      }
      if (deps_done) ready.push_back(idx);
    }
    if (ready.empty()) return false;

    Decision d = strategy_->Plan(SchedulingView{*graph_, states_, in_flight_},
                                 ready);
    bool progressed = false;
    for (int idx : d.skip) {
      Transition(idx, ActionState::kSkipped, SkipCause(idx));
      progressed = true;
    }
    for (int idx : d.defer) {
      if (states_[idx] == ActionState::kPending) {
        Transition(idx, ActionState::kReady, "");
      }
    }
    for (int idx : d.dispatch) {
      // The rest of the batch is cancelled before dispatch.
      if (cancel_->IsSet()) break;
      Dispatch(idx);
      progressed = true;
    }
    if (d.halt) {
      for (size_t i = 0; i < states_.size(); ++i) {
        if (states_[i] == ActionState::kPending ||
            states_[i] == ActionState::kReady) {
          Transition(static_cast<int>(i), ActionState::kSkipped,
                     SkipCause(static_cast<int>(i)));
          progressed = true;
        }
      }
    }
    return progressed;
  }

  std::string SkipCause(int idx) const {
    for (int p : graph_->Parents(idx)) {
      ActionState s = states_[p];
      if (IsFailed(s) || s == ActionState::kSkipped ||
          s == ActionState::kWarning) {
        return "dependency '" + graph_->Descriptor(p).id + "' ended " +
               ToString(s);
      }
    }
    if (!first_failure_.empty()) {
      return "run halted after failure of '" + first_failure_ + "'";
    }
    return "skipped by strategy '" + strategy_->Name() + "'";
  }

  void Dispatch(int idx) {
    const auto& desc = graph_->Descriptor(idx);
    if (states_[idx] == ActionState::kPending) {
      Transition(idx, ActionState::kReady, "");
    }

    ParamNode params;
    try {
      params = interpolator_.Render(desc.params, ledger_);
    } catch (const RenderError& e) {
      LogMsg(LogLevel::kError, "[Engine] Cannot render parameters of '" +
                                   desc.id + "': " + e.what());
      Finish(idx, ActionState::kFailure,
             std::string("render failed: ") + e.what(), std::nullopt);
      return;
    }

    started_at_[idx] = std::chrono::steady_clock::now();
    Transition(idx, ActionState::kRunning, "");
    ++in_flight_;

    auto runner = runners_[idx];
    auto cancel = cancel_;
    auto channel = channel_;
    pool_->Enqueue([idx, runner, params = std::move(params), cancel, channel] {
      channel->Push({idx, InvokeRunner(*runner, params, *cancel)});
    });
  }

  void Complete(int idx, ActionResult result) {
    if (states_[idx] != ActionState::kRunning) {
      LogMsg(LogLevel::kDebug, "[Engine] Discarding late result of '" +
                                   graph_->Descriptor(idx).id + "'");
      return;
    }
    --in_flight_;
    reports_[idx].duration_us = ElapsedUs(started_at_[idx]);

    const auto& desc = graph_->Descriptor(idx);
    if (config_.enforce_declared_outcomes) {
      result = CheckDeclaredOutcomes(std::move(result), desc.outcomes);
    }

    if (auto* outcome = std::get_if<Outcome>(&result)) {
      for (auto& [key, value] : outcome->values) {
        ledger_.Put(desc.id, key, std::move(value));
      }
      Finish(idx, ActionState::kSuccess, "", std::nullopt);
    } else if (auto* failure = std::get_if<RunFailure>(&result)) {
      Finish(idx, ActionState::kFailure, failure->cause, failure->exit_code);
    } else {
      Finish(idx, ActionState::kCancelled, std::get<Cancelled>(result).reason,
             std::nullopt);
    }
  }

  // Terminal transition of a dispatched action. Low-severity actions fail
  // with WARNING.
  void Finish(int idx, ActionState state, const std::string& cause,
              std::optional<int> exit_code) {
    if (state == ActionState::kFailure &&
        graph_->Descriptor(idx).severity == Severity::kLow) {
      state = ActionState::kWarning;
    }
    reports_[idx].exit_code = exit_code;
    Transition(idx, state, cause);
    if (IsFailed(state) && first_failure_.empty()) {
      first_failure_ = graph_->Descriptor(idx).id;
    }
    strategy_->OnActionFinished(idx, state);
  }

  void DrainCancelled() {
    LogMsg(LogLevel::kWarn, "[Engine] Run cancelled with " +
                                std::to_string(in_flight_) +
                                " action(s) in flight");
    for (size_t i = 0; i < states_.size(); ++i) {
      if (states_[i] == ActionState::kPending ||
          states_[i] == ActionState::kReady) {
        Transition(static_cast<int>(i), ActionState::kCancelled,
                   "run cancelled before dispatch");
      }
    }

    auto deadline = std::chrono::steady_clock::now() + config_.cancel_grace;
    while (in_flight_ > 0) {
      auto batch = channel_->Drain(deadline);
      for (auto& c : batch) Complete(c.index, std::move(c.result));
      if (batch.empty() && std::chrono::steady_clock::now() >= deadline) break;
    }

    for (size_t i = 0; i < states_.size(); ++i) {
      if (states_[i] != ActionState::kRunning) continue;
      int idx = static_cast<int>(i);
      LogMsg(LogLevel::kWarn, "[Engine] Action '" + graph_->Descriptor(idx).id +
                                  "' did not stop within " +
                                  std::to_string(config_.cancel_grace.count()) +
                                  "ms");
      reports_[idx].duration_us = ElapsedUs(started_at_[idx]);
      Finish(idx, ActionState::kCancelled, "did not stop within grace period",
             std::nullopt);
      abandon_pool_ = true;
    }
    in_flight_ = 0;
  }

  void Transition(int idx, ActionState to, const std::string& cause) {
    ActionState from = states_[idx];
    states_[idx] = to;
    reports_[idx].state = to;
    if (!cause.empty()) reports_[idx].cause = cause;
    const std::string& id = graph_->Descriptor(idx).id;
    LogMsg(LogLevel::kDebug, "[Engine] " + id + ": " + ToString(from) +
                                 " -> " + ToString(to) +
                                 (cause.empty() ? "" : " (" + cause + ")"));
    if (!listener_) return;
    try {
      listener_(LifecycleEvent{id, from, to, std::chrono::system_clock::now(),
                               cause});
    } catch (const std::exception& e) {
      LogMsg(LogLevel::kWarn,
             std::string("[Engine] Event listener threw: ") + e.what());
    }
  }
};

}  // namespace miniflow
