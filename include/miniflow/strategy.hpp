#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "miniflow/action_state.hpp"
#include "miniflow/errors.hpp"
#include "miniflow/graph.hpp"

namespace miniflow {

// ==========================================
// Execution Strategy
// ==========================================

// Counting resource bounding the number of concurrently running actions.
// Only touched from the engine thread.
class ConcurrencyLimiter {
 public:
  explicit ConcurrencyLimiter(size_t limit = 0) : limit_(limit) {}

  bool TryAcquire() {
    if (limit_ != 0 && in_use_ >= limit_) return false;
    ++in_use_;
    return true;
  }

  void Release() {
    if (in_use_ > 0) --in_use_;
  }

  // Unbounded limiters always report one free slot.
  size_t Available() const {
    if (limit_ == 0) return 1;
    return limit_ > in_use_ ? limit_ - in_use_ : 0;
  }

  size_t Limit() const { return limit_; }
  size_t InUse() const { return in_use_; }

 private:
  size_t limit_;
  size_t in_use_ = 0;
};

struct SchedulingView {
  const DependencyGraph& graph;
  const std::vector<ActionState>& states;
  size_t in_flight;
};

struct Decision {
  std::vector<int> dispatch;
  std::vector<int> defer;
  std::vector<int> skip;
  bool halt = false;
};

// Forward reachability over dependents from every FAILURE/CANCELLED node.
inline std::unordered_set<int> BlockedByFailure(
    const DependencyGraph& graph, const std::vector<ActionState>& states) {
  std::unordered_set<int> blocked;
  std::queue<int> bfs;
  for (size_t i = 0; i < states.size(); ++i) {
    if (IsFailed(states[i])) bfs.push(static_cast<int>(i));
  }
  while (!bfs.empty()) {
    int cur = bfs.front();
    bfs.pop();
    for (int child : graph.Children(cur)) {
      if (blocked.insert(child).second) bfs.push(child);
    }
  }
  return blocked;
}

// A skipped parent blocks its dependents as well. A WARNING parent blocks
// only over a strict edge, or over every edge when `all_strict` is set.
inline bool IsBlocked(const SchedulingView& view,
                      const std::unordered_set<int>& blocked, int index,
                      bool all_strict = false) {
  if (blocked.count(index)) return true;
  for (int p : view.graph.Parents(index)) {
    ActionState s = view.states[p];
    if (s == ActionState::kSkipped) return true;
    if (s == ActionState::kWarning &&
        (all_strict || view.graph.IsStrictEdge(p, index))) {
      return true;
    }
  }
  return false;
}

// Loose rule: only strict edges carry a parent's FAILURE, CANCELLED,
// SKIPPED or WARNING forward.
inline bool IsBlockedByStrictEdge(const SchedulingView& view, int index) {
  for (int p : view.graph.Parents(index)) {
    ActionState s = view.states[p];
    bool bad = IsFailed(s) || s == ActionState::kSkipped ||
               s == ActionState::kWarning;
    if (bad && view.graph.IsStrictEdge(p, index)) return true;
  }
  return false;
}

class ExecutionStrategy {
 public:
  virtual ~ExecutionStrategy() = default;
  virtual std::string Name() const = 0;

  // `ready` holds every PENDING/READY action whose dependencies are all
  // terminal, sorted by topological position. Each index must land in
  // exactly one of dispatch, defer or skip.
  virtual Decision Plan(const SchedulingView& view,
                        const std::vector<int>& ready) = 0;

  // Called once for every dispatched action when it reaches a terminal state.
  virtual void OnActionFinished(int index, ActionState state) = 0;
};

// Maximum concurrency; failures only stop their own descendants.
class FreeStrategy : public ExecutionStrategy {
 public:
  explicit FreeStrategy(size_t limit = 0) : limiter_(limit) {}

  std::string Name() const override { return "free"; }

  Decision Plan(const SchedulingView& view,
                const std::vector<int>& ready) override {
    Decision d;
    auto blocked = BlockedByFailure(view.graph, view.states);
    for (int idx : ready) {
      if (IsBlocked(view, blocked, idx)) {
        d.skip.push_back(idx);
      } else if (limiter_.TryAcquire()) {
        d.dispatch.push_back(idx);
      } else {
        d.defer.push_back(idx);
      }
    }
    return d;
  }

  void OnActionFinished(int, ActionState) override { limiter_.Release(); }

 private:
  ConcurrencyLimiter limiter_;
};

// Single lane in topological order; the first failure halts the run.
// Every edge counts as strict, so dependents of a WARNING are skipped.
class StrictStrategy : public ExecutionStrategy {
 public:
  explicit StrictStrategy(std::string name = "strict") : name_(std::move(name)) {}

  std::string Name() const override { return name_; }

  Decision Plan(const SchedulingView& view,
                const std::vector<int>& ready) override {
    Decision d;
    if (halted_) {
      d.skip = ready;
      d.halt = true;
      return d;
    }
    bool lane_busy = view.in_flight > 0;
    for (int idx : ready) {
      if (IsBlocked(view, {}, idx, true)) {
        d.skip.push_back(idx);
      } else if (!lane_busy) {
        d.dispatch.push_back(idx);
        lane_busy = true;
      } else {
        d.defer.push_back(idx);
      }
    }
    return d;
  }

  void OnActionFinished(int, ActionState state) override {
    if (IsFailed(state)) halted_ = true;
  }

 private:
  std::string name_;
  bool halted_ = false;
};

// Single lane like strict, but failures only skip their descendants.
class SequentialStrategy : public ExecutionStrategy {
 public:
  std::string Name() const override { return "sequential"; }

  Decision Plan(const SchedulingView& view,
                const std::vector<int>& ready) override {
    Decision d;
    auto blocked = BlockedByFailure(view.graph, view.states);
    bool lane_busy = view.in_flight > 0;
    for (int idx : ready) {
      if (IsBlocked(view, blocked, idx)) {
        d.skip.push_back(idx);
      } else if (!lane_busy) {
        d.dispatch.push_back(idx);
        lane_busy = true;
      } else {
        d.defer.push_back(idx);
      }
    }
    return d;
  }

  void OnActionFinished(int, ActionState) override {}
};

// Like free, but a finished parent only matters over a strict edge: the
// dependent of a failed producer still runs unless it asked otherwise.
class LooseStrategy : public ExecutionStrategy {
 public:
  explicit LooseStrategy(size_t limit = 0) : limiter_(limit) {}

  std::string Name() const override { return "loose"; }

  Decision Plan(const SchedulingView& view,
                const std::vector<int>& ready) override {
    Decision d;
    for (int idx : ready) {
      if (IsBlockedByStrictEdge(view, idx)) {
        d.skip.push_back(idx);
      } else if (limiter_.TryAcquire()) {
        d.dispatch.push_back(idx);
      } else {
        d.defer.push_back(idx);
      }
    }
    return d;
  }

  void OnActionFinished(int, ActionState) override { limiter_.Release(); }

 private:
  ConcurrencyLimiter limiter_;
};

// ==========================================
// Strategy registry
// ==========================================
using StrategyCreator =
    std::function<std::unique_ptr<ExecutionStrategy>(size_t limit)>;

class StrategyFactory {
 public:
  static StrategyFactory& Get() {
    static StrategyFactory f;
    return f;
  }

  void Register(const std::string& name, StrategyCreator c) {
    std::lock_guard<std::mutex> lock(mu_);
    creators_[name] = std::move(c);
  }

  bool Has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mu_);
    return creators_.count(name) > 0;
  }

  std::unique_ptr<ExecutionStrategy> Create(const std::string& name,
                                            size_t limit = 0) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = creators_.find(name);
    if (it == creators_.end()) {
      throw ConfigError("Unknown strategy '" + name + "', expected one of: " +
                        JoinIds(NamesLocked(), " | "));
    }
    return it->second(limit);
  }

  std::vector<std::string> Names() const {
    std::lock_guard<std::mutex> lock(mu_);
    return NamesLocked();
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, StrategyCreator> creators_;

  StrategyFactory() {
    creators_["free"] = [](size_t limit) {
      return std::make_unique<FreeStrategy>(limit);
    };
    creators_["strict"] = [](size_t) {
      return std::make_unique<StrictStrategy>();
    };
    creators_["sequential"] = [](size_t) {
      return std::make_unique<SequentialStrategy>();
    };
    creators_["strict-sequential"] = [](size_t) {
      return std::make_unique<StrictStrategy>("strict-sequential");
    };
    creators_["loose"] = [](size_t limit) {
      return std::make_unique<LooseStrategy>(limit);
    };
  }

  std::vector<std::string> NamesLocked() const {
    std::vector<std::string> names;
    for (const auto& [k, _] : creators_) names.push_back(k);
    std::sort(names.begin(), names.end());
    return names;
  }
};

}  // namespace miniflow
