#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include "miniflow/params.hpp"

namespace miniflow {

// ==========================================
// Action Runner Contract
// ==========================================

// Run-scoped, level-triggered cancellation flag. Once set it stays set.
class CancelSignal {
 public:
  void Set() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      flag_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool IsSet() const { return flag_.load(std::memory_order_acquire); }

  // Returns true as soon as the signal is set, false on timeout.
  template <class Rep, class Period>
  bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this] { return IsSet(); });
  }

 private:
  std::atomic<bool> flag_{false};
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
};

struct Outcome {
  std::map<std::string, std::string> values;
};

struct RunFailure {
  std::string cause;
  std::optional<int> exit_code;
};

struct Cancelled {
  std::string reason = "cancelled";
};

using ActionResult = std::variant<Outcome, RunFailure, Cancelled>;

using OutputFn = std::function<void(const std::string&)>;

// One implementation per action kind. Run() receives the rendered
// parameters of a single invocation and must poll or wait on `cancel`,
// returning Cancelled promptly once it is set.
class ActionRunner {
 public:
  virtual ~ActionRunner() = default;
  virtual ActionResult Run(const ParamNode& params,
                           const CancelSignal& cancel) = 0;
  virtual std::string Name() const = 0;

  // Installed by the engine before the first Run().
  void SetOutputSink(OutputFn sink) { sink_ = std::move(sink); }

 protected:
  void Emit(const std::string& line) const {
    if (sink_) sink_(line);
  }

 private:
  OutputFn sink_;
};

// Adapter layer: nothing a runner throws crosses this boundary.
inline ActionResult InvokeRunner(ActionRunner& runner, const ParamNode& params,
                                 const CancelSignal& cancel) {
  try {
    return runner.Run(params, cancel);
  } catch (const std::exception& e) {
    return RunFailure{runner.Name() + " runner error: " + e.what(),
                      std::nullopt};
  } catch (...) {
    return RunFailure{runner.Name() + " runner error: unknown exception",
                      std::nullopt};
  }
}

// Closed declared-set variant: an Outcome must carry exactly the declared
// keys. Actions that declare nothing are not checked.
inline ActionResult CheckDeclaredOutcomes(
    ActionResult result, const std::vector<std::string>& declared) {
  auto* outcome = std::get_if<Outcome>(&result);
  if (outcome == nullptr || declared.empty()) return result;

  std::vector<std::string> missing;
  for (const auto& key : declared) {
    if (!outcome->values.count(key)) missing.push_back(key);
  }
  std::vector<std::string> extra;
  for (const auto& [key, _] : outcome->values) {
    if (std::find(declared.begin(), declared.end(), key) == declared.end()) {
      extra.push_back(key);
    }
  }
  if (missing.empty() && extra.empty()) return result;

  auto join = [](const std::vector<std::string>& keys) {
    std::string out;
    for (const auto& k : keys) out += (out.empty() ? "" : ", ") + k;
    return out;
  };
  std::string cause = "Outcome keys do not match the declared set";
  if (!missing.empty()) cause += "; missing: [" + join(missing) + "]";
  if (!extra.empty()) cause += "; undeclared: [" + join(extra) + "]";
  return RunFailure{cause, std::nullopt};
}

// ==========================================
// Runner registry
// ==========================================
using RunnerCreator = std::function<std::shared_ptr<ActionRunner>()>;

class RunnerFactory {
 public:
  static RunnerFactory& Get() {
    static RunnerFactory f;
    return f;
  }

  void RegisterCreator(const std::string& kind, RunnerCreator c) {
    std::lock_guard<std::mutex> lock(mu_);
    creators_[kind] = std::move(c);
  }

  bool Has(const std::string& kind) const {
    std::lock_guard<std::mutex> lock(mu_);
    return creators_.count(kind) > 0;
  }

  std::shared_ptr<ActionRunner> Create(const std::string& kind) const {
    RunnerCreator creator;
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = creators_.find(kind);
      if (it == creators_.end()) {
        throw std::runtime_error("Unknown runner kind: " + kind);
      }
      creator = it->second;
    }
    return creator();
  }

  std::vector<std::string> Kinds() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> kinds;
    kinds.reserve(creators_.size());
    for (const auto& [k, _] : creators_) kinds.push_back(k);
    std::sort(kinds.begin(), kinds.end());
    return kinds;
  }

 private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, RunnerCreator> creators_;
};

#define REGISTER_RUNNER(Type, kind)                                    \
  static struct RunnerReg##Type {                                      \
    RunnerReg##Type() {                                                \
      ::miniflow::RunnerFactory::Get().RegisterCreator(                \
          kind, []() { return std::make_shared<Type>(); });            \
    }                                                                  \
  } runner_reg_##Type;

}  // namespace miniflow
