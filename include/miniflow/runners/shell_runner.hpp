#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "miniflow/errors.hpp"
#include "miniflow/logging.hpp"
#include "miniflow/params.hpp"
#include "miniflow/runner.hpp"
#include "miniflow/runners/process.hpp"
#include "miniflow/runners/service_messages.hpp"

namespace miniflow {

struct ShellOptions {
  // Prepend the yield_outcome helper to every script.
  bool inject_yield_function = true;
};

// Single-quotes `value` for POSIX sh.
inline std::string ShellQuote(const std::string& value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

// Common part of runners that execute a shell script and scan its output
// for service messages.
class ScriptRunnerBase : public ActionRunner {
 public:
  ScriptRunnerBase(ShellOptions options, LogFn log)
      : options_(options), log_(std::move(log)) {}

 protected:
  ShellOptions options_;
  LogFn log_;

  std::string WithHelpers(const std::string& script) const {
    if (!options_.inject_yield_function) return script;
    return std::string(YieldOutcomeFunction()) + script;
  }

  ActionResult Execute(const ProcessSpec& spec, const CancelSignal& cancel,
                       const std::function<void()>& on_cancel = {}) {
    ServiceMessageScanner scanner(log_);
    ProcessStatus status = RunProcess(
        spec, cancel,
        [&](const std::string& line) {
          if (auto text = scanner.Feed(line)) Emit(*text);
        },
        on_cancel);
    if (status.cancelled) {
      return Cancelled{"terminated on cancellation"};
    }
    if (status.exit_code != 0) {
      return RunFailure{"Exit code: " + std::to_string(status.exit_code),
                        status.exit_code};
    }
    return Outcome{scanner.Outcomes()};
  }
};

// Params: `command` or `file` (exactly one), optional `environment` map
// merged over the inherited environment, optional `cwd`.
class ShellRunner : public ScriptRunnerBase {
 public:
  explicit ShellRunner(ShellOptions options = {}, LogFn log = {})
      : ScriptRunnerBase(options, std::move(log)) {}

  std::string Name() const override { return "shell"; }

  ActionResult Run(const ParamNode& params,
                   const CancelSignal& cancel) override {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", BuildScript(params)};
    spec.search_path = false;
    if (params.Has("environment")) {
      const ParamNode& env = params["environment"];
      if (!env.IsMap()) {
        throw ConfigError("'environment' must be a mapping");
      }
      spec.env = MergedEnvironment(env.AsStringMap());
    }
    return Execute(spec, cancel);
  }

  std::string BuildScript(const ParamNode& params) const {
    bool has_command = params.Has("command");
    bool has_file = params.Has("file");
    if (has_command == has_file) {
      throw ConfigError(has_command ? "Both command and file specified"
                                    : "Neither command nor file specified");
    }
    std::string body =
        has_command ? params["command"].AsRequired<std::string>("'command'")
                    : ". " + ShellQuote(params["file"].AsRequired<std::string>(
                                 "'file'"));
    std::string script;
    if (params.Has("cwd")) {
      script += "cd " +
                ShellQuote(params["cwd"].AsRequired<std::string>("'cwd'")) +
                " || exit 1\n";
    }
    script += body;
    return WithHelpers(script);
  }
};

}  // namespace miniflow
