#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <subprocess.h>

#include "miniflow/runner.hpp"

extern char** environ;

namespace miniflow {

// ==========================================
// Child process plumbing for external runners
// ==========================================
struct ProcessSpec {
  std::vector<std::string> argv;
  // Complete child environment; nullopt inherits ours.
  std::optional<std::map<std::string, std::string>> env;
  bool search_path = true;
};

struct ProcessStatus {
  int exit_code = -1;
  bool cancelled = false;
};

using LineFn = std::function<void(const std::string&)>;

// Our own environment overlaid with `overrides`.
inline std::map<std::string, std::string> MergedEnvironment(
    const std::map<std::string, std::string>& overrides) {
  std::map<std::string, std::string> env;
  for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
    std::string entry(*e);
    size_t eq = entry.find('=');
    if (eq == std::string::npos) continue;
    env[entry.substr(0, eq)] = entry.substr(eq + 1);
  }
  for (const auto& [k, v] : overrides) env[k] = v;
  return env;
}

// Starts the process with stderr folded into stdout and stdin closed, feeds
// `on_line` each output line, and waits for exit. While it runs a watcher
// polls `cancel`; once set, `on_cancel` runs and the child is killed.
// Only the direct child is killed, not its descendants.
// Throws std::runtime_error if the process cannot be started.
inline ProcessStatus RunProcess(const ProcessSpec& spec,
                                const CancelSignal& cancel,
                                const LineFn& on_line,
                                const std::function<void()>& on_cancel = {}) {
  if (spec.argv.empty()) {
    throw std::runtime_error("Empty command line");
  }
  std::vector<const char*> argv;
  for (const auto& arg : spec.argv) argv.push_back(arg.c_str());
  argv.push_back(nullptr);

  int options = subprocess_option_enable_async |
                subprocess_option_combined_stdout_stderr;
  if (spec.search_path) options |= subprocess_option_search_user_path;

  std::vector<std::string> env_s;
  std::vector<const char*> env_c;
  if (spec.env) {
    for (const auto& [k, v] : *spec.env) env_s.push_back(k + "=" + v);
    for (const auto& entry : env_s) env_c.push_back(entry.c_str());
    env_c.push_back(nullptr);
  } else {
    options |= subprocess_option_inherit_environment;
  }

  struct subprocess_s proc;
  if (subprocess_create_ex(argv.data(), options,
                           spec.env ? env_c.data() : nullptr, &proc) != 0) {
    throw std::runtime_error("Cannot start process: " + spec.argv[0]);
  }
  if (FILE* in = subprocess_stdin(&proc)) {
    fclose(in);
    proc.stdin_file = nullptr;
  }

  std::atomic<bool> done{false};
  std::atomic<bool> cancelled{false};
  std::thread watcher([&] {
    while (!done.load(std::memory_order_acquire)) {
      if (cancel.WaitFor(std::chrono::milliseconds(20))) {
        cancelled.store(true, std::memory_order_release);
        if (on_cancel) on_cancel();
        subprocess_terminate(&proc);
        return;
      }
    }
  });

  auto finish = [&]() {
    done.store(true, std::memory_order_release);
    watcher.join();
    int code = -1;
    subprocess_join(&proc, &code);
    subprocess_destroy(&proc);
    return code;
  };

  try {
    char buffer[4096];
    std::string pending;
    auto flush_line = [&](std::string line) {
      if (!line.empty() && line.back() == '\r') line.pop_back();
      on_line(line);
    };
    while (true) {
      unsigned n = subprocess_read_stdout(&proc, buffer, sizeof(buffer));
      if (n == 0) break;
      pending.append(buffer, n);
      size_t pos;
      while ((pos = pending.find('\n')) != std::string::npos) {
        flush_line(pending.substr(0, pos));
        pending.erase(0, pos + 1);
      }
    }
    if (!pending.empty()) flush_line(pending);
  } catch (...) {
    subprocess_terminate(&proc);
    finish();
    throw;
  }

  ProcessStatus status;
  status.exit_code = finish();
  status.cancelled = cancelled.load(std::memory_order_acquire);
  return status;
}

// Short-lived helper command; output is discarded.
inline int RunToCompletion(const std::vector<std::string>& argv) {
  CancelSignal never;
  return RunProcess(ProcessSpec{argv, std::nullopt, true}, never,
                    [](const std::string&) {})
      .exit_code;
}

}  // namespace miniflow
