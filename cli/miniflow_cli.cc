#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "mini_flow.hpp"

using namespace miniflow;

namespace {

int g_signal_pipe[2] = {-1, -1};

extern "C" void OnTerminationSignal(int sig) {
  unsigned char byte = static_cast<unsigned char>(sig);
  // Nothing useful can be done about a full pipe inside a handler.
  ssize_t written = write(g_signal_pipe[1], &byte, 1);
  (void)written;
}

// The handler only feeds a self-pipe; cancellation happens on the watcher
// thread. Handlers are reset on exec, so action processes get the default
// dispositions.
void InstallSignalHandlers() {
  if (pipe(g_signal_pipe) != 0) {
    throw std::runtime_error("Cannot create signal pipe");
  }
  if (fcntl(g_signal_pipe[1], F_SETFL, O_NONBLOCK) != 0 ||
      fcntl(g_signal_pipe[0], F_SETFD, FD_CLOEXEC) != 0 ||
      fcntl(g_signal_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
    throw std::runtime_error("Cannot configure signal pipe");
  }
  struct sigaction sa;
  sa.sa_handler = OnTerminationSignal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  if (sigaction(SIGINT, &sa, nullptr) != 0 ||
      sigaction(SIGTERM, &sa, nullptr) != 0) {
    throw std::runtime_error("Cannot install signal handlers");
  }
}

// Turns a termination signal into engine cancellation for as long as it
// is in scope.
class CancelOnSignal {
 public:
  CancelOnSignal(ExecutionEngine& engine, LogFn log) {
    thread_ = std::thread([this, &engine, log] {
      pollfd fd{g_signal_pipe[0], POLLIN, 0};
      while (!stop_.load(std::memory_order_acquire)) {
        if (poll(&fd, 1, 100) <= 0) continue;
        unsigned char sig = 0;
        if (read(g_signal_pipe[0], &sig, 1) != 1) continue;
        if (log) {
          log(LogLevel::kWarn, std::string("Received ") +
                                   (sig == SIGINT ? "SIGINT" : "SIGTERM") +
                                   ", cancelling run");
        }
        engine.Cancel();
      }
    });
  }

  CancelOnSignal(const CancelOnSignal&) = delete;
  CancelOnSignal& operator=(const CancelOnSignal&) = delete;

  ~CancelOnSignal() {
    stop_.store(true, std::memory_order_release);
    thread_.join();
  }

 private:
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

}  // namespace

int main(int argc, char** argv) {
  // 1. Settings & logging
  Settings settings;
  LogFn log;
  try {
    settings = ResolveSettings(std::vector<std::string>(argv + 1, argv + argc));
    if (settings.show_help) {
      std::cout << Usage();
      return kExitSuccess;
    }
    log = settings.log_file.empty()
              ? StderrLogger(settings.log_level)
              : FileLogger(settings.log_file, settings.log_level);
  } catch (const std::exception& e) {
    std::cerr << "Configuration error: " << e.what() << "\n" << Usage();
    return kExitConfigError;
  }

  try {
    InstallSignalHandlers();

    // 2. Runner kinds: bundled, then plugins
    RegisterBundledRunners(RunnerFactory::Get(),
                           ShellOptions{settings.inject_yield_function}, log);
    if (!settings.plugin_dir.empty()) {
      PluginLoader plugins(log);
      plugins.LoadDirectory(settings.plugin_dir);
    }

    // 3. Workflow & graph
    Workflow workflow = WorkflowLoader::ParseFile(settings.workflow_file);
    auto graph = DependencyGraph::Build(std::move(workflow.actions), log);

    // 4. Engine
    ExecutionEngine engine(graph, settings.ToEngineConfig(), log);
    engine.SetContext(std::move(workflow.context));
    engine.SetEventListener([log](const LifecycleEvent& ev) {
      if (!log) return;
      log(LogLevel::kInfo, "[" + ev.action_id + "] " + ToString(ev.from) +
                               " -> " + ToString(ev.to) +
                               (ev.cause.empty() ? "" : ": " + ev.cause));
    });

    RunResult result;
    {
      CancelOnSignal cancel_on_signal(engine, log);
      result = engine.Run();
    }

    // 5. Report
    if (settings.report == ReportFormat::kJson) {
      std::cout << ToJson(result).dump(2) << std::endl;
    } else {
      std::cout << FormatTextReport(result);
    }
    return ExitCodeFor(result.verdict);
  } catch (const ValidationError& e) {
    std::cerr << "Invalid workflow (" << ToString(e.Kind()) << "): " << e.what()
              << std::endl;
    return ExitCodeForError(e);
  } catch (const ConfigError& e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return ExitCodeForError(e);
  } catch (const LoadError& e) {
    std::cerr << "Load error: " << e.what() << std::endl;
    return ExitCodeForError(e);
  } catch (const ConflictError& e) {
    std::cerr << "Internal invariant violated: " << e.what() << std::endl;
    return ExitCodeForError(e);
  } catch (const std::exception& e) {
    std::cerr << "Internal error: " << e.what() << std::endl;
    return ExitCodeForError(e);
  }
}
