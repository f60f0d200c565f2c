#pragma once

#include <memory>

#include "miniflow/logging.hpp"
#include "miniflow/runner.hpp"
#include "miniflow/runners/docker_shell_runner.hpp"
#include "miniflow/runners/echo_runner.hpp"
#include "miniflow/runners/shell_runner.hpp"

namespace miniflow {

// Registers echo, shell and docker-shell.
inline void RegisterBundledRunners(RunnerFactory& factory,
                                   ShellOptions options = {}, LogFn log = {}) {
  factory.RegisterCreator("echo", [] { return std::make_shared<EchoRunner>(); });
  factory.RegisterCreator("shell", [options, log] {
    return std::make_shared<ShellRunner>(options, log);
  });
  factory.RegisterCreator("docker-shell", [options, log] {
    return std::make_shared<DockerShellRunner>(options, log);
  });
}

}  // namespace miniflow
