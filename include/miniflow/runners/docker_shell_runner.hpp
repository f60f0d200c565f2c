#pragma once

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "miniflow/errors.hpp"
#include "miniflow/logging.hpp"
#include "miniflow/params.hpp"
#include "miniflow/runner.hpp"
#include "miniflow/runners/process.hpp"
#include "miniflow/runners/shell_runner.hpp"

namespace miniflow {

// ==========================================
// docker-shell: shell script inside a container
// ==========================================
constexpr const char kContainerTmpDir[] = "/tmp-miniflow";

struct BindMount {
  std::string src;
  std::string dest;
  bool read_only = false;
};

struct DockerShellSpec {
  std::string image;
  std::string command;
  std::map<std::string, std::string> environment;
  std::string cwd;
  bool pull = false;
  std::string executable = "/bin/sh";
  std::vector<BindMount> binds;
  std::string network = "bridge";
  bool privileged = false;
  std::string cli = "docker";
};

inline DockerShellSpec ParseDockerShellSpec(const ParamNode& params) {
  DockerShellSpec spec;
  if (!params.Has("image") || !params.Has("command")) {
    throw ConfigError("docker-shell requires 'image' and 'command'");
  }
  spec.image = params["image"].AsRequired<std::string>("'image'");
  spec.command = params["command"].AsRequired<std::string>("'command'");
  if (params.Has("environment")) {
    spec.environment = params["environment"].AsStringMap();
  }
  spec.cwd = params["cwd"].As<std::string>();
  spec.pull = params["pull"].As<bool>(false);
  spec.executable = params["executable"].As<std::string>(spec.executable);
  spec.privileged = params["privileged"].As<bool>(false);
  spec.cli = params["cli"].As<std::string>(spec.cli);

  spec.network = params["network"].As<std::string>(spec.network);
  if (spec.network != "bridge" && spec.network != "host" &&
      spec.network != "none") {
    throw ConfigError("Unsupported network mode '" + spec.network +
                      "' (expected bridge, host or none)");
  }

  for (const auto& item : params["bind"]) {
    BindMount bind;
    bind.src = item["src"].AsRequired<std::string>("bind 'src'");
    bind.dest = item["dest"].AsRequired<std::string>("bind 'dest'");
    std::string mode = item["mode"].As<std::string>("rw");
    if (mode != "ro" && mode != "rw") {
      throw ConfigError("Unsupported bind mode '" + mode +
                        "' (expected ro or rw)");
    }
    bind.read_only = mode == "ro";
    spec.binds.push_back(std::move(bind));
  }
  return spec;
}

// `<cli> run` command line for the container executing `entry_host_path`.
inline std::vector<std::string> BuildDockerRunArgs(
    const DockerShellSpec& spec, const std::string& container_name,
    const std::string& entry_host_path) {
  const std::string entry_in_container =
      std::string(kContainerTmpDir) + "/entry.sh";
  std::vector<std::string> args = {spec.cli, "run",   "--rm",
                                   "--init", "--name", container_name};
  if (spec.pull) {
    args.insert(args.end(), {"--pull", "always"});
  }
  args.insert(args.end(), {"--network", spec.network});
  if (spec.privileged) args.push_back("--privileged");
  for (const auto& [k, v] : spec.environment) {
    args.insert(args.end(), {"-e", k + "=" + v});
  }
  for (const auto& bind : spec.binds) {
    args.insert(args.end(), {"-v", bind.src + ":" + bind.dest +
                                       (bind.read_only ? ":ro" : ":rw")});
  }
  args.insert(args.end(),
              {"-v", entry_host_path + ":" + entry_in_container + ":ro"});
  if (!spec.cwd.empty()) {
    args.insert(args.end(), {"-w", spec.cwd});
  }
  args.insert(args.end(), {spec.image, spec.executable, entry_in_container});
  return args;
}

// Private scratch directory removed on scope exit.
class TempDir {
 public:
  TempDir() {
    std::string tmpl =
        (std::filesystem::temp_directory_path() / "miniflow-XXXXXX").string();
    if (mkdtemp(tmpl.data()) == nullptr) {
      throw std::runtime_error("Cannot create temporary directory");
    }
    path_ = tmpl;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::string& Path() const { return path_; }

 private:
  std::string path_;
};

inline std::string UniqueContainerName() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::ostringstream os;
  os << "miniflow-docker-shell-" << std::hex << gen() << gen();
  return os.str();
}

class DockerShellRunner : public ScriptRunnerBase {
 public:
  explicit DockerShellRunner(ShellOptions options = {}, LogFn log = {})
      : ScriptRunnerBase(options, std::move(log)) {}

  std::string Name() const override { return "docker-shell"; }

  ActionResult Run(const ParamNode& params,
                   const CancelSignal& cancel) override {
    DockerShellSpec spec = ParseDockerShellSpec(params);

    TempDir tmp;
    std::string entry = tmp.Path() + "/entry.sh";
    {
      std::ofstream out(entry);
      out << WithHelpers(spec.command) << "\n";
      if (!out) {
        throw std::runtime_error("Cannot write entry script " + entry);
      }
    }
    // The container user is not necessarily us.
    if (chmod(tmp.Path().c_str(), 0755) != 0 ||
        chmod(entry.c_str(), 0755) != 0) {
      throw std::runtime_error("Cannot make " + entry + " readable");
    }

    std::string name = UniqueContainerName();
    if (log_) {
      log_(LogLevel::kInfo, "[docker-shell] Starting container " + name +
                                " from " + spec.image);
    }
    ProcessSpec process;
    process.argv = BuildDockerRunArgs(spec, name, entry);
    return Execute(process, cancel, [this, &spec, &name] {
      try {
        int rc = RunToCompletion({spec.cli, "kill", name});
        if (rc != 0 && log_) {
          log_(LogLevel::kWarn, "[docker-shell] '" + spec.cli + " kill " +
                                    name + "' exited with " +
                                    std::to_string(rc));
        }
      } catch (const std::exception& e) {
        if (log_) {
          log_(LogLevel::kWarn,
               std::string("[docker-shell] Cannot kill container: ") +
                   e.what());
        }
      }
    });
  }
};

}  // namespace miniflow
