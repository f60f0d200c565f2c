#pragma once

#include <dlfcn.h>

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "miniflow/errors.hpp"
#include "miniflow/logging.hpp"

namespace miniflow {

// ==========================================
// Runner plugin discovery
// ==========================================

// Shared objects register their runner kinds from static initializers
// (REGISTER_RUNNER) when they are opened. Handles stay open for the life of
// the process since the registered creators point into them.
class PluginLoader {
 public:
  explicit PluginLoader(LogFn log = {}) : log_(std::move(log)) {}

  // Loads every *.so directly inside `dir`, in name order.
  void LoadDirectory(const std::string& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
      throw LoadError("Plugin directory not found", dir);
    }
    std::vector<std::string> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
      if (entry.is_regular_file() && entry.path().extension() == ".so") {
        files.push_back(entry.path().string());
      }
    }
    if (ec) {
      throw LoadError("Cannot list plugin directory: " + ec.message(), dir);
    }
    std::sort(files.begin(), files.end());
    for (const auto& file : files) LoadFile(file);
    LogMsg(LogLevel::kInfo, "[Plugins] Loaded " + std::to_string(files.size()) +
                                " plugin(s) from " + dir);
  }

  void LoadFile(const std::string& path) {
    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_GLOBAL);
    if (handle == nullptr) {
      const char* err = dlerror();
      throw LoadError(err != nullptr ? err : "dlopen failed", path);
    }
    loaded_.push_back(path);
    LogMsg(LogLevel::kDebug, "[Plugins] Opened " + path);
  }

  const std::vector<std::string>& Loaded() const { return loaded_; }

 private:
  LogFn log_;
  std::vector<std::string> loaded_;

  void LogMsg(LogLevel level, const std::string& msg) const {
    if (log_) log_(level, msg);
  }
};

}  // namespace miniflow
