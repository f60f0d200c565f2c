#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "miniflow/engine.hpp"
#include "miniflow/errors.hpp"
#include "miniflow/interpolator.hpp"
#include "miniflow/logging.hpp"

namespace miniflow {

// ==========================================
// Settings: CLI > environment > settings file > default
// ==========================================
enum class ReportFormat { kText, kJson };

struct Settings {
  std::string workflow_file = "miniflow.json";
  std::string settings_file;
  std::string strategy = "free";
  size_t concurrency = 0;
  RenderPolicy render_policy = RenderPolicy::kLenient;
  bool enforce_outcomes = false;
  int64_t cancel_grace_ms = 5000;
  std::string plugin_dir;
  LogLevel log_level = LogLevel::kError;
  std::string log_file;
  ReportFormat report = ReportFormat::kText;
  bool inject_yield_function = true;
  bool show_help = false;

  EngineConfig ToEngineConfig() const {
    EngineConfig config;
    config.strategy = strategy;
    config.concurrency_limit = concurrency;
    config.render_policy = render_policy;
    config.enforce_declared_outcomes = enforce_outcomes;
    config.cancel_grace = std::chrono::milliseconds(cancel_grace_ms);
    return config;
  }
};

inline bool ParseBool(const std::string& what, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  throw ConfigError("Invalid boolean for " + what + ": '" + value + "'");
}

inline uint64_t ParseCount(const std::string& what, const std::string& value) {
  if (value.empty() ||
      !std::all_of(value.begin(), value.end(),
                   [](unsigned char c) { return std::isdigit(c); })) {
    throw ConfigError("Invalid value for " + what + ": '" + value +
                      "' (expected a non-negative integer)");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw ConfigError("Value for " + what + " is out of range: " + value);
  }
}

namespace settings_detail {

using Setter = std::function<void(Settings&, const std::string&)>;

struct Option {
  const char* key;  // settings file key
  const char* env;
  Setter apply;
};

struct Flag {
  const char* flag;
  const char* key;
  const char* implied;  // value for switches; nullptr if the flag takes one
};

inline const std::vector<Option>& Options() {
  static const std::vector<Option> options = {
      {"workflow", "MINIFLOW_WORKFLOW_FILE",
       [](Settings& s, const std::string& v) { s.workflow_file = v; }},
      {"strategy", "MINIFLOW_STRATEGY",
       [](Settings& s, const std::string& v) { s.strategy = v; }},
      {"concurrency", "MINIFLOW_CONCURRENCY",
       [](Settings& s, const std::string& v) {
         s.concurrency = ParseCount("concurrency", v);
       }},
      {"strict_outcomes", "MINIFLOW_STRICT_OUTCOMES",
       [](Settings& s, const std::string& v) {
         s.render_policy = ParseBool("strict_outcomes", v)
                               ? RenderPolicy::kStrict
                               : RenderPolicy::kLenient;
       }},
      {"enforce_outcomes", "MINIFLOW_ENFORCE_OUTCOMES",
       [](Settings& s, const std::string& v) {
         s.enforce_outcomes = ParseBool("enforce_outcomes", v);
       }},
      {"cancel_grace_ms", "MINIFLOW_CANCEL_GRACE_MS",
       [](Settings& s, const std::string& v) {
         s.cancel_grace_ms =
             static_cast<int64_t>(ParseCount("cancel_grace_ms", v));
       }},
      {"plugins", "MINIFLOW_PLUGIN_DIR",
       [](Settings& s, const std::string& v) { s.plugin_dir = v; }},
      {"log_level", "MINIFLOW_LOG_LEVEL",
       [](Settings& s, const std::string& v) {
         s.log_level = ParseLogLevel(v);
       }},
      {"log_file", "MINIFLOW_LOG_FILE",
       [](Settings& s, const std::string& v) { s.log_file = v; }},
      {"report", "MINIFLOW_REPORT",
       [](Settings& s, const std::string& v) {
         if (v == "text") {
           s.report = ReportFormat::kText;
         } else if (v == "json") {
           s.report = ReportFormat::kJson;
         } else {
           throw ConfigError("Invalid report format: '" + v +
                             "' (expected text or json)");
         }
       }},
      {"shell_inject_yield_function", "MINIFLOW_SHELL_INJECT_YIELD_FUNCTION",
       [](Settings& s, const std::string& v) {
         s.inject_yield_function = ParseBool("shell_inject_yield_function", v);
       }},
  };
  return options;
}

inline const std::vector<Flag>& Flags() {
  static const std::vector<Flag> flags = {
      {"--workflow", "workflow", nullptr},
      {"--strategy", "strategy", nullptr},
      {"--concurrency", "concurrency", nullptr},
      {"--strict-outcomes", "strict_outcomes", "true"},
      {"--lenient-outcomes", "strict_outcomes", "false"},
      {"--enforce-outcomes", "enforce_outcomes", "true"},
      {"--cancel-grace-ms", "cancel_grace_ms", nullptr},
      {"--plugins", "plugins", nullptr},
      {"--log-level", "log_level", nullptr},
      {"--log-file", "log_file", nullptr},
      {"--report", "report", nullptr},
      {"--no-yield-function", "shell_inject_yield_function", "false"},
  };
  return flags;
}

inline std::string JsonScalar(const std::string& key, const nlohmann::json& v) {
  if (v.is_string()) return v.get<std::string>();
  if (v.is_boolean() || v.is_number()) return v.dump();
  throw ConfigError("Setting '" + key + "' must be a scalar");
}

inline std::map<std::string, std::string> ReadSettingsFile(
    const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    throw ConfigError("Cannot open settings file: " + path);
  }
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(ifs);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError("Malformed settings file " + path + ": " + e.what());
  }
  if (!root.is_object()) {
    throw ConfigError("Settings file " + path + " must contain an object");
  }
  std::map<std::string, std::string> values;
  for (auto it = root.begin(); it != root.end(); ++it) {
    values[it.key()] = JsonScalar(it.key(), it.value());
  }
  return values;
}

}  // namespace settings_detail

inline std::string Usage() {
  return "Usage: miniflow [options]\n"
         "  --workflow FILE        workflow file (default: miniflow.json)\n"
         "  --settings FILE        JSON settings file\n"
         "  --strategy NAME        free | loose | strict | sequential |\n"
         "                         strict-sequential (default: free)\n"
         "  --concurrency N        max running actions, 0 = unbounded\n"
         "  --strict-outcomes      fail rendering on missing outcomes\n"
         "  --lenient-outcomes     render missing outcomes as empty (default)\n"
         "  --enforce-outcomes     require exactly the declared outcomes\n"
         "  --cancel-grace-ms MS   wait for running actions on cancel\n"
         "  --plugins DIR          load runner plugins (*.so) from DIR\n"
         "  --log-level LEVEL      debug | info | warn | error\n"
         "  --log-file FILE        log to FILE instead of stderr\n"
         "  --report FORMAT        text | json\n"
         "  --no-yield-function    do not inject yield_outcome into scripts\n"
         "  -h, --help             show this help\n";
}

// `args` excludes the program name. Throws ConfigError on unknown flags,
// missing flag values and invalid values from any source.
inline Settings ResolveSettings(const std::vector<std::string>& args,
                                const EnvFn& env = ProcessEnv) {
  using namespace settings_detail;
  Settings settings;

  std::map<std::string, std::string> cli;
  std::string settings_file;
  for (size_t i = 0; i < args.size(); ++i) {
    std::string arg = args[i];
    if (arg == "-h" || arg == "--help") {
      settings.show_help = true;
      continue;
    }
    std::string value;
    bool has_value = false;
    size_t eq = arg.find('=');
    if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = arg.substr(eq + 1);
      arg = arg.substr(0, eq);
      has_value = true;
    }
    auto needs_value = [&]() {
      if (has_value) return value;
      if (i + 1 >= args.size()) {
        throw ConfigError("Missing value for " + arg);
      }
      return args[++i];
    };
    if (arg == "--settings") {
      settings_file = needs_value();
      continue;
    }
    auto flag = std::find_if(Flags().begin(), Flags().end(),
                             [&](const Flag& f) { return arg == f.flag; });
    if (flag == Flags().end()) {
      throw ConfigError("Unknown argument: " + args[i]);
    }
    if (flag->implied != nullptr) {
      if (has_value) {
        throw ConfigError(arg + " does not take a value");
      }
      cli[flag->key] = flag->implied;
    } else {
      cli[flag->key] = needs_value();
    }
  }

  if (settings_file.empty() && env) {
    settings_file = env("MINIFLOW_SETTINGS_FILE").value_or("");
  }
  settings.settings_file = settings_file;

  std::map<std::string, std::string> from_file;
  if (!settings_file.empty()) {
    from_file = ReadSettingsFile(settings_file);
    for (const auto& [key, _] : from_file) {
      bool known = std::any_of(Options().begin(), Options().end(),
                               [&](const Option& o) { return key == o.key; });
      if (!known) {
        throw ConfigError("Unknown setting '" + key + "' in " + settings_file);
      }
    }
  }

  // An empty environment variable counts as unset.
  for (const auto& option : Options()) {
    if (auto it = cli.find(option.key); it != cli.end()) {
      option.apply(settings, it->second);
    } else if (auto value = env ? env(option.env) : std::nullopt;
               value && !value->empty()) {
      option.apply(settings, *value);
    } else if (auto fit = from_file.find(option.key); fit != from_file.end()) {
      option.apply(settings, fit->second);
    }
  }
  return settings;
}

}  // namespace miniflow
