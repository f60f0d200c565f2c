#pragma once

#include <cstdint>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "miniflow/errors.hpp"
#include "miniflow/graph.hpp"
#include "miniflow/params.hpp"

namespace miniflow {

// ==========================================
// Workflow file loader
// ==========================================
struct Workflow {
  std::vector<ActionDescriptor> actions;
  std::map<std::string, std::string> context;
};

class WorkflowLoader {
 public:
  static nlohmann::json Load(const std::string& filename) {
    std::ifstream ifs(filename);
    if (!ifs.is_open()) {
      throw LoadError("Cannot open workflow file", filename);
    }
    try {
      return nlohmann::json::parse(ifs);
    } catch (const nlohmann::json::parse_error& e) {
      throw LoadError(e.what(), filename);
    }
  }

  static ParamNode ConvertJson(const nlohmann::json& j) {
    ParamNode node;

    if (j.is_string()) {
      node.SetScalar(j.get<std::string>());
    } else if (j.is_number_integer()) {
      node.SetScalar(std::to_string(j.get<int64_t>()));
    } else if (j.is_number_float()) {
      std::ostringstream oss;
      oss << j.get<double>();
      node.SetScalar(oss.str());
    } else if (j.is_boolean()) {
      node.SetScalar(j.get<bool>() ? "true" : "false");
    } else if (j.is_array()) {
      for (const auto& item : j) {
        node.AddSequenceItem() = ConvertJson(item);
      }
    } else if (j.is_object()) {
      for (auto it = j.begin(); it != j.end(); ++it) {
        node.AddMapItem(it.key()) = ConvertJson(it.value());
      }
    }

    return node;
  }

  static Workflow ParseFile(const std::string& filename) {
    return Parse(Load(filename), filename);
  }

  static Workflow Parse(const nlohmann::json& root,
                        const std::string& source = "<inline>") {
    if (!root.is_object()) {
      throw LoadError("Workflow root must be an object", source);
    }
    if (!root.contains("actions") || !root["actions"].is_array()) {
      throw LoadError("Workflow must contain an 'actions' array", source);
    }
    if (root["actions"].empty()) {
      throw LoadError("Workflow declares no actions", source);
    }

    Workflow wf;
    if (root.contains("context")) {
      const auto& ctx = root["context"];
      if (!ctx.is_object()) {
        throw LoadError("'context' must be an object", source);
      }
      for (auto it = ctx.begin(); it != ctx.end(); ++it) {
        ParamNode value = ConvertJson(it.value());
        if (!value.IsScalar()) {
          throw LoadError("Context value '" + it.key() + "' must be a scalar",
                          source);
        }
        wf.context[it.key()] = value.Scalar();
      }
    }

    size_t position = 0;
    for (const auto& action_json : root["actions"]) {
      wf.actions.push_back(ParseAction(action_json, position++, source));
    }
    return wf;
  }

 private:
  static ActionDescriptor ParseAction(const nlohmann::json& j, size_t position,
                                      const std::string& source) {
    const std::string where = "action #" + std::to_string(position);
    if (!j.is_object()) {
      throw LoadError(where + " must be an object", source);
    }
    ActionDescriptor desc;
    try {
      if (!j.contains("id") || !j.contains("kind")) {
        throw LoadError(where + " requires 'id' and 'kind'", source);
      }
      desc.id = j.at("id").get<std::string>();
      desc.kind = j.at("kind").get<std::string>();
      if (desc.id.empty()) {
        throw LoadError(where + " has an empty id", source);
      }
      if (j.contains("params")) {
        desc.params = ConvertJson(j["params"]);
        if (!desc.params.IsMap() && !desc.params.IsNull()) {
          throw LoadError("'params' of '" + desc.id + "' must be an object",
                          source);
        }
      }
      ParseDependencies(j, desc, source);
      desc.outcomes = StringList(j, "outcomes");
      desc.description = j.value("description", "");
      desc.enabled = j.value("enabled", true);
      std::string severity = j.value("severity", "normal");
      if (severity == "low") {
        desc.severity = Severity::kLow;
      } else if (severity != "normal") {
        throw LoadError("Invalid severity of '" + desc.id + "': '" + severity +
                            "' (expected one of: low, normal)",
                        source);
      }
    } catch (const nlohmann::json::exception& e) {
      throw LoadError(where + ": " + e.what(), source);
    }
    return desc;
  }

  // Entries are ids or {"id": ..., "strict": bool} objects.
  static void ParseDependencies(const nlohmann::json& j, ActionDescriptor& desc,
                                const std::string& source) {
    if (!j.contains("dependencies")) return;
    nlohmann::json deps = j["dependencies"];
    if (!deps.is_array()) deps = nlohmann::json::array({deps});
    for (const auto& dep : deps) {
      if (dep.is_string()) {
        desc.dependencies.push_back(dep.get<std::string>());
        continue;
      }
      if (!dep.is_object() || !dep.contains("id")) {
        throw LoadError("Dependency of '" + desc.id +
                            "' must be an id or an object with 'id'",
                        source);
      }
      for (auto it = dep.begin(); it != dep.end(); ++it) {
        if (it.key() != "id" && it.key() != "strict") {
          throw LoadError("Unknown dependency key '" + it.key() + "' in '" +
                              desc.id + "'",
                          source);
        }
      }
      std::string id = dep.at("id").get<std::string>();
      if (dep.value("strict", false)) desc.strict_dependencies.insert(id);
      desc.dependencies.push_back(std::move(id));
    }
  }

  // A single string is accepted in place of a one-element list.
  static std::vector<std::string> StringList(const nlohmann::json& j,
                                             const std::string& key) {
    std::vector<std::string> out;
    if (!j.contains(key)) return out;
    const auto& value = j[key];
    if (value.is_string()) {
      out.push_back(value.get<std::string>());
      return out;
    }
    for (const auto& item : value) {
      out.push_back(item.get<std::string>());
    }
    return out;
  }
};

}  // namespace miniflow
