#pragma once

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "miniflow/action_state.hpp"
#include "miniflow/errors.hpp"
#include "miniflow/ledger.hpp"

namespace miniflow {

// ==========================================
// Run Result & reporting
// ==========================================
enum class RunVerdict { kSuccess, kFailure, kCancelled };

inline const char* ToString(RunVerdict verdict) {
  switch (verdict) {
    case RunVerdict::kSuccess:
      return "SUCCESS";
    case RunVerdict::kFailure:
      return "FAILURE";
    case RunVerdict::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

struct ActionReport {
  std::string id;
  ActionState state = ActionState::kPending;
  std::string cause;
  std::optional<int> exit_code;
  int64_t duration_us = 0;  // 0 for actions that never ran
};

struct RunResult {
  RunVerdict verdict = RunVerdict::kSuccess;
  std::vector<ActionReport> actions;  // declaration order
  OutcomeMap outcomes;
  int64_t total_us = 0;

  const ActionReport* Find(const std::string& id) const {
    for (const auto& a : actions) {
      if (a.id == id) return &a;
    }
    return nullptr;
  }
};

// Cancellation wins over failure so an interrupted run is never reported
// as an ordinary failure.
inline RunVerdict ComputeVerdict(const std::vector<ActionReport>& actions) {
  bool failed = false;
  for (const auto& a : actions) {
    if (a.state == ActionState::kCancelled) return RunVerdict::kCancelled;
    if (a.state == ActionState::kFailure) failed = true;
  }
  return failed ? RunVerdict::kFailure : RunVerdict::kSuccess;
}

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 2;
constexpr int kExitValidationError = 3;
constexpr int kExitConfigError = 4;
constexpr int kExitInternalError = 5;

inline int ExitCodeFor(RunVerdict verdict) {
  switch (verdict) {
    case RunVerdict::kSuccess:
      return kExitSuccess;
    case RunVerdict::kFailure:
      return kExitFailure;
    case RunVerdict::kCancelled:
      return kExitCancelled;
  }
  return kExitFailure;
}

// Exit code for an exception that ended the process before a verdict.
// A ConflictError means the engine broke its own invariant.
inline int ExitCodeForError(const std::exception& e) {
  if (dynamic_cast<const ValidationError*>(&e) != nullptr) {
    return kExitValidationError;
  }
  if (dynamic_cast<const ConfigError*>(&e) != nullptr ||
      dynamic_cast<const LoadError*>(&e) != nullptr) {
    return kExitConfigError;
  }
  return kExitInternalError;
}

inline nlohmann::json ToJson(const RunResult& result) {
  nlohmann::json j;
  j["verdict"] = ToString(result.verdict);
  j["total_us"] = result.total_us;
  j["actions"] = nlohmann::json::array();
  for (const auto& a : result.actions) {
    nlohmann::json entry = {{"id", a.id},
                            {"state", ToString(a.state)},
                            {"duration_us", a.duration_us}};
    if (!a.cause.empty()) entry["cause"] = a.cause;
    if (a.exit_code) entry["exit_code"] = *a.exit_code;
    j["actions"].push_back(std::move(entry));
  }
  j["outcomes"] = nlohmann::json::object();
  for (const auto& [action, values] : result.outcomes) {
    j["outcomes"][action] = values;
  }
  return j;
}

inline std::string FormatTextReport(const RunResult& result) {
  size_t id_width = 6;
  for (const auto& a : result.actions) id_width = std::max(id_width, a.id.size());

  std::ostringstream os;
  os << std::left << std::setw(static_cast<int>(id_width) + 2) << "ACTION"
     << std::setw(11) << "STATE" << std::setw(12) << "DURATION"
     << "CAUSE\n";
  for (const auto& a : result.actions) {
    std::ostringstream dur;
    dur << std::fixed << std::setprecision(3)
        << static_cast<double>(a.duration_us) / 1e6 << "s";
    os << std::left << std::setw(static_cast<int>(id_width) + 2) << a.id
       << std::setw(11) << ToString(a.state) << std::setw(12) << dur.str()
       << a.cause << "\n";
  }
  os << "Run " << ToString(result.verdict) << " in " << std::fixed
     << std::setprecision(3) << static_cast<double>(result.total_us) / 1e6
     << "s\n";
  return os.str();
}

}  // namespace miniflow
