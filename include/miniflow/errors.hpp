#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace miniflow {

// ==========================================
// Error taxonomy
// ==========================================

enum class ValidationErrorKind {
  kUnknownDependency,
  kCycleDetected,
  kDuplicateId,
  kUnknownRunnerKind,
  kUnorderedReference,
  kReservedId,
};

inline const char* ToString(ValidationErrorKind kind) {
  switch (kind) {
    case ValidationErrorKind::kUnknownDependency:
      return "UnknownDependency";
    case ValidationErrorKind::kCycleDetected:
      return "CycleDetected";
    case ValidationErrorKind::kDuplicateId:
      return "DuplicateId";
    case ValidationErrorKind::kUnknownRunnerKind:
      return "UnknownRunnerKind";
    case ValidationErrorKind::kUnorderedReference:
      return "UnorderedReference";
    case ValidationErrorKind::kReservedId:
      return "ReservedId";
  }
  return "Unknown";
}

// Malformed workflow graph. Always raised before any action starts.
// For kCycleDetected, Ids() is the cycle path with the first id repeated at
// the end; for the other kinds it lists the offending ids.
class ValidationError : public std::runtime_error {
 public:
  ValidationError(ValidationErrorKind kind, const std::string& message,
                  std::vector<std::string> ids = {})
      : std::runtime_error(message), kind_(kind), ids_(std::move(ids)) {}

  ValidationErrorKind Kind() const { return kind_; }
  const std::vector<std::string>& Ids() const { return ids_; }

 private:
  ValidationErrorKind kind_;
  std::vector<std::string> ids_;
};

enum class RenderErrorKind {
  kMissingOutcome,
  kUnknownAction,
  kUnknownContextKey,
  kMalformedExpression,
  kRecursionLimit,
};

inline const char* ToString(RenderErrorKind kind) {
  switch (kind) {
    case RenderErrorKind::kMissingOutcome:
      return "MissingOutcome";
    case RenderErrorKind::kUnknownAction:
      return "UnknownAction";
    case RenderErrorKind::kUnknownContextKey:
      return "UnknownContextKey";
    case RenderErrorKind::kMalformedExpression:
      return "MalformedExpression";
    case RenderErrorKind::kRecursionLimit:
      return "RecursionLimit";
  }
  return "Unknown";
}

// Parameter interpolation failed for one action.
class RenderError : public std::runtime_error {
 public:
  RenderError(RenderErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  RenderErrorKind Kind() const { return kind_; }

 private:
  RenderErrorKind kind_;
};

// Second write of the same (action, key) pair into the outcome ledger.
class ConflictError : public std::logic_error {
 public:
  ConflictError(std::string action_id, std::string key)
      : std::logic_error("Outcome '" + key + "' of action '" + action_id +
                         "' is already recorded"),
        action_id_(std::move(action_id)),
        key_(std::move(key)) {}

  const std::string& ActionId() const { return action_id_; }
  const std::string& Key() const { return key_; }

 private:
  std::string action_id_;
  std::string key_;
};

class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Workflow file or plugin could not be loaded.
class LoadError : public std::runtime_error {
 public:
  explicit LoadError(const std::string& message, std::string source = {})
      : std::runtime_error(source.empty() ? message
                                          : source + ": " + message),
        source_(std::move(source)) {}

  const std::string& Source() const { return source_; }

 private:
  std::string source_;
};

}  // namespace miniflow
