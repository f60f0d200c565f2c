#pragma once

#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

#include "miniflow/errors.hpp"
#include "miniflow/expression.hpp"
#include "miniflow/ledger.hpp"
#include "miniflow/params.hpp"

namespace miniflow {

// ==========================================
// Interpolator
// ==========================================

// kStrict: a missing outcome fails the render.
// kLenient: a missing outcome renders as an empty string.
enum class RenderPolicy { kStrict, kLenient };

inline const char* ToString(RenderPolicy policy) {
  return policy == RenderPolicy::kStrict ? "strict" : "lenient";
}

using EnvFn = std::function<std::optional<std::string>(const std::string&)>;

inline std::optional<std::string> ProcessEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) return std::nullopt;
  return std::string(value);
}

// action id -> state name; nullopt when the id is not part of the workflow.
using StatusFn =
    std::function<std::optional<std::string>(const std::string&)>;

class Interpolator {
 public:
  static constexpr int kMaxDepth = 32;

  explicit Interpolator(RenderPolicy policy = RenderPolicy::kLenient,
                        EnvFn env = ProcessEnv)
      : policy_(policy), env_(std::move(env)) {}

  void SetContext(std::map<std::string, std::string> context) {
    context_ = std::move(context);
  }

  // Without a lookup, outcome references to unknown actions are treated as
  // missing outcomes and status references fail.
  void SetStatusLookup(StatusFn fn) { status_of_ = std::move(fn); }

  RenderPolicy Policy() const { return policy_; }

  ParamNode Render(const ParamNode& raw, const OutcomeLedger& ledger) const {
    if (raw.IsScalar()) {
      return ParamNode(RenderAt(raw.Scalar(), ledger, 0));
    }
    if (raw.size() == 0) {
      return raw;
    }
    ParamNode out;
    if (raw.IsSequence()) {
      for (const auto& item : raw) {
        out.AddSequenceItem() = Render(item, ledger);
      }
    } else {
      for (const auto& [key, value] : raw.Items()) {
        out.AddMapItem(key) = Render(value, ledger);
      }
    }
    return out;
  }

  std::string RenderString(const std::string& raw,
                           const OutcomeLedger& ledger) const {
    return RenderAt(raw, ledger, 0);
  }

 private:
  RenderPolicy policy_;
  EnvFn env_;
  StatusFn status_of_;
  std::map<std::string, std::string> context_;

  std::string RenderAt(const std::string& raw, const OutcomeLedger& ledger,
                       int depth) const {
    if (depth >= kMaxDepth) {
      throw RenderError(RenderErrorKind::kRecursionLimit,
                        "Recursion depth exceeded: " + std::to_string(depth) +
                            "/" + std::to_string(kMaxDepth));
    }
    if (!MayContainExpressions(raw)) return raw;
    std::string out;
    for (const auto& chunk : SplitTemplate(raw)) {
      out += chunk.is_expression ? Evaluate(chunk.text, ledger, depth)
                                 : chunk.text;
    }
    return out;
  }

  std::string Evaluate(const std::string& expression,
                       const OutcomeLedger& ledger, int depth) const {
    Reference ref = ParseReference(expression);
    switch (ref.kind) {
      case Reference::kOutcome: {
        if (status_of_ && !status_of_(ref.action)) {
          throw RenderError(RenderErrorKind::kUnknownAction,
                            "Action not found: '" + ref.action + "'");
        }
        auto value = ledger.Get(ref.action, ref.key);
        if (value) return *value;
        if (policy_ == RenderPolicy::kStrict) {
          throw RenderError(RenderErrorKind::kMissingOutcome,
                            "Outcome key '" + ref.key + "' of action '" +
                                ref.action + "' not found");
        }
        return "";
      }
      case Reference::kStatus: {
        auto status = status_of_ ? status_of_(ref.action) : std::nullopt;
        if (!status) {
          throw RenderError(RenderErrorKind::kUnknownAction,
                            "Action not found: '" + ref.action + "'");
        }
        return *status;
      }
      case Reference::kContext: {
        auto it = context_.find(ref.key);
        if (it == context_.end()) {
          throw RenderError(RenderErrorKind::kUnknownContextKey,
                            "Context key not found: '" + ref.key + "'");
        }
        return RenderAt(it->second, ledger, depth + 1);
      }
      case Reference::kEnvironment: {
        auto value = env_ ? env_(ref.key) : std::nullopt;
        return value.value_or("");
      }
    }
    throw RenderError(RenderErrorKind::kMalformedExpression,
                      "Unsupported expression: '" + expression + "'");
  }
};

}  // namespace miniflow
