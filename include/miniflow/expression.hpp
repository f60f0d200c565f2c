#pragma once

#include <string>
#include <vector>

#include "miniflow/errors.hpp"

namespace miniflow {

// ==========================================
// @{...} template scanning
// ==========================================

struct TemplateChunk {
  bool is_expression = false;
  std::string text;  // raw text, or the trimmed expression body
};

inline bool MayContainExpressions(const std::string& value) {
  return value.find('@') != std::string::npos;
}

inline std::string TrimCopy(const std::string& s) {
  const char* ws = " \t\r\n";
  auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) return {};
  auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

// Splits `value` into literal text and expressions. "@@" is a literal "@",
// so "@@{x}" stays the text "@{x}". Braces nest inside an expression.
inline std::vector<TemplateChunk> SplitTemplate(const std::string& value) {
  std::vector<TemplateChunk> chunks;
  std::string text;
  size_t i = 0;
  const size_t n = value.size();
  while (i < n) {
    char c = value[i];
    if (c == '@' && i + 1 < n && value[i + 1] == '@') {
      text += '@';
      i += 2;
      continue;
    }
    if (c == '@' && i + 1 < n && value[i + 1] == '{') {
      int depth = 0;
      size_t close = std::string::npos;
      for (size_t j = i + 2; j < n; ++j) {
        if (value[j] == '{') {
          ++depth;
        } else if (value[j] == '}') {
          if (depth == 0) {
            close = j;
            break;
          }
          --depth;
        }
      }
      if (close == std::string::npos) {
        throw RenderError(RenderErrorKind::kMalformedExpression,
                          "Unterminated expression in '" + value + "'");
      }
      if (!text.empty()) {
        chunks.push_back({false, std::move(text)});
        text.clear();
      }
      chunks.push_back({true, TrimCopy(value.substr(i + 2, close - i - 2))});
      i = close + 1;
      continue;
    }
    text += c;
    ++i;
  }
  if (!text.empty()) {
    chunks.push_back({false, std::move(text)});
  }
  return chunks;
}

// A parsed expression body.
struct Reference {
  enum Kind { kOutcome, kStatus, kContext, kEnvironment };
  Kind kind = kOutcome;
  std::string action;  // kOutcome, kStatus
  std::string key;     // outcome key, context key or variable name
};

inline bool IsReservedPrefix(const std::string& head) {
  return head == "outcomes" || head == "out" || head == "status" ||
         head == "context" || head == "ctx" || head == "environment" ||
         head == "env";
}

// An id whose first segment is a reserved prefix would be read as that
// prefix in the short <action>.<key> form.
inline bool IsReservedActionId(const std::string& id) {
  return IsReservedPrefix(id.substr(0, id.find('.')));
}

// Grammar:
//   <action>.<key> | outcomes.<action>.<key> | out.<action>.<key>
//   status.<action> | context.<key> | ctx.<key>
//   environment.<name> | env.<name>
// Outcome references split at the last dot, so action ids may contain dots.
inline Reference ParseReference(const std::string& expression) {
  auto malformed = [&expression](const std::string& why) {
    return RenderError(RenderErrorKind::kMalformedExpression,
                       "Malformed expression '" + expression + "': " + why);
  };
  auto split_outcome = [&](const std::string& body) {
    auto dot = body.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == body.size()) {
      throw malformed("expected <action>.<outcome>");
    }
    Reference ref;
    ref.kind = Reference::kOutcome;
    ref.action = body.substr(0, dot);
    ref.key = body.substr(dot + 1);
    return ref;
  };

  if (expression.empty()) {
    throw malformed("empty expression");
  }
  auto first_dot = expression.find('.');
  if (first_dot == std::string::npos) {
    throw malformed("expected <action>.<outcome>");
  }
  std::string head = expression.substr(0, first_dot);
  std::string rest = expression.substr(first_dot + 1);

  if (head == "outcomes" || head == "out") {
    return split_outcome(rest);
  }
  if (head == "status" || head == "context" || head == "ctx" ||
      head == "environment" || head == "env") {
    if (rest.empty()) {
      throw malformed("missing name after '" + head + ".'");
    }
    Reference ref;
    if (head == "status") {
      ref.kind = Reference::kStatus;
      ref.action = rest;
    } else if (head == "context" || head == "ctx") {
      ref.kind = Reference::kContext;
      ref.key = rest;
    } else {
      ref.kind = Reference::kEnvironment;
      ref.key = rest;
    }
    return ref;
  }
  return split_outcome(expression);
}

}  // namespace miniflow
