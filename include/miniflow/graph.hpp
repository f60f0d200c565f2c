#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <queue>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "miniflow/errors.hpp"
#include "miniflow/expression.hpp"
#include "miniflow/logging.hpp"
#include "miniflow/params.hpp"

namespace miniflow {

// ==========================================
// Dependency Graph
// ==========================================

// A failed low-severity action ends WARNING instead of FAILURE.
enum class Severity { kNormal, kLow };

inline const char* ToString(Severity severity) {
  return severity == Severity::kLow ? "low" : "normal";
}

struct ActionDescriptor {
  std::string id;
  std::string kind;  // runner kind, resolved through RunnerFactory
  ParamNode params;
  std::vector<std::string> dependencies;
  // Subset of `dependencies` whose FAILURE, SKIPPED or WARNING always
  // keeps this action from running, whatever the strategy.
  std::set<std::string> strict_dependencies;
  std::vector<std::string> outcomes;  // declared outcome names
  std::string description;
  Severity severity = Severity::kNormal;
  bool enabled = true;
};

inline std::string JoinIds(const std::vector<std::string>& ids,
                           const std::string& sep = ", ") {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += sep;
    out += id;
  }
  return out;
}

// Immutable once built; shared read-only by the engine and the strategies.
class DependencyGraph {
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  explicit DependencyGraph(PrivateTag) {}

  static std::shared_ptr<const DependencyGraph> Build(
      std::vector<ActionDescriptor> descriptors, LogFn log = {}) {
    auto graph = std::make_shared<DependencyGraph>(PrivateTag{});
    graph->log_ = std::move(log);
    graph->descriptors_ = std::move(descriptors);

    // Pass 1: identity
    graph->IndexIds();
    // Pass 2: topology
    graph->LinkDependencies();
    // Pass 3: validation & derived orderings
    graph->ValidateCycle();
    graph->ComputeOrder();
    graph->ValidateReferences();

    graph->LogMsg(LogLevel::kInfo,
                  "[Graph] Built successfully. Actions: " +
                      std::to_string(graph->Size()) +
                      ", Tiers: " + std::to_string(graph->tiers_.size()));
    return graph;
  }

  size_t Size() const { return descriptors_.size(); }
  const std::vector<ActionDescriptor>& Descriptors() const {
    return descriptors_;
  }
  const ActionDescriptor& Descriptor(int index) const {
    return descriptors_.at(index);
  }

  int IndexOf(const std::string& id) const {
    auto it = id_map_.find(id);
    return it == id_map_.end() ? -1 : it->second;
  }
  bool Contains(const std::string& id) const { return id_map_.count(id) > 0; }

  // Index-based adjacency, used on the scheduling path.
  const std::vector<int>& Parents(int index) const {
    return nodes_.at(index).parents;
  }
  const std::vector<int>& Children(int index) const {
    return nodes_.at(index).children;
  }
  bool IsStrictEdge(int parent, int child) const {
    return nodes_.at(child).strict_parents.count(parent) > 0;
  }

  std::vector<std::string> Dependencies(const std::string& id) const {
    return Names(nodes_[CheckedIndex(id)].parents);
  }
  std::vector<std::string> Dependents(const std::string& id) const {
    return Names(nodes_[CheckedIndex(id)].children);
  }

  std::vector<std::string> Roots() const {
    std::vector<std::string> roots;
    for (size_t i = 0; i < nodes_.size(); ++i) {
      if (nodes_[i].parents.empty()) roots.push_back(descriptors_[i].id);
    }
    return roots;
  }

  // Kahn's order; among simultaneously available actions the earlier
  // declared one comes first.
  const std::vector<int>& TopologicalOrder() const { return topo_order_; }
  int TopologicalPosition(int index) const { return topo_position_.at(index); }

  // Tier 0 holds the roots; tier N the actions whose longest dependency
  // chain has N edges.
  const std::vector<std::vector<int>>& Tiers() const { return tiers_; }

  std::vector<int> Descendants(int index) const {
    std::vector<bool> seen(nodes_.size(), false);
    std::queue<int> bfs;
    bfs.push(index);
    std::vector<int> out;
    while (!bfs.empty()) {
      int cur = bfs.front();
      bfs.pop();
      for (int child : nodes_[cur].children) {
        if (!seen[child]) {
          seen[child] = true;
          out.push_back(child);
          bfs.push(child);
        }
      }
    }
    std::sort(out.begin(), out.end());
    return out;
  }

  bool IsAncestor(int ancestor, int index) const {
    return ancestors_.at(index).at(ancestor);
  }

 private:
  struct Node {
    std::vector<int> parents;
    std::vector<int> children;
    std::unordered_set<int> strict_parents;
    int tier = 0;
  };

  std::vector<ActionDescriptor> descriptors_;
  std::vector<Node> nodes_;
  std::unordered_map<std::string, int> id_map_;
  std::vector<int> topo_order_;
  std::vector<int> topo_position_;
  std::vector<std::vector<int>> tiers_;
  std::vector<std::vector<bool>> ancestors_;  // [i][j]: j is an ancestor of i
  LogFn log_;

  void LogMsg(LogLevel level, const std::string& msg) const {
    if (log_) log_(level, msg);
  }

  int CheckedIndex(const std::string& id) const {
    int index = IndexOf(id);
    if (index < 0) {
      throw std::out_of_range("Unknown action: " + id);
    }
    return index;
  }

  std::vector<std::string> Names(const std::vector<int>& indices) const {
    std::vector<std::string> names;
    names.reserve(indices.size());
    for (int i : indices) names.push_back(descriptors_[i].id);
    return names;
  }

  void IndexIds() {
    std::set<std::string> duplicates;
    std::vector<std::string> reserved;
    for (const auto& desc : descriptors_) {
      if (IsReservedActionId(desc.id)) reserved.push_back(desc.id);
    }
    if (!reserved.empty()) {
      throw ValidationError(
          ValidationErrorKind::kReservedId,
          "Action ids clash with expression prefixes: [" + JoinIds(reserved) +
              "]",
          reserved);
    }
    for (size_t i = 0; i < descriptors_.size(); ++i) {
      if (!id_map_.emplace(descriptors_[i].id, static_cast<int>(i)).second) {
        duplicates.insert(descriptors_[i].id);
      }
    }
    if (!duplicates.empty()) {
      std::vector<std::string> ids(duplicates.begin(), duplicates.end());
      throw ValidationError(ValidationErrorKind::kDuplicateId,
                            "Duplicate action ids: [" + JoinIds(ids) + "]",
                            ids);
    }
  }

  void LinkDependencies() {
    nodes_.resize(descriptors_.size());
    std::set<std::string> missing;
    for (size_t i = 0; i < descriptors_.size(); ++i) {
      std::unordered_set<int> seen;
      for (const auto& dep : descriptors_[i].dependencies) {
        auto it = id_map_.find(dep);
        if (it == id_map_.end()) {
          missing.insert(dep);
          continue;
        }
        int parent_id = it->second;
        if (!seen.insert(parent_id).second) continue;
        nodes_[parent_id].children.push_back(static_cast<int>(i));
        nodes_[i].parents.push_back(parent_id);
      }
      for (const auto& dep : descriptors_[i].strict_dependencies) {
        auto it = id_map_.find(dep);
        if (it == id_map_.end() || !seen.count(it->second)) {
          missing.insert(dep);
          continue;
        }
        nodes_[i].strict_parents.insert(it->second);
      }
    }
    if (!missing.empty()) {
      std::vector<std::string> ids(missing.begin(), missing.end());
      throw ValidationError(
          ValidationErrorKind::kUnknownDependency,
          "Missing actions among dependencies: [" + JoinIds(ids) + "]", ids);
    }
  }

  enum Color : char { kWhite, kGray, kBlack };

  // DFS over dependency edges; the first back-edge closes the cycle.
  void ValidateCycle() const {
    std::vector<char> color(nodes_.size(), kWhite);
    std::vector<int> path;
    std::vector<int> cycle;
    for (size_t i = 0; i < nodes_.size(); ++i) {
      if (color[i] != kWhite) continue;
      if (Visit(static_cast<int>(i), color, path, cycle)) {
        std::vector<std::string> ids = Names(cycle);
        throw ValidationError(ValidationErrorKind::kCycleDetected,
                              "Cycle detected: " + JoinIds(ids, " -> ") +
                                  " (each action depends on the next)",
                              ids);
      }
    }
  }

  bool Visit(int node, std::vector<char>& color, std::vector<int>& path,
             std::vector<int>& cycle) const {
    color[node] = kGray;
    path.push_back(node);
    for (int dep : nodes_[node].parents) {
      if (color[dep] == kGray) {
        auto it = std::find(path.begin(), path.end(), dep);
        cycle.assign(it, path.end());
        cycle.push_back(dep);
        return true;
      }
      if (color[dep] == kWhite && Visit(dep, color, path, cycle)) {
        return true;
      }
    }
    path.pop_back();
    color[node] = kBlack;
    return false;
  }

  void ComputeOrder() {
    const size_t n = nodes_.size();
    std::vector<size_t> indegree(n);
    std::priority_queue<int, std::vector<int>, std::greater<int>> q;
    for (size_t i = 0; i < n; ++i) {
      indegree[i] = nodes_[i].parents.size();
      if (indegree[i] == 0) q.push(static_cast<int>(i));
    }
    while (!q.empty()) {
      int cur = q.top();
      q.pop();
      topo_order_.push_back(cur);
      for (int child : nodes_[cur].children) {
        if (--indegree[child] == 0) q.push(child);
      }
    }

    topo_position_.assign(n, 0);
    ancestors_.assign(n, std::vector<bool>(n, false));
    for (size_t pos = 0; pos < topo_order_.size(); ++pos) {
      int cur = topo_order_[pos];
      topo_position_[cur] = static_cast<int>(pos);
      int tier = 0;
      for (int p : nodes_[cur].parents) {
        tier = std::max(tier, nodes_[p].tier + 1);
        ancestors_[cur][p] = true;
        for (size_t j = 0; j < n; ++j) {
          if (ancestors_[p][j]) ancestors_[cur][j] = true;
        }
      }
      nodes_[cur].tier = tier;
      if (tiers_.size() <= static_cast<size_t>(tier)) tiers_.resize(tier + 1);
      tiers_[tier].push_back(cur);
    }
  }

  static void CollectOutcomeReferences(const ParamNode& node,
                                       std::vector<std::string>& out) {
    if (node.IsScalar()) {
      if (!MayContainExpressions(node.Scalar())) return;
      try {
        for (const auto& chunk : SplitTemplate(node.Scalar())) {
          if (!chunk.is_expression) continue;
          Reference ref = ParseReference(chunk.text);
          if (ref.kind == Reference::kOutcome) out.push_back(ref.action);
        }
      } catch (const RenderError&) {
        // Malformed templates fail the action at render time instead.
      }
    } else if (node.IsSequence()) {
      for (const auto& item : node) CollectOutcomeReferences(item, out);
    } else if (node.IsMap()) {
      for (const auto& [_, value] : node.Items()) {
        CollectOutcomeReferences(value, out);
      }
    }
  }

  // An outcome may only be read by a descendant of its producer; anything
  // else could observe the value before it is written.
  void ValidateReferences() const {
    for (size_t i = 0; i < descriptors_.size(); ++i) {
      std::vector<std::string> producers;
      CollectOutcomeReferences(descriptors_[i].params, producers);
      for (const auto& producer : producers) {
        int p = IndexOf(producer);
        if (p < 0) continue;  // unknown ids are reported at render time
        if (!ancestors_[i][p]) {
          throw ValidationError(
              ValidationErrorKind::kUnorderedReference,
              "Action '" + descriptors_[i].id + "' references outcomes of '" +
                  producer + "', which is not among its dependencies",
              {descriptors_[i].id, producer});
        }
      }
    }
  }
};

}  // namespace miniflow
