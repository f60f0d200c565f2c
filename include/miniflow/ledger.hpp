#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "miniflow/errors.hpp"

namespace miniflow {

// ==========================================
// Outcome Ledger
// ==========================================

// action id -> (outcome key -> value)
using OutcomeMap = std::map<std::string, std::map<std::string, std::string>>;

// Run-scoped store of outcome values. Each (action, key) pair is written at
// most once; reads never block on other reads.
class OutcomeLedger {
 public:
  void Put(const std::string& action_id, const std::string& key,
           std::string value) {
    std::unique_lock<std::shared_mutex> lock(mu_);
    auto& record = records_[action_id];
    if (!record.emplace(key, std::move(value)).second) {
      throw ConflictError(action_id, key);
    }
  }

  std::optional<std::string> Get(const std::string& action_id,
                                 const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto rit = records_.find(action_id);
    if (rit == records_.end()) return std::nullopt;
    auto kit = rit->second.find(key);
    if (kit == rit->second.end()) return std::nullopt;
    return kit->second;
  }

  std::map<std::string, std::string> OutcomesOf(
      const std::string& action_id) const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    auto it = records_.find(action_id);
    if (it == records_.end()) return {};
    return it->second;
  }

  OutcomeMap Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return OutcomeMap(records_.begin(), records_.end());
  }

  size_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    size_t total = 0;
    for (const auto& [_, record] : records_) total += record.size();
    return total;
  }

 private:
  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::map<std::string, std::string>>
      records_;
};

}  // namespace miniflow
