#pragma once

#include <cstddef>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace miniflow {

// ==========================================
// Structured action parameters
// ==========================================

// Null, scalar (always stored as text), sequence or string-keyed map.
// Scalars may carry @{...} expressions until they are rendered.
class ParamNode {
 public:
  enum Type { kNull, kScalar, kSequence, kMap };

  ParamNode() : type_(kNull) {}
  explicit ParamNode(std::string value)
      : type_(kScalar), scalar_(std::move(value)) {}

  Type GetType() const { return type_; }
  bool IsNull() const { return type_ == kNull; }
  bool IsScalar() const { return type_ == kScalar; }
  bool IsSequence() const { return type_ == kSequence; }
  bool IsMap() const { return type_ == kMap; }

  const ParamNode& operator[](const std::string& key) const {
    if (type_ != kMap) {
      return NullNode();
    }
    auto it = map_.find(key);
    if (it == map_.end()) {
      return NullNode();
    }
    return it->second;
  }

  const ParamNode& operator[](size_t index) const {
    if (type_ != kSequence || index >= sequence_.size()) {
      return NullNode();
    }
    return sequence_[index];
  }

  bool Has(const std::string& key) const {
    return type_ == kMap && map_.count(key) > 0;
  }

  std::vector<ParamNode>::const_iterator begin() const {
    return sequence_.begin();
  }
  std::vector<ParamNode>::const_iterator end() const {
    return sequence_.end();
  }

  const std::map<std::string, ParamNode>& Items() const { return map_; }
  const std::string& Scalar() const { return scalar_; }

  size_t size() const {
    if (type_ == kSequence) {
      return sequence_.size();
    } else if (type_ == kMap) {
      return map_.size();
    }
    return 0;
  }

  template <typename T>
  T As(const T& default_value = T{}) const {
    if (type_ != kScalar) {
      return default_value;
    }
    return Parse<T>(scalar_);
  }

  template <typename T>
  T AsRequired(const std::string& what = "parameter") const {
    if (type_ != kScalar) {
      throw std::runtime_error(what + " must be a scalar");
    }
    return Parse<T>(scalar_);
  }

  // Flattens a map of scalars, e.g. an `environment` parameter.
  std::map<std::string, std::string> AsStringMap() const {
    std::map<std::string, std::string> out;
    for (const auto& [key, value] : map_) {
      if (!value.IsScalar()) {
        throw std::runtime_error("value of '" + key + "' must be a scalar");
      }
      out[key] = value.scalar_;
    }
    return out;
  }

  void SetScalar(std::string value) {
    type_ = kScalar;
    scalar_ = std::move(value);
  }

  ParamNode& AddSequenceItem() {
    type_ = kSequence;
    sequence_.emplace_back();
    return sequence_.back();
  }

  ParamNode& AddMapItem(const std::string& key) {
    type_ = kMap;
    return map_[key];
  }

  bool operator==(const ParamNode& other) const {
    return type_ == other.type_ && scalar_ == other.scalar_ &&
           sequence_ == other.sequence_ && map_ == other.map_;
  }
  bool operator!=(const ParamNode& other) const { return !(*this == other); }

 private:
  Type type_;
  std::string scalar_;
  std::vector<ParamNode> sequence_;
  std::map<std::string, ParamNode> map_;

  static const ParamNode& NullNode() {
    static ParamNode null;
    return null;
  }

  template <typename T>
  T Parse(const std::string& value) const {
    if constexpr (std::is_same_v<T, std::string>) {
      return value;
    } else if constexpr (std::is_same_v<T, bool>) {
      return value == "true" || value == "1" || value == "yes" ||
             value == "on";
    } else {
      T res{};
      std::stringstream ss(value);
      ss >> res;
      return res;
    }
  }
};

}  // namespace miniflow
