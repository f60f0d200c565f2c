#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "miniflow/logging.hpp"

namespace miniflow {

// ==========================================
// Service messages in action output
// ==========================================

inline std::string Base64Encode(const std::string& in) {
  static const char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve((in.size() + 2) / 3 * 4);
  size_t i = 0;
  for (; i + 2 < in.size(); i += 3) {
    uint32_t n = (static_cast<uint8_t>(in[i]) << 16) |
                 (static_cast<uint8_t>(in[i + 1]) << 8) |
                 static_cast<uint8_t>(in[i + 2]);
    out += kAlphabet[(n >> 18) & 63];
    out += kAlphabet[(n >> 12) & 63];
    out += kAlphabet[(n >> 6) & 63];
    out += kAlphabet[n & 63];
  }
  if (i + 1 == in.size()) {
    uint32_t n = static_cast<uint8_t>(in[i]) << 16;
    out += kAlphabet[(n >> 18) & 63];
    out += kAlphabet[(n >> 12) & 63];
    out += "==";
  } else if (i + 2 == in.size()) {
    uint32_t n = (static_cast<uint8_t>(in[i]) << 16) |
                 (static_cast<uint8_t>(in[i + 1]) << 8);
    out += kAlphabet[(n >> 18) & 63];
    out += kAlphabet[(n >> 12) & 63];
    out += kAlphabet[(n >> 6) & 63];
    out += '=';
  }
  return out;
}

// Strict decoder: throws std::invalid_argument on anything but padded
// standard-alphabet input.
inline std::string Base64Decode(const std::string& in) {
  auto value_of = [](char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
  };
  if (in.size() % 4 != 0) {
    throw std::invalid_argument("base64 length is not a multiple of 4");
  }
  std::string out;
  out.reserve(in.size() / 4 * 3);
  for (size_t i = 0; i < in.size(); i += 4) {
    int pad = 0;
    uint32_t n = 0;
    for (size_t j = 0; j < 4; ++j) {
      char c = in[i + j];
      if (c == '=' && i + 4 == in.size() && j >= 2) {
        ++pad;
        n <<= 6;
        continue;
      }
      int v = value_of(c);
      if (v < 0 || pad > 0) {
        throw std::invalid_argument("invalid base64 input");
      }
      n = (n << 6) | static_cast<uint32_t>(v);
    }
    out += static_cast<char>((n >> 16) & 0xFF);
    if (pad < 2) out += static_cast<char>((n >> 8) & 0xFF);
    if (pad < 1) out += static_cast<char>(n & 0xFF);
  }
  return out;
}

constexpr const char kServicePrefix[] = "##miniflow[";
constexpr const char kServiceSuffix[] = "]##";

// Shell helper prepended to shell scripts. `yield_outcome KEY [VALUE]`
// reads the value from stdin when VALUE is omitted.
inline const char* YieldOutcomeFunction() {
  return R"sh(yield_outcome(){
  [ "$1" = "" ] && echo "Missing key (first argument)" && return 1
  command -v base64 >/dev/null || { echo "Missing command: base64"; return 2; }
  if [ "$#" -ge 2 ]; then value="$2"; else value="$(cat)"; fi
  echo "##miniflow[yield-outcome-b64 $(
    printf '%s' "$1" | base64 | tr -d '\n'
  ) $(
    printf '%s' "$value" | base64 | tr -d '\n'
  )]##"
  return 0
}
)sh";
}

// Scans action output line by line. Lines that end with a service message
// are consumed; any text before the message is passed through.
class ServiceMessageScanner {
 public:
  explicit ServiceMessageScanner(LogFn log = {}) : log_(std::move(log)) {}

  // Returns the text to emit for `line`, or nullopt if nothing remains.
  std::optional<std::string> Feed(const std::string& line) {
    const std::string suffix = kServiceSuffix;
    if (line.size() < suffix.size() ||
        line.compare(line.size() - suffix.size(), suffix.size(), suffix) != 0) {
      return line;
    }
    size_t start = line.rfind(kServicePrefix);
    if (start == std::string::npos) return line;

    size_t body_begin = start + sizeof(kServicePrefix) - 1;
    std::string body =
        line.substr(body_begin, line.size() - suffix.size() - body_begin);
    Process(body);

    std::string preceding = line.substr(0, start);
    if (preceding.empty()) return std::nullopt;
    return preceding;
  }

  const std::map<std::string, std::string>& Outcomes() const {
    return outcomes_;
  }

 private:
  LogFn log_;
  std::map<std::string, std::string> outcomes_;

  void Process(const std::string& body) {
    std::istringstream in(body);
    std::string verb;
    in >> verb;
    std::vector<std::string> args;
    for (std::string arg; in >> arg;) args.push_back(arg);

    // An empty value encodes to nothing, leaving a single argument.
    if (verb == "yield-outcome-b64" && (args.size() == 1 || args.size() == 2)) {
      try {
        std::string key = Base64Decode(args[0]);
        std::string value = args.size() == 2 ? Base64Decode(args[1]) : "";
        if (log_) log_(LogLevel::kDebug, "[shell] Outcome reported: " + key);
        outcomes_[key] = std::move(value);
      } catch (const std::invalid_argument& e) {
        if (log_) {
          log_(LogLevel::kWarn,
               std::string("[shell] Malformed service message: ") + e.what());
        }
      }
      return;
    }
    if (log_) {
      log_(LogLevel::kWarn, "[shell] Unrecognized service message: '" + body +
                                "'");
    }
  }
};

}  // namespace miniflow
