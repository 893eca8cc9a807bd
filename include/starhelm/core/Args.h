#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace starhelm::core {

// Small argument parser for the headless tools.
//
// Supports:
//  - Flags:         --json   -h
//  - KV args:       --dest earth   --dest=earth
//  - Multi-value:   --fire 4 9     (after setArity("fire", 2))
//  - Positional:    everything else
//
// Repeated keys keep every value; last() returns the most recent one.
class Args {
public:
  Args() = default;
  Args(int argc, char** argv) { parse(argc, argv); }

  // Configure a long option to consume multiple subsequent values.
  void setArity(std::string_view key, int valueCount) {
    if (valueCount <= 0) return;
    arity_[std::string(key)] = valueCount;
  }

  void parse(int argc, char** argv) {
    program_.clear();
    kv_.clear();
    flags_.clear();
    positional_.clear();

    if (argc > 0 && argv && argv[0]) program_ = argv[0];

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i] ? std::string(argv[i]) : std::string();
      if (a.empty()) continue;

      if (startsWith(a, "--")) {
        const auto eq = a.find('=');
        if (eq != std::string::npos) {
          kv_[a.substr(2, eq - 2)].push_back(a.substr(eq + 1));
          continue;
        }

        const std::string key = a.substr(2);
        const auto ar = arity_.find(key);
        const int need = (ar != arity_.end()) ? ar->second : 1;

        int took = 0;
        while (took < need && i + 1 < argc && argv[i + 1] && !isSwitch(argv[i + 1])) {
          kv_[key].push_back(std::string(argv[++i]));
          ++took;
        }

        // No value(s) -> treat as a flag.
        if (took == 0) flags_.push_back(key);
        continue;
      }

      // Short flags (-h, -v, -hv)
      if (startsWith(a, "-") && a.size() >= 2 && !isNumber(a)) {
        for (std::size_t j = 1; j < a.size(); ++j) {
          const char c = a[j];
          if (std::isalnum((unsigned char)c) || c == '_') {
            flags_.push_back(std::string(1, c));
          }
        }
        continue;
      }

      positional_.push_back(a);
    }
  }

  const std::string& program() const { return program_; }

  bool hasFlag(std::string_view key) const {
    return std::find(flags_.begin(), flags_.end(), key) != flags_.end();
  }

  bool has(std::string_view key) const {
    if (hasFlag(key)) return true;
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string> last(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::vector<std::string> values(std::string_view key) const {
    const auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return {};
    return it->second;
  }

  const std::vector<std::string>& flags() const { return flags_; }
  const std::vector<std::string>& positional() const { return positional_; }

  // Typed helpers (return true if provided & parsed).
  bool getInt(std::string_view key, int& out) const {
    const auto v = last(key);
    if (!v) return false;
    char* end = nullptr;
    const long val = std::strtol(v->c_str(), &end, 10);
    if (end == v->c_str()) return false;
    out = static_cast<int>(val);
    return true;
  }

  bool getDouble(std::string_view key, double& out) const {
    const auto v = last(key);
    if (!v) return false;
    return parseDouble(*v, out);
  }

  bool getString(std::string_view key, std::string& out) const {
    const auto v = last(key);
    if (!v) return false;
    out = *v;
    return true;
  }

  // Every value of a (possibly repeated, possibly multi-value) option as doubles.
  // Returns false if any value fails to parse.
  bool getDoubles(std::string_view key, std::vector<double>& out) const {
    out.clear();
    for (const auto& s : values(key)) {
      double d = 0.0;
      if (!parseDouble(s, d)) return false;
      out.push_back(d);
    }
    return true;
  }

  // Reports the first option/flag not in `known`.
  bool checkKnown(std::initializer_list<std::string_view> known, std::string* outError = nullptr) const {
    auto isKnown = [&](std::string_view k) {
      return std::find(known.begin(), known.end(), k) != known.end();
    };
    for (const auto& f : flags_) {
      if (!isKnown(f)) {
        if (outError) *outError = "unknown flag: " + f;
        return false;
      }
    }
    for (const auto& kv : kv_) {
      if (!isKnown(kv.first)) {
        if (outError) *outError = "unknown option: --" + kv.first;
        return false;
      }
    }
    return true;
  }

private:
  static bool startsWith(const std::string& s, const char* prefix) {
    const std::size_t n = std::char_traits<char>::length(prefix);
    return s.size() >= n && s.compare(0, n, prefix) == 0;
  }

  static bool isNumber(const std::string& s) {
    double d = 0.0;
    return parseDouble(s, d);
  }

  // Negative numbers ("-3") are values, not switches.
  static bool isSwitch(const char* s) {
    if (!s || !*s) return false;
    return s[0] == '-' && !isNumber(s);
  }

  static bool parseDouble(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    const double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') return false;
    out = val;
    return true;
  }

  std::string program_;
  std::unordered_map<std::string, int> arity_;
  std::unordered_map<std::string, std::vector<std::string>> kv_;
  std::vector<std::string> flags_;
  std::vector<std::string> positional_;
};

} // namespace starhelm::core
