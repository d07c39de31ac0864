#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace xpcs {

// Small INI reader for run configuration.
// - [section] headers, key = value pairs, '#' or ';' comment lines
// - values are raw strings with matching surrounding quotes removed
// - every key must live inside a section
class IniConfig {
public:
  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    std::ifstream ifs(file_);
    if (!ifs) throw std::runtime_error(where_() + "cannot open config file");
    parse_(ifs);
  }

  // Parse from an in-memory stream; `origin` is only used in messages and as
  // the base for relative paths.
  IniConfig(std::istream& is, const std::filesystem::path& origin) : file_(origin) {
    parse_(is);
  }

  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_section(const std::string& section) const { return data_.count(section) != 0; }

  bool has_key(const std::string& section, const std::string& key) const {
    auto it = data_.find(section);
    return it != data_.end() && it->second.count(key) != 0;
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    auto it = data_.find(section);
    if (it != data_.end()) {
      auto kv = it->second.find(key);
      if (kv != it->second.end()) return kv->second;
    }
    if (def) return *def;
    throw std::runtime_error(where_() + "missing required key '" + key + "' in section [" + section + "]");
  }

  std::size_t get_size(const std::string& section, const std::string& key,
                       const std::optional<std::size_t>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    const std::string s = get_string(section, key);
    std::size_t pos = 0;
    unsigned long long v = 0;
    try {
      v = std::stoull(s, &pos);
    } catch (const std::exception&) {
      pos = 0;
    }
    if (pos == 0 || pos != s.size() || s.front() == '-') {
      throw std::runtime_error(where_() + section + "." + key + " must be a non-negative integer, got '" + s + "'");
    }
    return static_cast<std::size_t>(v);
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    if (!has_key(section, key) && def) return *def;
    const std::string s = get_string(section, key);
    std::size_t pos = 0;
    double v = 0.0;
    try {
      v = std::stod(s, &pos);
    } catch (const std::exception&) {
      pos = 0;
    }
    if (pos == 0 || pos != s.size()) {
      throw std::runtime_error(where_() + section + "." + key + " must be a number, got '" + s + "'");
    }
    return v;
  }

  // Path value resolved against the directory of the config file. Empty if
  // the key is absent and no default is given.
  std::filesystem::path get_path(const std::string& section, const std::string& key,
                                 const std::optional<std::string>& def = std::nullopt) const {
    const std::string s = get_string(section, key, def ? def : std::optional<std::string>(""));
    if (s.empty()) return {};
    std::filesystem::path p(s);
    if (p.is_absolute()) return p;
    return (base_dir() / p).lexically_normal();
  }

  // Fail on typos: every key of `section` must be one of `allowed`.
  void require_known_keys(const std::string& section, std::initializer_list<const char*> allowed) const {
    auto it = data_.find(section);
    if (it == data_.end()) return;
    std::vector<std::string> unknown;
    for (const auto& kv : it->second) {
      const bool ok = std::any_of(allowed.begin(), allowed.end(), [&](const char* a) { return kv.first == a; });
      if (!ok) unknown.push_back(kv.first);
    }
    if (unknown.empty()) return;
    std::sort(unknown.begin(), unknown.end());
    std::string msg = where_() + "unknown key(s) in section [" + section + "]:";
    for (const auto& k : unknown) msg += " " + k;
    throw std::runtime_error(msg);
  }

private:
  std::filesystem::path file_;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;

  static std::string trim_(const std::string& s) {
    auto ws = [](unsigned char ch) { return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n'; };
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && ws(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && ws(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
  }

  static std::string unquote_(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
      return s.substr(1, s.size() - 2);
    }
    return s;
  }

  std::string where_() const { return "IniConfig[" + file_.string() + "]: "; }

  void parse_(std::istream& is) {
    std::string section;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(is, line)) {
      ++lineno;
      const std::string s = trim_(line);
      if (s.empty() || s[0] == '#' || s[0] == ';') continue;

      if (s.front() == '[') {
        if (s.back() != ']') {
          throw std::runtime_error(where_() + "unterminated section header at line " + std::to_string(lineno));
        }
        section = trim_(s.substr(1, s.size() - 2));
        if (section.empty()) {
          throw std::runtime_error(where_() + "empty section header at line " + std::to_string(lineno));
        }
        data_[section];
        continue;
      }

      const auto eq = s.find('=');
      if (eq == std::string::npos) {
        throw std::runtime_error(where_() + "expected key = value at line " + std::to_string(lineno) + ": " + s);
      }
      const std::string key = trim_(s.substr(0, eq));
      if (key.empty()) throw std::runtime_error(where_() + "empty key at line " + std::to_string(lineno));
      if (section.empty()) {
        throw std::runtime_error(where_() + "key '" + key + "' outside any section at line " + std::to_string(lineno));
      }
      data_[section][key] = unquote_(trim_(s.substr(eq + 1)));
    }
  }
};

} // namespace xpcs
