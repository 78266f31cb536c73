#pragma once

#include <cctype>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>
#include <string>
#include <string_view>

namespace seagreen::util {

// The TOML subset the config file uses: [section] headers, key = value
// pairs, "quoted" strings and # comments (full-line or trailing).
// Values are kept flat under "section.key"; a later duplicate wins.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    parse(ss.str());
    return true;
  }

  void parse(std::string_view text) {
    values_.clear();
    std::string section;
    size_t pos = 0;
    while (pos <= text.size()) {
      auto nl = text.find('\n', pos);
      if (nl == std::string_view::npos) nl = text.size();
      auto line = trim(strip_comment(text.substr(pos, nl - pos)));
      pos = nl + 1;
      if (line.empty()) continue;
      if (line.front() == '[') {
        if (line.back() == ']') section = std::string(trim(line.substr(1, line.size() - 2)));
        continue;
      }
      auto eq = line.find('=');
      if (eq == std::string_view::npos) continue;
      auto key = trim(line.substr(0, eq));
      if (key.empty()) continue;
      values_[qualified(section, key)] = std::string(unquote(trim(line.substr(eq + 1))));
    }
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                        const std::string& def = "") const {
    const auto* v = lookup(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = lookup(section, key);
    if (!v || v->empty()) return def;
    try { return std::stoi(*v); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = lookup(section, key);
    if (!v) return def;
    std::string lower;
    for (char c : *v) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "true" || lower == "1") return true;
    if (lower == "false" || lower == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return lookup(section, key) != nullptr;
  }

private:
  std::map<std::string, std::string, std::less<>> values_;

  static std::string qualified(std::string_view section, std::string_view key) {
    std::string q(section);
    q.push_back('.');
    q.append(key);
    return q;
  }

  [[nodiscard]] const std::string* lookup(std::string_view section, std::string_view key) const {
    auto it = values_.find(qualified(section, key));
    return it == values_.end() ? nullptr : &it->second;
  }

  // '#' inside a quoted value is data ("#3d8b6f")
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view unquote(std::string_view sv) {
    if (sv.size() >= 2 && sv.front() == '"' && sv.back() == '"') return sv.substr(1, sv.size() - 2);
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace seagreen::util
