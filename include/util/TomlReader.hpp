#pragma once

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace wildrex::util {

// Flat TOML subset: [section], key = value, "quoted" or 'literal' strings,
// # comments. Enough for the wildrex config file.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    parse(in);
    return true;
  }

  void load_string(std::string_view text) {
    std::istringstream in{std::string(text)};
    parse(in);
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* s = find_section(section);
    if (!s) return def;
    auto val = s->get(key, "");
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  // Single-character value, e.g. unknown_token = "?". Anything longer is rejected.
  [[nodiscard]] bool get_char(std::string_view section, std::string_view key, char& out) const {
    const auto* s = find_section(section);
    if (!s || !s->has(key)) return false;
    auto val = s->get(key, "");
    if (val.size() != 1) return false;
    out = val[0];
    return true;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  // 1-based numbers of lines that were neither blank, comment, header nor key = value.
  [[nodiscard]] const std::vector<int>& bad_lines() const { return bad_lines_; }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;
  std::vector<int> bad_lines_;

  void parse(std::istream& in) {
    sections_.clear();
    bad_lines_.clear();
    std::string current_section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(line);
      if (sv.empty() || sv[0] == '#') continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos || eq == 0) { bad_lines_.push_back(lineno); continue; }
      std::string key(trim(sv.substr(0, eq)));
      ensure_section(current_section).set(key, unquote(trim(sv.substr(eq + 1))));
    }
  }

  // Quoted values keep everything between the quotes (a "#" value is legal);
  // bare values lose a trailing "# comment".
  static std::string unquote(std::string_view val) {
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'')) {
      auto close = val.find(val.front(), 1);
      if (close != std::string_view::npos) return std::string(val.substr(1, close - 1));
    }
    auto hash = val.find('#');
    if (hash != std::string_view::npos) val = trim(val.substr(0, hash));
    return std::string(val);
  }

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace wildrex::util
