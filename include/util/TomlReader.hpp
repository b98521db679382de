#pragma once

#include <cctype>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace timr::util {

// Minimal TOML subset: comments, [table], [[array-of-tables]], key = value
// with bare or double-quoted values. Enough for timr.toml.
class TomlReader {
public:
  struct Table {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def = "") const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    parse(text);
    return true;
  }

  void parse(std::string_view text) {
    sections_.clear();
    arrays_.clear();
    Table* current = &ensure_section("");
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t nl = text.find('\n', pos);
      if (nl == std::string_view::npos) nl = text.size();
      auto sv = trim(strip_comment(text.substr(pos, nl - pos)));
      pos = nl + 1;
      if (sv.empty()) continue;
      if (sv.size() >= 4 && sv.substr(0, 2) == "[[" && sv.substr(sv.size() - 2) == "]]") {
        std::string name(trim(sv.substr(2, sv.size() - 4)));
        current = &append_array_table(name);
        continue;
      }
      if (sv.front() == '[' && sv.back() == ']') {
        std::string name(trim(sv.substr(1, sv.size() - 2)));
        current = &ensure_section(name);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      current->set(key, val);
    }
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
    if (val.empty()) return def;
    if (val == "true" || val == "True" || val == "TRUE" || val == "1") return true;
    if (val == "false" || val == "False" || val == "FALSE" || val == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  // Tables declared with [[name]], in file order; empty if none
  [[nodiscard]] const std::vector<Table>& array(std::string_view name) const {
    static const std::vector<Table> empty;
    for (const auto& [n, v] : arrays_)
      if (n == name) return v;
    return empty;
  }

private:
  std::vector<std::pair<std::string, Table>> sections_;
  std::vector<std::pair<std::string, std::vector<Table>>> arrays_;

  Table& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Table{});
    return sections_.back().second;
  }

  Table& append_array_table(const std::string& name) {
    for (auto& [n, v] : arrays_) {
      if (n == name) { v.emplace_back(); return v.back(); }
    }
    arrays_.emplace_back(name, std::vector<Table>(1));
    return arrays_.back().second.back();
  }

  [[nodiscard]] const Table* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  // Drop a trailing "# ..." that is not inside a quoted value
  static std::string_view strip_comment(std::string_view sv) {
    bool quoted = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') quoted = !quoted;
      else if (sv[i] == '#' && !quoted) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace timr::util
