#pragma once

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lanprobe::util {

// Reads the flat subset of TOML used by config.toml: [section] headers and
// key = value pairs with bare, "double" or 'single' quoted values.
class TomlReader {
public:
  bool load(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::stringstream buf;
    buf << in.rdbuf();
    parse(buf.str());
    return true;
  }

  void load_string(std::string_view text) { parse(text); }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* v = find(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    const auto* v = find(section, key);
    if (!v || v->empty()) return def;
    try {
      size_t used = 0;
      int out = std::stoi(*v, &used);
      return used == v->size() ? out : def;
    } catch (const std::exception&) {
      return def;
    }
  }

  [[nodiscard]] bool get_bool(std::string_view section, std::string_view key, bool def = false) const {
    const auto* v = find(section, key);
    if (!v) return def;
    if (*v == "true" || *v == "True" || *v == "TRUE" || *v == "1") return true;
    if (*v == "false" || *v == "False" || *v == "FALSE" || *v == "0") return false;
    return def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return find(section, key) != nullptr;
  }

private:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };
  std::vector<Entry> entries_;

  void parse(std::string_view text) {
    entries_.clear();
    std::string section;
    size_t pos = 0;
    while (pos <= text.size()) {
      size_t nl = text.find('\n', pos);
      if (nl == std::string_view::npos) nl = text.size();
      auto line = trim(text.substr(pos, nl - pos));
      pos = nl + 1;
      if (line.empty() || line[0] == '#') continue;
      if (line.front() == '[') {
        auto close = line.find(']');
        if (close != std::string_view::npos) section = std::string(trim(line.substr(1, close - 1)));
        continue;
      }
      auto eq = line.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(line.substr(0, eq)));
      if (key.empty()) continue;
      set(section, key, unquote(trim(line.substr(eq + 1))));
    }
  }

  void set(const std::string& section, const std::string& key, std::string value) {
    for (auto& e : entries_) {
      if (e.section == section && e.key == key) { e.value = std::move(value); return; }
    }
    entries_.push_back({section, key, std::move(value)});
  }

  [[nodiscard]] const std::string* find(std::string_view section, std::string_view key) const {
    for (const auto& e : entries_)
      if (e.section == section && e.key == key) return &e.value;
    return nullptr;
  }

  // Quoted values keep '#'; bare values drop a trailing comment.
  static std::string unquote(std::string_view sv) {
    if (!sv.empty() && (sv.front() == '"' || sv.front() == '\'')) {
      char q = sv.front();
      auto end = sv.find(q, 1);
      if (end != std::string_view::npos) return std::string(sv.substr(1, end - 1));
      return std::string(sv.substr(1));
    }
    auto hash = sv.find('#');
    if (hash != std::string_view::npos) sv = trim(sv.substr(0, hash));
    return std::string(sv);
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace lanprobe::util
