#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace lanprobe::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("LANPROBE_", 0) == 0) {
    alt = std::string("lanprobe_") + n.substr(9);
  } else if (n.rfind("lanprobe_", 0) == 0) {
    alt = std::string("LANPROBE_") + n.substr(9);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  // whole value must be numeric, matching TomlReader::get_int
  std::string s(v);
  try {
    size_t used = 0;
    int out = std::stoi(s, &used);
    return used == s.size() ? out : defv;
  } catch (const std::exception&) {
    return defv;
  }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  std::string s(v);
  for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (s == "0" || s == "false" || s == "no" || s == "off" || s == "n" || s == "f") return false;
  if (s == "1" || s == "true" || s == "yes" || s == "on" || s == "y" || s == "t") return true;
  return defv;
}

std::vector<std::string> split_list(const std::string& csv) {
  std::vector<std::string> out;
  size_t pos = 0;
  while (pos <= csv.size()) {
    size_t comma = csv.find(',', pos);
    if (comma == std::string::npos) comma = csv.size();
    std::string item = csv.substr(pos, comma - pos);
    auto first = item.find_first_not_of(" \t");
    if (first != std::string::npos) {
      auto last = item.find_last_not_of(" \t");
      out.push_back(item.substr(first, last - first + 1));
    }
    pos = comma + 1;
  }
  return out;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/lanprobe/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/lanprobe/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const lanprobe::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const lanprobe::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const lanprobe::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  lanprobe::util::TomlReader toml;
  std::string p = path.empty() ? config_file_path() : path;
  bool have_toml = !p.empty() && toml.load(p);
  if (have_toml) c.source_path = p;

  // --- [general] ---
  c.general.debug = resolve_bool(toml, have_toml, "general", "debug", "LANPROBE_DEBUG", false);

  // --- [probe] ---
  c.probe.neighbor_source    = resolve_string(toml, have_toml, "probe", "neighbor_source",    "LANPROBE_NEIGHBOR_SOURCE", "auto");
  c.probe.parallel           = resolve_bool  (toml, have_toml, "probe", "parallel",           "LANPROBE_PARALLEL", false);
  c.probe.netlink_timeout_ms = resolve_int   (toml, have_toml, "probe", "netlink_timeout_ms", "LANPROBE_NETLINK_TIMEOUT_MS", 1000);
  c.probe.routes             = resolve_bool  (toml, have_toml, "probe", "routes",             "LANPROBE_ROUTES", true);
  c.probe.hostnames          = resolve_bool  (toml, have_toml, "probe", "hostnames",          "LANPROBE_HOSTNAMES", true);
  c.probe.hostname_timeout_ms = resolve_int  (toml, have_toml, "probe", "hostname_timeout_ms", "LANPROBE_HOSTNAME_TIMEOUT_MS", 500);
  for (auto& ch : c.probe.neighbor_source) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  c.probe.netlink_timeout_ms = std::clamp(c.probe.netlink_timeout_ms, 10, 10000);
  c.probe.hostname_timeout_ms = std::clamp(c.probe.hostname_timeout_ms, 10, 5000);

  // --- [display] ---
  c.display.glyph           = resolve_string(toml, have_toml, "display", "glyph",        "LANPROBE_GLYPH", kDefaultGlyph);
  c.display.show_devices    = resolve_bool  (toml, have_toml, "display", "show_devices", "LANPROBE_SHOW_DEVICES", true);
  c.display.hide_down       = resolve_bool  (toml, have_toml, "display", "hide_down",    "LANPROBE_HIDE_DOWN", false);
  c.display.ignore_prefixes = split_list(
      resolve_string(toml, have_toml, "display", "ignore_prefixes", "LANPROBE_IGNORE_PREFIXES", ""));

  return c;
}

} // namespace lanprobe::ui
