#include "util/Procfs.hpp"

#include <sys/types.h>
#include <dirent.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace lanprobe::util {

static std::string env_root(const char* name) {
  const char* env = std::getenv(name);
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap_under(const std::string& abs, const char* prefix, const char* env_name) {
  size_t n = std::strlen(prefix);
  if (abs.rfind(prefix, 0) != 0) return abs;
  if (abs.size() > n && abs[n] != '/') return abs; // e.g. /system, /etcd
  auto root = env_root(env_name);
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  return remap_under(abs, "/proc", "LANPROBE_PROC_ROOT");
}

auto map_sys_path(const std::string& abs) -> std::string {
  return remap_under(abs, "/sys", "LANPROBE_SYS_ROOT");
}

auto map_etc_path(const std::string& abs) -> std::string {
  return remap_under(abs, "/etc", "LANPROBE_ETC_ROOT");
}

auto map_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) == 0) return map_proc_path(abs);
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  if (abs.rfind("/etc", 0) == 0) return map_etc_path(abs);
  return abs;
}

auto remapped() -> bool {
  return !env_root("LANPROBE_PROC_ROOT").empty() || !env_root("LANPROBE_SYS_ROOT").empty();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // sysfs attributes of a vanished device fail on read, not on open
  if (in.bad()) return std::nullopt;
  return s;
}

auto read_attr(const std::string& abs) -> std::optional<std::string> {
  auto txt = read_file_string(abs);
  if (!txt) return std::nullopt;
  std::string s = txt->substr(0, txt->find('\n'));
  auto first = s.find_first_not_of(" \t\r");
  if (first == std::string::npos) return std::string();
  auto last = s.find_last_not_of(" \t\r");
  return s.substr(first, last - first + 1);
}

auto list_dir(const std::string& abs) -> std::optional<std::vector<std::string>> {
  auto path = map_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) return std::nullopt;
  std::vector<std::string> out;
  while (auto* ent = ::readdir(d)) {
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  std::sort(out.begin(), out.end());
  return out;
}

auto path_exists(const std::string& abs) -> bool {
  std::error_code ec;
  return std::filesystem::exists(map_path(abs), ec);
}

} // namespace lanprobe::util
