#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fixture {

namespace fs = std::filesystem;

// Fresh temp tree per test: /tmp/lanprobe_test_<tag>_<pid>
inline fs::path make_root(const std::string& tag) {
  auto root = fs::temp_directory_path() / fs::path("lanprobe_test_" + tag + "_" + std::to_string(::getpid()));
  std::error_code ec;
  fs::remove_all(root, ec);
  fs::create_directories(root);
  return root;
}

inline void write(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << content;
}

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
  EnvGuard(const char* name, const std::string& value) : name_(name) { ::setenv(name, value.c_str(), 1); }
  ~EnvGuard() { ::unsetenv(name_); }
  EnvGuard(const EnvGuard&) = delete;
  EnvGuard& operator=(const EnvGuard&) = delete;
private:
  const char* name_;
};

// sysfs entry for one network device
inline void add_sys_iface(const fs::path& root, const std::string& name, int type,
                          const std::string& operstate, const std::string& flags,
                          const std::string& mac, int ifindex) {
  auto d = root / "sys/class/net" / name;
  write(d / "type", std::to_string(type) + "\n");
  write(d / "operstate", operstate + "\n");
  write(d / "flags", flags + "\n");
  write(d / "address", mac + "\n");
  write(d / "ifindex", std::to_string(ifindex) + "\n");
}

// Marks an interface as having an IPv4 neighbor table
inline void add_neigh_table(const fs::path& root, const std::string& name) {
  fs::create_directories(root / "proc/sys/net/ipv4/neigh" / name);
}

inline const char* kArpHeader =
  "IP address       HW type     Flags       HW address            Mask     Device\n";

} // namespace fixture
