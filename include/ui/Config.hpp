#pragma once

#include <string>
#include <vector>

namespace lanprobe::ui {

// U+1F5A7 THREE NETWORKED COMPUTERS
inline constexpr const char* kDefaultGlyph = "\xF0\x9F\x96\xA7";

struct Config {
  struct General {
    bool debug{false};
  } general;

  struct Probe {
    std::string neighbor_source{"auto"}; // auto | netlink | proc
    bool parallel{false};                // one lookup thread per interface
    int netlink_timeout_ms{1000};
    bool routes{true};                   // gateway/DNS annotations
    bool hostnames{true};                // reverse lookup per neighbor
    int hostname_timeout_ms{500};        // shared deadline for all lookups
  } probe;

  struct Display {
    std::string glyph{kDefaultGlyph};
    bool show_devices{true};
    bool hide_down{false};
    std::vector<std::string> ignore_prefixes;
  } display;

  // Path the settings were read from; empty when only env/defaults applied.
  std::string source_path;
};

// $XDG_CONFIG_HOME/lanprobe/config.toml, else ~/.config/lanprobe/config.toml.
std::string config_file_path();

// Resolve every key as TOML -> env -> compiled default. An empty path means
// config_file_path(). A missing file is not an error.
Config load_config(const std::string& path = "");

// Environment variable helpers (accept LANPROBE_ and lanprobe_ prefixes)
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);            // partial numbers ("12ms") yield defv
bool env_flag(const char* name, bool defv);            // 1/true/yes/on vs 0/false/no/off

// "veth, docker,br-" -> {"veth", "docker", "br-"}
std::vector<std::string> split_list(const std::string& csv);

} // namespace lanprobe::ui
