#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "model/Snapshot.hpp"
#include "ui/Config.hpp"

namespace lanprobe::ui {

// Pango color tokens recognized by the bar. Fixed contract.
inline constexpr const char* kColorGreen  = "#00FF00"; // healthy / reachable
inline constexpr const char* kColorYellow = "#FFFF00"; // degraded / stale
inline constexpr const char* kColorGray   = "#888888"; // empty, unreachable / failed, unknown

// Waybar custom module payload.
struct RenderResult {
  std::string text;
  std::string tooltip;
  std::string alt;
  std::vector<std::string> classes;
};

const char* health_color(lanprobe::model::Health h);
const char* neighbor_color(lanprobe::model::NeighborState s);

// Escapes &, < and > for Pango markup; malformed UTF-8 becomes U+FFFD.
std::string escape_markup(std::string_view sv);

class Formatter {
public:
  explicit Formatter(Config::Display opts = {});

  // Pure and deterministic: identical input yields identical output.
  [[nodiscard]] RenderResult render(const lanprobe::model::ClassifiedSnapshot& cs) const;
  [[nodiscard]] RenderResult render_error(std::string_view context, std::string_view message) const;

  // Loopback is never displayed; hide_down and ignore_prefixes narrow further.
  [[nodiscard]] bool displayed(const lanprobe::model::Interface& iface) const;

private:
  void append_interface(std::string& out, const lanprobe::model::ClassifiedSnapshot& cs,
                        const lanprobe::model::Interface& iface) const;
  static std::string annotation(const lanprobe::model::RouteInfo& route,
                                const lanprobe::model::InterfaceName& ifname,
                                const lanprobe::model::IpAddress& ip);
  static std::string dns_summary(const lanprobe::model::NetworkSnapshot& snap);

  Config::Display opts_;
};

} // namespace lanprobe::ui
