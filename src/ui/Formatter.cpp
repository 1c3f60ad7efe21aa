#include "ui/Formatter.hpp"
#include "app/Classifier.hpp"
#include "util/Utf8.hpp"
#include <algorithm>
#include <string>

namespace lanprobe::ui {

using lanprobe::model::Health;
using lanprobe::model::NeighborState;

namespace {

constexpr const char* kBranch = "  \xE2\x94\x9C\xE2\x94\x80 "; // "  ├─ "
constexpr const char* kLast   = "  \xE2\x94\x94\xE2\x94\x80 "; // "  └─ "

void append_span(std::string& out, const char* color, std::string_view escaped_body) {
  out += "<span color='";
  out += color;
  out += "'>";
  out += escaped_body;
  out += "</span>";
}

std::string device_count(size_t n) {
  return std::to_string(n) + (n == 1 ? " device" : " devices");
}

bool is_neighbor(const lanprobe::model::NetworkSnapshot& snap, const lanprobe::model::IpAddress& ip) {
  for (const auto& [name, entries] : snap.neighbors_by_interface)
    for (const auto& e : entries)
      if (e.ip == ip) return true;
  return false;
}

} // namespace

const char* health_color(Health h) {
  switch (h) {
    case Health::Healthy:     return kColorGreen;
    case Health::Degraded:    return kColorYellow;
    case Health::Empty:
    case Health::Unreachable: return kColorGray;
  }
  return kColorGray;
}

const char* neighbor_color(NeighborState s) {
  switch (s) {
    case NeighborState::Reachable: return kColorGreen;
    case NeighborState::Stale:     return kColorYellow;
    case NeighborState::Failed:
    case NeighborState::Unknown:   return kColorGray;
  }
  return kColorGray;
}

std::string escape_markup(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (char c : lanprobe::util::sanitize_utf8(raw)) {
    if (c == '&') out += "&amp;";
    else if (c == '<') out += "&lt;";
    else if (c == '>') out += "&gt;";
    else out += c;
  }
  return out;
}

Formatter::Formatter(Config::Display opts) : opts_(std::move(opts)) {}

bool Formatter::displayed(const lanprobe::model::Interface& iface) const {
  if (iface.kind == lanprobe::model::InterfaceKind::Loopback) return false;
  if (opts_.hide_down && iface.oper_state == lanprobe::model::OperState::Down) return false;
  const auto& name = iface.name.str();
  for (const auto& prefix : opts_.ignore_prefixes) {
    if (!prefix.empty() && name.rfind(prefix, 0) == 0) return false;
  }
  return true;
}

std::string Formatter::annotation(const lanprobe::model::RouteInfo& route,
                                  const lanprobe::model::InterfaceName& ifname,
                                  const lanprobe::model::IpAddress& ip) {
  bool gateway = route.gateway && *route.gateway == ip &&
                 (!route.gateway_interface || *route.gateway_interface == ifname);
  bool dns = std::find(route.dns_servers.begin(), route.dns_servers.end(), ip) != route.dns_servers.end();
  if (gateway && dns) return " [gateway, dns]";
  if (gateway) return " [gateway]";
  if (dns) return " [dns]";
  return {};
}

// "DNS: 1.1.1.1 (external), 192.168.1.53 (local)" for resolvers that are not
// neighbors on any interface; empty when every resolver is already listed.
std::string Formatter::dns_summary(const lanprobe::model::NetworkSnapshot& snap) {
  std::string out;
  for (const auto& dns : snap.route.dns_servers) {
    if (is_neighbor(snap, dns)) continue;
    out += out.empty() ? "DNS: " : ", ";
    out += dns.str();
    out += lanprobe::model::is_local_address(dns) ? " (local)" : " (external)";
  }
  return out;
}

void Formatter::append_interface(std::string& out, const lanprobe::model::ClassifiedSnapshot& cs,
                                 const lanprobe::model::Interface& iface) const {
  const auto& snap = cs.snapshot;
  const auto& neighbors = snap.neighbors(iface.name);
  Health h = cs.health_of(iface.name);

  // eth0 (ethernet, 192.168.1.5): healthy, 1 device
  std::string header = iface.name.str();
  header += " (";
  header += lanprobe::model::to_string(iface.kind);
  auto v4 = std::find_if(iface.addresses.begin(), iface.addresses.end(),
                         [](const auto& a) { return a.is_v4(); });
  if (v4 != iface.addresses.end()) {
    header += ", ";
    header += v4->str();
  }
  header += "): ";
  header += lanprobe::model::to_string(h);
  header += ", ";
  header += device_count(neighbors.size());
  append_span(out, health_color(h), escape_markup(header));

  std::vector<std::string> children;
  auto failure = snap.lookup_failures.find(iface.name);
  if (failure != snap.lookup_failures.end()) {
    std::string line;
    append_span(line, kColorGray, escape_markup("lookup failed: " + failure->second));
    children.push_back(std::move(line));
  }
  if (opts_.show_devices) {
    for (const auto& n : neighbors) {
      std::string body;
      if (auto host = snap.hostnames.find(n.ip); host != snap.hostnames.end()) {
        body += host->second;
        body += ' ';
      }
      body += n.ip.str();
      body += ' ';
      body += n.mac ? n.mac->str() : std::string("(incomplete)");
      body += ' ';
      body += lanprobe::model::to_string(n.state);
      body += annotation(snap.route, iface.name, n.ip);
      std::string line;
      append_span(line, neighbor_color(n.state), escape_markup(body));
      children.push_back(std::move(line));
    }
    if (snap.route.gateway_interface && *snap.route.gateway_interface == iface.name) {
      std::string dns = dns_summary(snap);
      if (!dns.empty()) {
        std::string line;
        append_span(line, kColorGray, escape_markup(dns));
        children.push_back(std::move(line));
      }
    }
  }
  for (size_t i = 0; i < children.size(); ++i) {
    out += '\n';
    out += (i + 1 == children.size()) ? kLast : kBranch;
    out += children[i];
  }
}

RenderResult Formatter::render(const lanprobe::model::ClassifiedSnapshot& cs) const {
  RenderResult r;
  size_t active = 0;
  bool first = true;
  for (const auto& iface : cs.snapshot.interfaces) {
    if (!displayed(iface)) continue;
    Health h = cs.health_of(iface.name);
    if (h == Health::Healthy || h == Health::Degraded) ++active;
    if (!first) r.tooltip += "\n\n";
    first = false;
    append_interface(r.tooltip, cs, iface);
  }
  if (first) r.tooltip = "No network interfaces found";

  r.text = opts_.glyph + " " + std::to_string(active);
  Health worst = lanprobe::app::worst_health(
      cs, [this](const lanprobe::model::Interface& iface) { return displayed(iface); });
  r.alt = lanprobe::model::to_string(worst);
  r.classes = {"network", r.alt};
  if (active > 0) r.classes.emplace_back("active");
  return r;
}

RenderResult Formatter::render_error(std::string_view context, std::string_view message) const {
  RenderResult r;
  r.text = opts_.glyph + " --";
  r.tooltip = "Unable to fetch network data\n\n";
  r.tooltip += escape_markup(context);
  r.tooltip += ": ";
  r.tooltip += escape_markup(message);
  r.alt = "error";
  r.classes = {"network", "error"};
  return r;
}

} // namespace lanprobe::ui
