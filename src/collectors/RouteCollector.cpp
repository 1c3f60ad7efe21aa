#include "collectors/RouteCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <sstream>

#include <net/route.h>

namespace lanprobe::collectors {

using lanprobe::model::IpAddress;

static bool parse_hex_u32(const std::string& s, uint32_t& out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out, 16);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

std::optional<IpAddress> parse_route_hex(const std::string& hex) {
  uint32_t v = 0;
  if (hex.size() != 8 || !parse_hex_u32(hex, v)) return std::nullopt;
  return IpAddress::v4(static_cast<uint8_t>(v & 0xFF), static_cast<uint8_t>((v >> 8) & 0xFF),
                       static_cast<uint8_t>((v >> 16) & 0xFF), static_cast<uint8_t>((v >> 24) & 0xFF));
}

std::vector<IpAddress> parse_resolv_conf(const std::string& body) {
  std::vector<IpAddress> out;
  std::istringstream ss(body);
  std::string line;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string key, value;
    if (!(ls >> key >> value)) continue;
    if (key != "nameserver") continue; // also skips '#'/';' comments
    if (auto ip = IpAddress::try_parse(value)) out.push_back(*ip);
  }
  return out;
}

bool RouteCollector::sample(lanprobe::model::RouteInfo& out) {
  out = {};
  warnings_.clear();
  bool gw = sample_gateway(out);
  bool dns = sample_dns(out);
  return gw || dns;
}

bool RouteCollector::sample_gateway(lanprobe::model::RouteInfo& out) {
  auto txt = lanprobe::util::read_file_string("/proc/net/route");
  if (!txt) {
    warnings_.push_back("cannot read /proc/net/route");
    return false;
  }
  // Iface Destination Gateway Flags RefCnt Use Metric Mask MTU Window IRTT
  std::istringstream ss(*txt);
  std::string line;
  std::getline(ss, line); // header
  uint32_t best_metric = std::numeric_limits<uint32_t>::max();
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string iface, dest, gw, flags, refcnt, use, metric;
    if (!(ls >> iface >> dest >> gw >> flags >> refcnt >> use >> metric)) continue;
    if (dest != "00000000") continue;
    uint32_t fl = 0, m = 0;
    if (!parse_hex_u32(flags, fl) || (fl & RTF_GATEWAY) == 0 || (fl & RTF_UP) == 0) continue;
    auto mres = std::from_chars(metric.data(), metric.data() + metric.size(), m);
    if (mres.ec != std::errc{}) m = std::numeric_limits<uint32_t>::max() - 1;
    auto ip = parse_route_hex(gw);
    auto name = lanprobe::model::InterfaceName::try_parse(iface);
    if (!ip || !name) continue;
    if (m < best_metric) {
      best_metric = m;
      out.gateway = *ip;
      out.gateway_interface = *name;
    }
  }
  return true;
}

bool RouteCollector::sample_dns(lanprobe::model::RouteInfo& out) {
  auto txt = lanprobe::util::read_file_string("/etc/resolv.conf");
  if (!txt) {
    warnings_.push_back("cannot read /etc/resolv.conf");
    return false;
  }
  out.dns_servers = parse_resolv_conf(*txt);
  return true;
}

} // namespace lanprobe::collectors
