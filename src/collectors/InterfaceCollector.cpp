#include "collectors/InterfaceCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <ifaddrs.h>
#include <net/if.h>
#include <net/if_arp.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace lanprobe::collectors {

using lanprobe::model::InterfaceKind;
using lanprobe::model::OperState;

bool read_bound_addresses(std::vector<BoundAddress>& out, std::string& err) {
  struct ifaddrs* list = nullptr;
  if (::getifaddrs(&list) == -1) {
    err = std::string("getifaddrs: ") + std::strerror(errno);
    return false;
  }
  for (auto* ifa = list; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_name || !ifa->ifa_addr) continue;
    if (ifa->ifa_addr->sa_family == AF_INET) {
      const auto* sin = reinterpret_cast<const struct sockaddr_in*>(ifa->ifa_addr);
      out.push_back({ifa->ifa_name, lanprobe::model::IpAddress::from_bytes(
          reinterpret_cast<const uint8_t*>(&sin->sin_addr), 4)});
    } else if (ifa->ifa_addr->sa_family == AF_INET6) {
      const auto* sin6 = reinterpret_cast<const struct sockaddr_in6*>(ifa->ifa_addr);
      out.push_back({ifa->ifa_name, lanprobe::model::IpAddress::from_bytes(
          reinterpret_cast<const uint8_t*>(&sin6->sin6_addr), 16)});
    }
  }
  ::freeifaddrs(list);
  return true;
}

InterfaceKind kind_from_sysfs(int arphrd_type, bool has_wireless) {
  switch (arphrd_type) {
    case ARPHRD_ETHER:
      // wireless NICs present themselves as ethernet framing
      return has_wireless ? InterfaceKind::WiFi : InterfaceKind::Ethernet;
    case ARPHRD_LOOPBACK:
      return InterfaceKind::Loopback;
    case ARPHRD_IEEE80211:
    case ARPHRD_IEEE80211_PRISM:
    case ARPHRD_IEEE80211_RADIOTAP:
      return InterfaceKind::WiFi;
    default:
      return InterfaceKind::Other;
  }
}

OperState oper_state_from_sysfs(const std::string& operstate, unsigned flags, bool have_flags) {
  if (operstate == "up") return OperState::Up;
  if (operstate == "down" || operstate == "lowerlayerdown" || operstate == "notpresent")
    return OperState::Down;
  // "unknown" is common for loopback and tun devices; administrative state decides
  if (have_flags && (flags & IFF_UP) == 0) return OperState::Down;
  return OperState::Unknown;
}

static bool uevent_says_wlan(const std::string& base) {
  auto txt = lanprobe::util::read_file_string(base + "uevent");
  if (!txt) return false;
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    if (line == "DEVTYPE=wlan") return true;
  }
  return false;
}

static bool parse_int(const std::string& s, int& out, int base = 10) {
  const char* b = s.data();
  const char* e = s.data() + s.size();
  if (base == 16 && s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) b += 2;
  auto [ptr, ec] = std::from_chars(b, e, out, base);
  return ec == std::errc{} && ptr == e;
}

InterfaceCollector::InterfaceCollector(AddressReader reader) : reader_(std::move(reader)) {}

bool InterfaceCollector::sample(std::vector<lanprobe::model::Interface>& out,
                                lanprobe::model::CollectionError& err) {
  out.clear();
  warnings_.clear();

  auto names = lanprobe::util::list_dir("/sys/class/net");
  if (!names) {
    err = {lanprobe::model::CollectionError::Kind::SourceUnavailable,
           "cannot list /sys/class/net: " + std::string(std::strerror(errno))};
    return false;
  }

  std::vector<BoundAddress> bound;
  std::string addr_err;
  if (!reader_ || !reader_(bound, addr_err)) {
    warnings_.push_back("address table unavailable: " + (addr_err.empty() ? std::string("no reader") : addr_err));
    bound.clear();
  }

  for (const auto& raw : *names) {
    std::string base = "/sys/class/net/" + raw + "/";
    std::error_code ec;
    // skips plain files such as bonding_masters
    if (!std::filesystem::is_directory(lanprobe::util::map_sys_path(base), ec)) continue;

    auto name = lanprobe::model::InterfaceName::try_parse(raw);
    if (!name) {
      warnings_.push_back("skipping interface with invalid name '" + raw + "'");
      continue;
    }

    lanprobe::model::Interface iface{.name = *name};

    int type = -1;
    auto type_txt = lanprobe::util::read_attr(base + "type");
    if (!type_txt || !parse_int(*type_txt, type)) {
      warnings_.push_back(raw + ": unknown hardware type");
      type = -1;
    }
    bool wireless = lanprobe::util::path_exists(base + "wireless") ||
                    lanprobe::util::path_exists(base + "phy80211") ||
                    uevent_says_wlan(base);
    iface.kind = kind_from_sysfs(type, wireless);

    int flags = 0;
    bool have_flags = false;
    if (auto f = lanprobe::util::read_attr(base + "flags")) have_flags = parse_int(*f, flags, 16);
    auto operstate = lanprobe::util::read_attr(base + "operstate");
    if (!operstate) warnings_.push_back(raw + ": operstate unreadable");
    iface.oper_state = oper_state_from_sysfs(operstate.value_or(""), static_cast<unsigned>(flags), have_flags);

    if (auto a = lanprobe::util::read_attr(base + "address")) {
      auto mac = lanprobe::model::MacAddress::try_parse(*a);
      if (mac && !mac->is_zero()) iface.mac = *mac;
    }
    if (auto idx = lanprobe::util::read_attr(base + "ifindex")) {
      if (!parse_int(*idx, iface.ifindex)) iface.ifindex = 0;
    }

    for (const auto& b : bound) {
      if (b.ifname == raw) iface.addresses.insert(b.ip);
    }
    out.push_back(std::move(iface));
  }
  return true;
}

} // namespace lanprobe::collectors
