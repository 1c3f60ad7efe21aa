#include "collectors/NeighborCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <cstring>
#include <sstream>
#include <string_view>

#include <net/if.h>
#include <net/if_arp.h>

namespace lanprobe::collectors {

using lanprobe::model::CollectionError;
using lanprobe::model::InterfaceName;
using lanprobe::model::IpAddress;
using lanprobe::model::MacAddress;
using lanprobe::model::NeighborEntry;

std::optional<NeighborSource> neighbor_source_from_string(const std::string& s) {
  if (s == "auto") return NeighborSource::Auto;
  if (s == "netlink") return NeighborSource::Netlink;
  if (s == "proc" || s == "arp") return NeighborSource::ProcArp;
  return std::nullopt;
}

const char* arp_flags_state_name(unsigned flags) {
  if (flags & ATF_PERM) return "PERMANENT";
  if (flags & ATF_COM) return "REACHABLE";
  return "INCOMPLETE";
}

std::vector<NeighborEntry> entries_from_rows(const InterfaceName& ifname, int ifindex,
                                             const std::vector<lanprobe::util::NeighborRow>& rows) {
  std::vector<NeighborEntry> out;
  for (const auto& r : rows) {
    if (r.ifindex != ifindex) continue;
    if (r.addr_len != 4 && r.addr_len != 16) continue;
    std::string_view state = lanprobe::util::nud_state_name(r.nud_state);
    // multicast/broadcast mappings, not device observations
    if (state == "NOARP") continue;
    std::optional<MacAddress> mac;
    if (r.lladdr_len == 6) {
      MacAddress m(r.lladdr);
      if (!m.is_zero()) mac = m;
    }
    out.push_back(NeighborEntry{ifname, IpAddress::from_bytes(r.addr.data(), r.addr_len), mac,
                                lanprobe::model::neighbor_state_from_name(state)});
  }
  return out;
}

NeighborCollector::NeighborCollector(NeighborSource source, std::chrono::milliseconds netlink_timeout)
  : source_(source), netlink_timeout_(netlink_timeout) {}

bool NeighborCollector::sample(const InterfaceName& ifname, std::vector<NeighborEntry>& out,
                               CollectionError& err) {
  out.clear();
  warnings_.clear();
  backend_ = "";
  const std::string& n = ifname.str();

  // Interfaces without ARP/NDP (e.g. some tunnels, vanished devices) have no table at all
  bool has_v4 = lanprobe::util::path_exists("/proc/sys/net/ipv4/neigh/" + n);
  bool has_v6 = lanprobe::util::path_exists("/proc/sys/net/ipv6/neigh/" + n);
  if (!has_v4 && !has_v6) {
    err = {CollectionError::Kind::SourceUnavailable, "no neighbor table for " + n};
    return false;
  }

  std::string why;
  switch (source_) {
    case NeighborSource::Netlink:
      if (sample_netlink(ifname, out, why)) return true;
      break;
    case NeighborSource::ProcArp:
      if (sample_proc_arp(ifname, out, why)) return true;
      break;
    case NeighborSource::Auto:
      // a remapped /proc holds fixtures the kernel knows nothing about
      if (!lanprobe::util::remapped()) {
        if (sample_netlink(ifname, out, why)) return true;
        warnings_.push_back(n + ": netlink unavailable (" + why + "), using /proc/net/arp");
        out.clear();
      }
      if (sample_proc_arp(ifname, out, why)) return true;
      break;
  }
  out.clear();
  err = {CollectionError::Kind::SourceUnavailable, n + ": " + why};
  return false;
}

int NeighborCollector::resolve_ifindex(const InterfaceName& ifname) const {
  if (auto txt = lanprobe::util::read_attr("/sys/class/net/" + ifname.str() + "/ifindex")) {
    int idx = 0;
    auto [ptr, ec] = std::from_chars(txt->data(), txt->data() + txt->size(), idx);
    if (ec == std::errc{} && idx > 0) return idx;
  }
  return static_cast<int>(::if_nametoindex(ifname.str().c_str()));
}

bool NeighborCollector::sample_netlink(const InterfaceName& ifname, std::vector<NeighborEntry>& out,
                                       std::string& err) {
  int idx = resolve_ifindex(ifname);
  if (idx <= 0) {
    err = "interface index unknown";
    return false;
  }
  lanprobe::util::RtnlSocket sock(netlink_timeout_);
  if (!sock.open()) {
    err = sock.error();
    return false;
  }
  std::vector<lanprobe::util::NeighborRow> rows;
  if (!sock.dump_neighbors(rows)) {
    err = sock.error();
    return false;
  }
  out = entries_from_rows(ifname, idx, rows);
  backend_ = "netlink";
  return true;
}

bool NeighborCollector::sample_proc_arp(const InterfaceName& ifname, std::vector<NeighborEntry>& out,
                                        std::string& err) {
  auto txt = lanprobe::util::read_file_string("/proc/net/arp");
  if (!txt) {
    err = "cannot read /proc/net/arp";
    return false;
  }
  // format: IP address  HW type  Flags  HW address  Mask  Device
  std::istringstream ss(*txt);
  std::string line;
  std::getline(ss, line); // header
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    std::string ip, hw_type, flags, mac, mask, dev;
    if (!(ls >> ip >> hw_type >> flags >> mac >> mask >> dev)) continue;
    if (dev != ifname.str()) continue;

    auto addr = IpAddress::try_parse(ip);
    if (!addr) {
      warnings_.push_back(ifname.str() + ": dropping ARP row with invalid IP '" + ip + "'");
      continue;
    }
    unsigned fl = 0;
    std::string_view fv(flags);
    if (fv.rfind("0x", 0) == 0) fv.remove_prefix(2);
    auto [ptr, ec] = std::from_chars(fv.data(), fv.data() + fv.size(), fl, 16);
    if (ec != std::errc{}) fl = 0;

    std::optional<MacAddress> hw = MacAddress::try_parse(mac);
    if (hw && hw->is_zero()) hw.reset();
    out.push_back(NeighborEntry{ifname, *addr, hw,
                                lanprobe::model::neighbor_state_from_name(arp_flags_state_name(fl))});
  }
  backend_ = "proc";
  return true;
}

} // namespace lanprobe::collectors
