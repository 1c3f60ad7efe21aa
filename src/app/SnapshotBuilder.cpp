#include "app/SnapshotBuilder.hpp"

#include <algorithm>
#include <exception>
#include <map>

namespace lanprobe::app {

using lanprobe::model::InterfaceName;
using lanprobe::model::IpAddress;
using lanprobe::model::NeighborEntry;

std::vector<NeighborEntry> normalize_neighbors(const InterfaceName& owner, std::vector<NeighborEntry> rows) {
  // std::map keeps ip order; assignment keeps the most recent observation
  std::map<IpAddress, NeighborEntry> by_ip;
  for (auto& e : rows) {
    if (e.interface != owner) continue;
    auto it = by_ip.find(e.ip);
    if (it == by_ip.end()) by_ip.emplace(e.ip, std::move(e));
    else it->second = std::move(e);
  }
  std::vector<NeighborEntry> out;
  out.reserve(by_ip.size());
  for (auto& [ip, e] : by_ip) out.push_back(std::move(e));
  return out;
}

lanprobe::model::NetworkSnapshot build_snapshot(std::vector<lanprobe::model::Interface> interfaces,
                                                const NeighborLookupFn& lookup,
                                                lanprobe::model::RouteInfo route) {
  lanprobe::model::NetworkSnapshot snap;

  std::stable_sort(interfaces.begin(), interfaces.end(),
                   [](const auto& a, const auto& b) { return a.name < b.name; });
  // duplicate names: the first reported wins
  interfaces.erase(std::unique(interfaces.begin(), interfaces.end(),
                               [](const auto& a, const auto& b) { return a.name == b.name; }),
                   interfaces.end());
  snap.interfaces = std::move(interfaces);

  for (const auto& iface : snap.interfaces) {
    lanprobe::model::NeighborLookup res;
    if (!lookup) {
      res.error = lanprobe::model::CollectionError{
          lanprobe::model::CollectionError::Kind::SourceUnavailable, "no neighbor source"};
    } else {
      try {
        res = lookup(iface.name);
      } catch (const std::exception& e) {
        res.entries.clear();
        res.error = lanprobe::model::CollectionError{
            lanprobe::model::CollectionError::Kind::SourceUnavailable, e.what()};
      }
    }

    if (!res.ok()) {
      snap.neighbors_by_interface.emplace(iface.name, std::vector<NeighborEntry>{});
      snap.lookup_failures.emplace(iface.name, res.error->message);
      continue;
    }
    snap.neighbors_by_interface.emplace(iface.name, normalize_neighbors(iface.name, std::move(res.entries)));
  }

  // keep route annotations only when they refer to an enumerated interface
  if (route.gateway_interface) {
    bool known = std::any_of(snap.interfaces.begin(), snap.interfaces.end(),
                             [&](const auto& i) { return i.name == *route.gateway_interface; });
    if (!known) {
      route.gateway.reset();
      route.gateway_interface.reset();
    }
  }
  snap.route = std::move(route);
  return snap;
}

} // namespace lanprobe::app
