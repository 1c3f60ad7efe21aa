#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "model/Net.hpp"

namespace lanprobe::model {

// Default route and resolver data, used only to annotate neighbors.
struct RouteInfo {
  std::optional<IpAddress> gateway;
  std::optional<InterfaceName> gateway_interface;
  std::vector<IpAddress> dns_servers;
};

struct NetworkSnapshot {
  std::vector<Interface> interfaces; // ascending by name
  // Every key names an entry of `interfaces`; values ascending by ip.
  std::map<InterfaceName, std::vector<NeighborEntry>> neighbors_by_interface;
  // Interfaces whose neighbor lookup failed, with the warning text.
  std::map<InterfaceName, std::string> lookup_failures;
  RouteInfo route;
  // Reverse names of neighbor addresses; absent when unresolved or disabled.
  std::map<IpAddress, std::string> hostnames;

  [[nodiscard]] const std::vector<NeighborEntry>& neighbors(const InterfaceName& name) const;
  [[nodiscard]] bool lookup_failed(const InterfaceName& name) const {
    return lookup_failures.count(name) != 0;
  }
};

enum class Health { Healthy, Degraded, Empty, Unreachable };

struct ClassifiedSnapshot {
  NetworkSnapshot snapshot;
  std::map<InterfaceName, Health> health;

  [[nodiscard]] Health health_of(const InterfaceName& name) const;
};

const char* to_string(Health h);

} // namespace lanprobe::model
