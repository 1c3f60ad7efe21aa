#pragma once
#include <optional>
#include <string>
#include <vector>
#include "model/Snapshot.hpp"

namespace lanprobe::collectors {

// /proc/net/route stores IPv4 addresses as little-endian hex ("0101A8C0" = 192.168.1.1).
std::optional<lanprobe::model::IpAddress> parse_route_hex(const std::string& hex);

// nameserver lines of a resolv.conf body; invalid addresses are skipped
std::vector<lanprobe::model::IpAddress> parse_resolv_conf(const std::string& body);

// Default IPv4 gateway and resolver list, used to annotate neighbors.
class RouteCollector {
public:
  // True if at least one of the sources could be read.
  bool sample(lanprobe::model::RouteInfo& out);
  [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }
private:
  bool sample_gateway(lanprobe::model::RouteInfo& out);
  bool sample_dns(lanprobe::model::RouteInfo& out);
  std::vector<std::string> warnings_;
};

} // namespace lanprobe::collectors
