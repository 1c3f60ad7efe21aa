#pragma once
#include <functional>
#include <string>
#include <vector>
#include "model/Net.hpp"

namespace lanprobe::collectors {

// (interface name, address) pairs as reported by the address primitive.
struct BoundAddress {
  std::string ifname;
  lanprobe::model::IpAddress ip;
};

// Returns false if the address table could not be read.
using AddressReader = std::function<bool(std::vector<BoundAddress>& out, std::string& err)>;

// getifaddrs(3) based reader, the default.
bool read_bound_addresses(std::vector<BoundAddress>& out, std::string& err);

// ARPHRD_* type plus wireless hints to interface kind.
lanprobe::model::InterfaceKind kind_from_sysfs(int arphrd_type, bool has_wireless);

// sysfs operstate text plus IFF_* flags to operational state.
lanprobe::model::OperState oper_state_from_sysfs(const std::string& operstate, unsigned flags, bool have_flags);

// Enumerates /sys/class/net, including down and loopback interfaces.
class InterfaceCollector {
public:
  explicit InterfaceCollector(AddressReader reader = read_bound_addresses);

  // Fails only when the interface table itself cannot be listed.
  bool sample(std::vector<lanprobe::model::Interface>& out, lanprobe::model::CollectionError& err);

  // Non-fatal problems from the last sample (skipped names, unreadable attributes).
  [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }

private:
  AddressReader reader_;
  std::vector<std::string> warnings_;
};

} // namespace lanprobe::collectors
