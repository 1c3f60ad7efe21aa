#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "model/Net.hpp"
#include "util/Netlink.hpp"

namespace lanprobe::collectors {

enum class NeighborSource { Auto, Netlink, ProcArp };

// "auto" | "netlink" | "proc"; anything else yields std::nullopt.
std::optional<NeighborSource> neighbor_source_from_string(const std::string& s);

// /proc/net/arp flag word to a kernel state name.
const char* arp_flags_state_name(unsigned flags);

// Netlink dump rows to entries of one interface. Rows of other ifindexes,
// NOARP mappings and rows without a 4/16-byte address are dropped; a missing,
// short or all-zero link address becomes nullopt.
std::vector<lanprobe::model::NeighborEntry> entries_from_rows(const lanprobe::model::InterfaceName& ifname,
                                                              int ifindex,
                                                              const std::vector<lanprobe::util::NeighborRow>& rows);

// Reads the neighbor table scoped to one interface.
class NeighborCollector {
public:
  explicit NeighborCollector(NeighborSource source = NeighborSource::Auto,
                             std::chrono::milliseconds netlink_timeout = std::chrono::milliseconds(1000));

  // Fails with SourceUnavailable when the interface has no neighbor table or
  // the backing table cannot be read.
  bool sample(const lanprobe::model::InterfaceName& ifname,
              std::vector<lanprobe::model::NeighborEntry>& out,
              lanprobe::model::CollectionError& err);

  [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }
  // Backend used by the last successful sample ("netlink" or "proc").
  [[nodiscard]] const char* backend() const noexcept { return backend_; }

private:
  bool sample_netlink(const lanprobe::model::InterfaceName& ifname,
                      std::vector<lanprobe::model::NeighborEntry>& out, std::string& err);
  bool sample_proc_arp(const lanprobe::model::InterfaceName& ifname,
                       std::vector<lanprobe::model::NeighborEntry>& out, std::string& err);
  int resolve_ifindex(const lanprobe::model::InterfaceName& ifname) const;

  NeighborSource source_;
  std::chrono::milliseconds netlink_timeout_;
  std::vector<std::string> warnings_;
  const char* backend_{""};
};

} // namespace lanprobe::collectors
