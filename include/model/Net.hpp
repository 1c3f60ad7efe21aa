#pragma once
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "model/Address.hpp"

namespace lanprobe::model {

enum class InterfaceKind { Ethernet, WiFi, Loopback, Other };
enum class OperState { Up, Down, Unknown };

struct Interface {
  InterfaceName name;
  InterfaceKind kind{InterfaceKind::Other};
  OperState oper_state{OperState::Unknown};
  std::set<IpAddress> addresses;
  std::optional<MacAddress> mac; // none for loopback/tunnels
  int ifindex{0};
};

enum class NeighborState { Reachable, Stale, Failed, Unknown };

// One device observation on an interface's segment; ip is the key within an interface.
struct NeighborEntry {
  InterfaceName interface;
  IpAddress ip;
  std::optional<MacAddress> mac;
  NeighborState state{NeighborState::Unknown};
};

struct CollectionError {
  enum class Kind { SourceUnavailable };
  Kind kind{Kind::SourceUnavailable};
  std::string message;
};

// Result of one per-interface neighbor query.
struct NeighborLookup {
  std::vector<NeighborEntry> entries;
  std::optional<CollectionError> error;
  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// Maps a source table state name (kernel NUD names, case-insensitive) to the four-state enum.
NeighborState neighbor_state_from_name(std::string_view name);

const char* to_string(InterfaceKind k);
const char* to_string(OperState s);
const char* to_string(NeighborState s);

} // namespace lanprobe::model
