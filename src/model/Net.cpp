#include "model/Net.hpp"
#include <cctype>

namespace lanprobe::model {

static bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

NeighborState neighbor_state_from_name(std::string_view name) {
  if (iequals(name, "REACHABLE") || iequals(name, "PERMANENT")) return NeighborState::Reachable;
  if (iequals(name, "STALE") || iequals(name, "DELAY") || iequals(name, "PROBE")) return NeighborState::Stale;
  if (iequals(name, "FAILED") || iequals(name, "INCOMPLETE")) return NeighborState::Failed;
  return NeighborState::Unknown;
}

const char* to_string(InterfaceKind k) {
  switch (k) {
    case InterfaceKind::Ethernet: return "ethernet";
    case InterfaceKind::WiFi:     return "wifi";
    case InterfaceKind::Loopback: return "loopback";
    case InterfaceKind::Other:    return "other";
  }
  return "other";
}

const char* to_string(OperState s) {
  switch (s) {
    case OperState::Up:      return "up";
    case OperState::Down:    return "down";
    case OperState::Unknown: return "unknown";
  }
  return "unknown";
}

const char* to_string(NeighborState s) {
  switch (s) {
    case NeighborState::Reachable: return "reachable";
    case NeighborState::Stale:     return "stale";
    case NeighborState::Failed:    return "failed";
    case NeighborState::Unknown:   return "unknown";
  }
  return "unknown";
}

} // namespace lanprobe::model
