#include "model/Snapshot.hpp"

namespace lanprobe::model {

const std::vector<NeighborEntry>& NetworkSnapshot::neighbors(const InterfaceName& name) const {
  static const std::vector<NeighborEntry> kNone;
  auto it = neighbors_by_interface.find(name);
  return it == neighbors_by_interface.end() ? kNone : it->second;
}

Health ClassifiedSnapshot::health_of(const InterfaceName& name) const {
  auto it = health.find(name);
  return it == health.end() ? Health::Unreachable : it->second;
}

const char* to_string(Health h) {
  switch (h) {
    case Health::Healthy:     return "healthy";
    case Health::Degraded:    return "degraded";
    case Health::Empty:       return "empty";
    case Health::Unreachable: return "unreachable";
  }
  return "unreachable";
}

} // namespace lanprobe::model
