#include "app/Classifier.hpp"
#include <algorithm>

namespace lanprobe::app {

using lanprobe::model::Health;
using lanprobe::model::NeighborState;

Health classify_interface(const lanprobe::model::Interface& iface, bool lookup_failed,
                          const std::vector<lanprobe::model::NeighborEntry>& neighbors) {
  if (iface.oper_state == lanprobe::model::OperState::Down) return Health::Unreachable;
  if (lookup_failed) return Health::Unreachable;
  if (neighbors.empty()) return Health::Empty;
  bool all_reachable = std::all_of(neighbors.begin(), neighbors.end(),
                                   [](const auto& n) { return n.state == NeighborState::Reachable; });
  return all_reachable ? Health::Healthy : Health::Degraded;
}

lanprobe::model::ClassifiedSnapshot classify(lanprobe::model::NetworkSnapshot snapshot) {
  lanprobe::model::ClassifiedSnapshot out;
  for (const auto& iface : snapshot.interfaces) {
    out.health.emplace(iface.name, classify_interface(iface, snapshot.lookup_failed(iface.name),
                                                      snapshot.neighbors(iface.name)));
  }
  out.snapshot = std::move(snapshot);
  return out;
}

Health worst_health(const lanprobe::model::ClassifiedSnapshot& cs,
                    const std::function<bool(const lanprobe::model::Interface&)>& include) {
  bool any = false;
  Health worst = Health::Healthy;
  for (const auto& iface : cs.snapshot.interfaces) {
    if (include && !include(iface)) continue;
    Health h = cs.health_of(iface.name);
    if (!any || static_cast<int>(h) > static_cast<int>(worst)) worst = h;
    any = true;
  }
  return any ? worst : Health::Empty;
}

} // namespace lanprobe::app
