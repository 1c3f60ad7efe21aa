#pragma once
#include <functional>
#include <vector>
#include "model/Snapshot.hpp"

namespace lanprobe::app {

// Health of a single interface; rules are checked in order, first match wins:
//   down -> Unreachable, lookup failed -> Unreachable, no neighbors -> Empty,
//   all reachable -> Healthy, anything else -> Degraded.
lanprobe::model::Health classify_interface(const lanprobe::model::Interface& iface,
                                           bool lookup_failed,
                                           const std::vector<lanprobe::model::NeighborEntry>& neighbors);

// Pure pass over the snapshot; no I/O.
lanprobe::model::ClassifiedSnapshot classify(lanprobe::model::NetworkSnapshot snapshot);

// Severity follows declaration order (Healthy < Degraded < Empty < Unreachable).
// Only interfaces accepted by `include` count; none at all yields Empty.
lanprobe::model::Health worst_health(const lanprobe::model::ClassifiedSnapshot& cs,
                                     const std::function<bool(const lanprobe::model::Interface&)>& include);

} // namespace lanprobe::app
