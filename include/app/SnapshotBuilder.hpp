#pragma once
#include <functional>
#include <vector>
#include "model/Snapshot.hpp"

namespace lanprobe::app {

using NeighborLookupFn = std::function<lanprobe::model::NeighborLookup(const lanprobe::model::InterfaceName&)>;

// Merges collector output into one consistent snapshot. A failed (or
// throwing) lookup only affects its own interface.
lanprobe::model::NetworkSnapshot build_snapshot(std::vector<lanprobe::model::Interface> interfaces,
                                                const NeighborLookupFn& lookup,
                                                lanprobe::model::RouteInfo route = {});

// Dedupe by ip (later source rows win) and sort ascending; rows naming another interface are dropped.
std::vector<lanprobe::model::NeighborEntry> normalize_neighbors(const lanprobe::model::InterfaceName& owner,
                                                                std::vector<lanprobe::model::NeighborEntry> rows);

} // namespace lanprobe::app
