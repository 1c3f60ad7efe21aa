#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include "collectors/HostnameCollector.hpp"
#include "collectors/InterfaceCollector.hpp"
#include "collectors/NeighborCollector.hpp"
#include "model/Snapshot.hpp"
#include "ui/Config.hpp"
#include "ui/Formatter.hpp"

namespace lanprobe::app {

using Spawner = std::function<std::jthread(std::function<void()>)>;
std::jthread spawn_thread(std::function<void()> fn);

// Runs fn(0..n-1), one thread each. When spawning fails with std::system_error
// the remaining indices run on the calling thread. Returns threads started.
std::size_t run_fanout(std::size_t n, const std::function<void(std::size_t)>& fn,
                       const Spawner& spawn = spawn_thread);

// One invocation of the discovery pipeline:
// interfaces -> neighbors (per interface) -> routes -> build -> hostnames -> classify -> render.
// Holds no state between runs.
class Probe {
public:
  explicit Probe(lanprobe::ui::Config cfg,
                 lanprobe::collectors::AddressReader reader = lanprobe::collectors::read_bound_addresses,
                 lanprobe::collectors::Resolver resolver = lanprobe::collectors::resolve_reverse);

  [[nodiscard]] lanprobe::ui::RenderResult run();

  // Snapshot stage only; false with `err` set when interfaces cannot be enumerated.
  bool collect(lanprobe::model::NetworkSnapshot& out, lanprobe::model::CollectionError& err);

private:
  lanprobe::model::NeighborLookup lookup(const lanprobe::model::InterfaceName& name) const;
  void resolve_hostnames(lanprobe::model::NetworkSnapshot& snap) const;
  void log(const char* component, const std::string& msg) const;
  void log_all(const char* component, const std::vector<std::string>& msgs) const;

  lanprobe::ui::Config cfg_;
  lanprobe::collectors::AddressReader reader_;
  lanprobe::collectors::Resolver resolver_;
  lanprobe::collectors::NeighborSource source_{lanprobe::collectors::NeighborSource::Auto};
  lanprobe::ui::Formatter formatter_;
};

} // namespace lanprobe::app
