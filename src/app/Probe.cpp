#include "app/Probe.hpp"
#include <chrono>
#include <cstdio>
#include <exception>
#include <map>
#include <system_error>
#include <thread>
#include "app/Classifier.hpp"
#include "app/SnapshotBuilder.hpp"
#include "collectors/RouteCollector.hpp"

namespace lanprobe::app {

using lanprobe::model::CollectionError;
using lanprobe::model::InterfaceName;
using lanprobe::model::NeighborLookup;

std::jthread spawn_thread(std::function<void()> fn) {
  return std::jthread(std::move(fn));
}

std::size_t run_fanout(std::size_t n, const std::function<void(std::size_t)>& fn,
                       const Spawner& spawn) {
  std::vector<std::jthread> workers;
  workers.reserve(n);
  std::size_t i = 0;
  for (; i < n; ++i) {
    try {
      workers.push_back(spawn([&fn, i]() { fn(i); }));
    } catch (const std::system_error&) {
      break;
    }
  }
  const std::size_t started = workers.size();
  for (; i < n; ++i) fn(i);
  return started; // workers join on return
}

Probe::Probe(lanprobe::ui::Config cfg, lanprobe::collectors::AddressReader reader,
             lanprobe::collectors::Resolver resolver)
  : cfg_(std::move(cfg)), reader_(std::move(reader)), resolver_(std::move(resolver)),
    formatter_(cfg_.display) {
  if (auto src = lanprobe::collectors::neighbor_source_from_string(cfg_.probe.neighbor_source)) {
    source_ = *src;
  } else {
    log("Probe", "unknown neighbor_source '" + cfg_.probe.neighbor_source + "', using auto");
  }
}

void Probe::log(const char* component, const std::string& msg) const {
  if (!cfg_.general.debug) return;
  std::fprintf(stderr, "lanprobe: %s: %s\n", component, msg.c_str());
}

void Probe::log_all(const char* component, const std::vector<std::string>& msgs) const {
  for (const auto& m : msgs) log(component, m);
}

// Own collector per call so parallel lookups share nothing.
NeighborLookup Probe::lookup(const InterfaceName& name) const {
  lanprobe::collectors::NeighborCollector nc(source_, std::chrono::milliseconds(cfg_.probe.netlink_timeout_ms));
  NeighborLookup res;
  CollectionError err;
  if (!nc.sample(name, res.entries, err)) {
    res.entries.clear();
    res.error = err;
  } else {
    log("NeighborCollector", name.str() + ": " + std::to_string(res.entries.size()) +
                             " entries via " + nc.backend());
  }
  log_all("NeighborCollector", nc.warnings());
  return res;
}

void Probe::resolve_hostnames(lanprobe::model::NetworkSnapshot& snap) const {
  if (!cfg_.probe.hostnames) return;
  std::vector<lanprobe::model::IpAddress> ips;
  for (const auto& [name, entries] : snap.neighbors_by_interface)
    for (const auto& e : entries) ips.push_back(e.ip);
  if (ips.empty()) return;
  lanprobe::collectors::HostnameCollector hc(std::chrono::milliseconds(cfg_.probe.hostname_timeout_ms), resolver_);
  snap.hostnames = hc.sample(ips);
  log("HostnameCollector", std::to_string(snap.hostnames.size()) + " of " + std::to_string(ips.size()) + " names resolved");
  log_all("HostnameCollector", hc.warnings());
}

bool Probe::collect(lanprobe::model::NetworkSnapshot& out, CollectionError& err) {
  lanprobe::collectors::InterfaceCollector ic(reader_);
  std::vector<lanprobe::model::Interface> ifaces;
  bool ok = ic.sample(ifaces, err);
  log_all("InterfaceCollector", ic.warnings());
  if (!ok) return false;

  lanprobe::model::RouteInfo route;
  if (cfg_.probe.routes) {
    lanprobe::collectors::RouteCollector rc;
    if (!rc.sample(route)) log("RouteCollector", "no route or resolver data");
    log_all("RouteCollector", rc.warnings());
  }

  if (!cfg_.probe.parallel || ifaces.size() < 2) {
    out = build_snapshot(std::move(ifaces),
                         [this](const InterfaceName& n) { return lookup(n); },
                         std::move(route));
    resolve_hostnames(out);
    return true;
  }

  // Fan out one thread per interface, fan in before building.
  std::vector<NeighborLookup> results(ifaces.size());
  const std::size_t started = run_fanout(ifaces.size(), [this, &results, &ifaces](std::size_t i) {
    try {
      results[i] = lookup(ifaces[i].name);
    } catch (const std::exception& e) {
      results[i].entries.clear();
      results[i].error = CollectionError{CollectionError::Kind::SourceUnavailable, e.what()};
    }
  });
  if (started < ifaces.size())
    log("Probe", "thread spawn failed after " + std::to_string(started) + " lookups, rest run inline");
  std::map<InterfaceName, NeighborLookup> by_name;
  for (size_t i = 0; i < ifaces.size(); ++i) by_name.emplace(ifaces[i].name, std::move(results[i]));

  out = build_snapshot(std::move(ifaces),
                       [&by_name](const InterfaceName& n) {
                         auto it = by_name.find(n);
                         if (it == by_name.end())
                           return NeighborLookup{{}, CollectionError{CollectionError::Kind::SourceUnavailable, "not queried"}};
                         return it->second;
                       },
                       std::move(route));
  resolve_hostnames(out);
  return true;
}

lanprobe::ui::RenderResult Probe::run() {
  lanprobe::model::NetworkSnapshot snap;
  CollectionError err;
  if (!collect(snap, err)) {
    log("Probe", "interface enumeration failed: " + err.message);
    return formatter_.render_error("interface enumeration", err.message);
  }
  for (const auto& [name, why] : snap.lookup_failures) log("Probe", name.str() + " lookup failed: " + why);
  return formatter_.render(classify(std::move(snap)));
}

} // namespace lanprobe::app
