#include "minitest.hpp"
#include "app/Classifier.hpp"

using lanprobe::app::classify_interface;
using lanprobe::model::Health;
using lanprobe::model::Interface;
using lanprobe::model::InterfaceKind;
using lanprobe::model::InterfaceName;
using lanprobe::model::IpAddress;
using lanprobe::model::NeighborEntry;
using lanprobe::model::NeighborState;
using lanprobe::model::OperState;

static Interface make_iface(const char* name, OperState st, InterfaceKind kind = InterfaceKind::Ethernet) {
  Interface i{.name = InterfaceName(name)};
  i.oper_state = st;
  i.kind = kind;
  return i;
}

static std::vector<NeighborEntry> neighbors(std::initializer_list<NeighborState> states) {
  std::vector<NeighborEntry> out;
  uint8_t last = 10;
  for (auto s : states) out.push_back(NeighborEntry{InterfaceName("eth0"), IpAddress::v4(192, 168, 1, last++), std::nullopt, s});
  return out;
}

TEST(classify_rules_in_order) {
  auto up = make_iface("eth0", OperState::Up);
  auto down = make_iface("eth0", OperState::Down);
  auto unknown = make_iface("eth0", OperState::Unknown);

  ASSERT_TRUE(classify_interface(down, false, neighbors({NeighborState::Reachable})) == Health::Unreachable);
  ASSERT_TRUE(classify_interface(up, true, {}) == Health::Unreachable);
  ASSERT_TRUE(classify_interface(up, false, {}) == Health::Empty);
  ASSERT_TRUE(classify_interface(up, false, neighbors({NeighborState::Reachable, NeighborState::Reachable})) == Health::Healthy);
  ASSERT_TRUE(classify_interface(up, false, neighbors({NeighborState::Reachable, NeighborState::Stale})) == Health::Degraded);
  ASSERT_TRUE(classify_interface(up, false, neighbors({NeighborState::Failed})) == Health::Degraded);
  ASSERT_TRUE(classify_interface(unknown, false, neighbors({NeighborState::Reachable})) == Health::Healthy);
}

TEST(classify_snapshot_and_worst_health) {
  lanprobe::model::NetworkSnapshot snap;
  snap.interfaces.push_back(make_iface("eth0", OperState::Up));
  snap.interfaces.push_back(make_iface("lo", OperState::Unknown, InterfaceKind::Loopback));
  snap.interfaces.push_back(make_iface("wlan0", OperState::Up));
  snap.neighbors_by_interface[InterfaceName("eth0")] = neighbors({NeighborState::Reachable});
  snap.neighbors_by_interface[InterfaceName("wlan0")] = neighbors({NeighborState::Reachable, NeighborState::Stale});

  auto cs = lanprobe::app::classify(snap);
  ASSERT_TRUE(cs.health_of(InterfaceName("eth0")) == Health::Healthy);
  ASSERT_TRUE(cs.health_of(InterfaceName("wlan0")) == Health::Degraded);
  ASSERT_TRUE(cs.health_of(InterfaceName("lo")) == Health::Empty);
  ASSERT_EQ(cs.snapshot.interfaces.size(), 3u);

  auto not_loopback = [](const Interface& i) { return i.kind != InterfaceKind::Loopback; };
  ASSERT_TRUE(lanprobe::app::worst_health(cs, not_loopback) == Health::Degraded);
  ASSERT_TRUE(lanprobe::app::worst_health(cs, nullptr) == Health::Empty);
  ASSERT_TRUE(lanprobe::app::worst_health(cs, [](const Interface&) { return false; }) == Health::Empty);
}
