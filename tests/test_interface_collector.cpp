#include "minitest.hpp"
#include "fixture.hpp"
#include "collectors/InterfaceCollector.hpp"
#include <net/if_arp.h>

using lanprobe::collectors::BoundAddress;
using lanprobe::collectors::InterfaceCollector;
using lanprobe::model::CollectionError;
using lanprobe::model::Interface;
using lanprobe::model::InterfaceKind;
using lanprobe::model::IpAddress;
using lanprobe::model::OperState;

static bool fake_addresses(std::vector<BoundAddress>& out, std::string&) {
  out.push_back({"eth0", IpAddress("192.168.1.5")});
  out.push_back({"eth0", IpAddress("fe80::5")});
  out.push_back({"lo", IpAddress("127.0.0.1")});
  out.push_back({"ghost0", IpAddress("10.9.9.9")});
  return true;
}

static const Interface* find_iface(const std::vector<Interface>& v, const std::string& name) {
  for (const auto& i : v) if (i.name.str() == name) return &i;
  return nullptr;
}

TEST(kind_lookup_table) {
  using lanprobe::collectors::kind_from_sysfs;
  ASSERT_TRUE(kind_from_sysfs(ARPHRD_ETHER, false) == InterfaceKind::Ethernet);
  ASSERT_TRUE(kind_from_sysfs(ARPHRD_ETHER, true) == InterfaceKind::WiFi);
  ASSERT_TRUE(kind_from_sysfs(ARPHRD_LOOPBACK, false) == InterfaceKind::Loopback);
  ASSERT_TRUE(kind_from_sysfs(ARPHRD_IEEE80211_RADIOTAP, false) == InterfaceKind::WiFi);
  ASSERT_TRUE(kind_from_sysfs(ARPHRD_NONE, false) == InterfaceKind::Other);
  ASSERT_TRUE(kind_from_sysfs(-1, false) == InterfaceKind::Other);
}

TEST(oper_state_mapping) {
  using lanprobe::collectors::oper_state_from_sysfs;
  ASSERT_TRUE(oper_state_from_sysfs("up", 0x1003, true) == OperState::Up);
  ASSERT_TRUE(oper_state_from_sysfs("down", 0x1003, true) == OperState::Down);
  ASSERT_TRUE(oper_state_from_sysfs("lowerlayerdown", 0x1003, true) == OperState::Down);
  ASSERT_TRUE(oper_state_from_sysfs("unknown", 0x9, true) == OperState::Unknown);  // lo: IFF_UP set
  ASSERT_TRUE(oper_state_from_sysfs("unknown", 0x1002, true) == OperState::Down); // admin down
  ASSERT_TRUE(oper_state_from_sysfs("dormant", 0, false) == OperState::Unknown);
}

TEST(interface_collector_reads_sysfs) {
  auto root = fixture::make_root("ifaces");
  fixture::add_sys_iface(root, "eth0", ARPHRD_ETHER, "up", "0x1003", "AA:BB:CC:00:11:22", 2);
  fixture::add_sys_iface(root, "wlan0", ARPHRD_ETHER, "dormant", "0x1003", "aa:bb:cc:00:11:33", 3);
  fixture::write(root / "sys/class/net/wlan0/uevent", "DEVTYPE=wlan\nINTERFACE=wlan0\n");
  fixture::add_sys_iface(root, "lo", ARPHRD_LOOPBACK, "unknown", "0x9", "00:00:00:00:00:00", 1);
  fixture::add_sys_iface(root, "tun0", ARPHRD_NONE, "unknown", "0x1090", "", 4);
  fixture::add_sys_iface(root, "eno1", ARPHRD_ETHER, "down", "0x1002", "aa:bb:cc:00:11:44", 5);
  fixture::write(root / "sys/class/net/bonding_masters", "\n");
  fixture::EnvGuard sys("LANPROBE_SYS_ROOT", root.string());

  InterfaceCollector c(fake_addresses);
  std::vector<Interface> out;
  CollectionError err;
  ASSERT_TRUE(c.sample(out, err));
  ASSERT_EQ(out.size(), 5u);

  auto* eth0 = find_iface(out, "eth0");
  ASSERT_TRUE(eth0 != nullptr);
  ASSERT_TRUE(eth0->kind == InterfaceKind::Ethernet);
  ASSERT_TRUE(eth0->oper_state == OperState::Up);
  ASSERT_TRUE(eth0->mac.has_value());
  ASSERT_EQ(eth0->mac->str(), "aa:bb:cc:00:11:22");
  ASSERT_EQ(eth0->ifindex, 2);
  ASSERT_EQ(eth0->addresses.size(), 2u);
  ASSERT_TRUE(eth0->addresses.begin()->is_v4());

  auto* wlan0 = find_iface(out, "wlan0");
  ASSERT_TRUE(wlan0 != nullptr);
  ASSERT_TRUE(wlan0->kind == InterfaceKind::WiFi);
  ASSERT_TRUE(wlan0->oper_state == OperState::Unknown);
  ASSERT_TRUE(wlan0->addresses.empty());

  auto* lo = find_iface(out, "lo");
  ASSERT_TRUE(lo != nullptr);
  ASSERT_TRUE(lo->kind == InterfaceKind::Loopback);
  ASSERT_TRUE(!lo->mac.has_value());

  auto* tun0 = find_iface(out, "tun0");
  ASSERT_TRUE(tun0 != nullptr);
  ASSERT_TRUE(tun0->kind == InterfaceKind::Other);
  ASSERT_TRUE(!tun0->mac.has_value());

  auto* eno1 = find_iface(out, "eno1");
  ASSERT_TRUE(eno1 != nullptr);
  ASSERT_TRUE(eno1->oper_state == OperState::Down);
}

TEST(interface_collector_degrades_without_addresses) {
  auto root = fixture::make_root("ifaces_noaddr");
  fixture::add_sys_iface(root, "eth0", ARPHRD_ETHER, "up", "0x1003", "aa:bb:cc:00:11:22", 2);
  fixture::EnvGuard sys("LANPROBE_SYS_ROOT", root.string());

  InterfaceCollector c([](std::vector<BoundAddress>&, std::string& err) {
    err = "getifaddrs: permission denied";
    return false;
  });
  std::vector<Interface> out;
  CollectionError err;
  ASSERT_TRUE(c.sample(out, err));
  ASSERT_EQ(out.size(), 1u);
  ASSERT_TRUE(out[0].addresses.empty());
  ASSERT_TRUE(!c.warnings().empty());
  ASSERT_CONTAINS(c.warnings().front(), "permission denied");
}

TEST(interface_collector_missing_table_fails) {
  auto root = fixture::make_root("ifaces_missing");
  fixture::EnvGuard sys("LANPROBE_SYS_ROOT", root.string());
  InterfaceCollector c(fake_addresses);
  std::vector<Interface> out;
  CollectionError err;
  ASSERT_TRUE(!c.sample(out, err));
  ASSERT_TRUE(err.kind == CollectionError::Kind::SourceUnavailable);
  ASSERT_CONTAINS(err.message, "/sys/class/net");
  ASSERT_TRUE(out.empty());
}
