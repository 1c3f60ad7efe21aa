#include "minitest.hpp"
#include "app/Classifier.hpp"
#include "ui/Formatter.hpp"

using lanprobe::model::ClassifiedSnapshot;
using lanprobe::model::Interface;
using lanprobe::model::InterfaceKind;
using lanprobe::model::InterfaceName;
using lanprobe::model::IpAddress;
using lanprobe::model::MacAddress;
using lanprobe::model::NeighborEntry;
using lanprobe::model::NeighborState;
using lanprobe::model::NetworkSnapshot;
using lanprobe::model::OperState;
using lanprobe::ui::Formatter;

static Interface make_iface(const char* name, InterfaceKind kind, OperState st = OperState::Up) {
  Interface i{.name = InterfaceName(name)};
  i.kind = kind;
  i.oper_state = st;
  return i;
}

static NeighborEntry nb(const char* ifname, const char* ip, const char* mac, NeighborState st) {
  std::optional<MacAddress> m;
  if (mac) m = MacAddress(mac);
  return NeighborEntry{InterfaceName(ifname), IpAddress(ip), m, st};
}

static NetworkSnapshot two_segment_snapshot() {
  NetworkSnapshot s;
  auto eth0 = make_iface("eth0", InterfaceKind::Ethernet);
  eth0.addresses.insert(IpAddress("fe80::5"));
  eth0.addresses.insert(IpAddress("192.168.1.5"));
  s.interfaces.push_back(eth0);
  s.interfaces.push_back(make_iface("lo", InterfaceKind::Loopback, OperState::Unknown));
  s.interfaces.push_back(make_iface("wlan0", InterfaceKind::WiFi));
  s.neighbors_by_interface[InterfaceName("eth0")] = {
    nb("eth0", "192.168.1.10", "aa:bb:cc:dd:ee:10", NeighborState::Reachable)};
  s.neighbors_by_interface[InterfaceName("wlan0")] = {
    nb("wlan0", "192.168.1.20", "aa:bb:cc:dd:ee:20", NeighborState::Reachable),
    nb("wlan0", "192.168.1.21", nullptr, NeighborState::Stale)};
  return s;
}

TEST(formatter_two_segment_scenario) {
  auto cs = lanprobe::app::classify(two_segment_snapshot());
  auto r = Formatter().render(cs);

  ASSERT_EQ(r.text, std::string(lanprobe::ui::kDefaultGlyph) + " 2");
  ASSERT_EQ(r.alt, "degraded");
  ASSERT_EQ(r.classes.size(), 3u);
  ASSERT_EQ(r.classes[0], "network");
  ASSERT_EQ(r.classes[1], "degraded");
  ASSERT_EQ(r.classes[2], "active");

  const std::string expected =
    "<span color='#00FF00'>eth0 (ethernet, 192.168.1.5): healthy, 1 device</span>\n"
    "  \xE2\x94\x94\xE2\x94\x80 <span color='#00FF00'>192.168.1.10 aa:bb:cc:dd:ee:10 reachable</span>\n"
    "\n"
    "<span color='#FFFF00'>wlan0 (wifi): degraded, 2 devices</span>\n"
    "  \xE2\x94\x9C\xE2\x94\x80 <span color='#00FF00'>192.168.1.20 aa:bb:cc:dd:ee:20 reachable</span>\n"
    "  \xE2\x94\x94\xE2\x94\x80 <span color='#FFFF00'>192.168.1.21 (incomplete) stale</span>";
  ASSERT_EQ(r.tooltip, expected);
  ASSERT_TRUE(r.tooltip.find("lo (") == std::string::npos);
}

TEST(formatter_is_deterministic) {
  auto cs = lanprobe::app::classify(two_segment_snapshot());
  Formatter f;
  auto a = f.render(cs);
  auto b = f.render(cs);
  ASSERT_EQ(a.text, b.text);
  ASSERT_EQ(a.tooltip, b.tooltip);
  ASSERT_EQ(a.alt, b.alt);
  ASSERT_TRUE(a.classes == b.classes);
}

TEST(formatter_lookup_failure_line) {
  NetworkSnapshot s;
  s.interfaces.push_back(make_iface("eth0", InterfaceKind::Ethernet));
  s.neighbors_by_interface[InterfaceName("eth0")] = {};
  s.lookup_failures[InterfaceName("eth0")] = "eth0: no <table>";
  auto r = Formatter().render(lanprobe::app::classify(s));
  ASSERT_EQ(r.text, std::string(lanprobe::ui::kDefaultGlyph) + " 0");
  ASSERT_EQ(r.alt, "unreachable");
  ASSERT_EQ(r.classes.size(), 2u);
  ASSERT_CONTAINS(r.tooltip, "<span color='#888888'>eth0 (ethernet): unreachable, 0 devices</span>");
  ASSERT_CONTAINS(r.tooltip, "lookup failed: eth0: no &lt;table&gt;");
}

TEST(formatter_no_interfaces) {
  NetworkSnapshot s;
  s.interfaces.push_back(make_iface("lo", InterfaceKind::Loopback));
  auto r = Formatter().render(lanprobe::app::classify(s));
  ASSERT_EQ(r.tooltip, "No network interfaces found");
  ASSERT_EQ(r.alt, "empty");
  ASSERT_EQ(r.text, std::string(lanprobe::ui::kDefaultGlyph) + " 0");
}

TEST(formatter_route_annotations) {
  auto s = two_segment_snapshot();
  s.route.gateway = IpAddress("192.168.1.10");
  s.route.gateway_interface = InterfaceName("eth0");
  s.route.dns_servers = {IpAddress("192.168.1.10"), IpAddress("192.168.1.20")};
  auto r = Formatter().render(lanprobe::app::classify(s));
  ASSERT_CONTAINS(r.tooltip, "192.168.1.10 aa:bb:cc:dd:ee:10 reachable [gateway, dns]");
  ASSERT_CONTAINS(r.tooltip, "192.168.1.20 aa:bb:cc:dd:ee:20 reachable [dns]");
  ASSERT_TRUE(r.tooltip.find("192.168.1.21 (incomplete) stale [") == std::string::npos);
}

TEST(formatter_display_filters) {
  lanprobe::ui::Config::Display opts;
  opts.glyph = "NET";
  opts.show_devices = false;
  opts.ignore_prefixes = {"wl"};
  auto s = two_segment_snapshot();
  s.interfaces.push_back(make_iface("eno1", InterfaceKind::Ethernet, OperState::Down));
  auto cs = lanprobe::app::classify(s);

  auto r = Formatter(opts).render(cs);
  ASSERT_EQ(r.text, "NET 1");
  ASSERT_TRUE(r.tooltip.find("wlan0") == std::string::npos);
  ASSERT_TRUE(r.tooltip.find("192.168.1.10") == std::string::npos);
  ASSERT_CONTAINS(r.tooltip, "eno1 (ethernet): unreachable");
  ASSERT_EQ(r.alt, "unreachable");

  opts.hide_down = true;
  r = Formatter(opts).render(cs);
  ASSERT_TRUE(r.tooltip.find("eno1") == std::string::npos);
  ASSERT_EQ(r.alt, "healthy");
}

TEST(formatter_error_rendering) {
  auto r = Formatter().render_error("interface enumeration", "cannot list /sys/class/net: No such file");
  ASSERT_EQ(r.text, std::string(lanprobe::ui::kDefaultGlyph) + " --");
  ASSERT_EQ(r.tooltip, "Unable to fetch network data\n\ninterface enumeration: cannot list /sys/class/net: No such file");
  ASSERT_EQ(r.alt, "error");
  ASSERT_EQ(r.classes.size(), 2u);
  ASSERT_EQ(r.classes[1], "error");
}

TEST(markup_escaping) {
  ASSERT_EQ(lanprobe::ui::escape_markup("a&b<c>d'e"), "a&amp;b&lt;c&gt;d'e");
}

TEST(formatter_hostname_prefix) {
  auto s = two_segment_snapshot();
  s.hostnames[IpAddress("192.168.1.20")] = "printer<lan>.home";
  auto r = Formatter().render(lanprobe::app::classify(s));
  ASSERT_CONTAINS(r.tooltip, "<span color='#00FF00'>printer&lt;lan&gt;.home 192.168.1.20 aa:bb:cc:dd:ee:20 reachable</span>");
  ASSERT_CONTAINS(r.tooltip, "<span color='#00FF00'>192.168.1.10 aa:bb:cc:dd:ee:10 reachable</span>");
}

TEST(formatter_dns_line_for_non_neighbor_resolvers) {
  auto s = two_segment_snapshot();
  s.route.gateway = IpAddress("192.168.1.10");
  s.route.gateway_interface = InterfaceName("eth0");
  s.route.dns_servers = {IpAddress("192.168.1.10"), IpAddress("1.1.1.1"), IpAddress("10.0.0.53")};
  auto r = Formatter().render(lanprobe::app::classify(s));
  const std::string eth0_block =
    "<span color='#00FF00'>eth0 (ethernet, 192.168.1.5): healthy, 1 device</span>\n"
    "  \xE2\x94\x9C\xE2\x94\x80 <span color='#00FF00'>192.168.1.10 aa:bb:cc:dd:ee:10 reachable [gateway, dns]</span>\n"
    "  \xE2\x94\x94\xE2\x94\x80 <span color='#888888'>DNS: 1.1.1.1 (external), 10.0.0.53 (local)</span>";
  ASSERT_CONTAINS(r.tooltip, eth0_block);
  // listed once, under the gateway interface only
  ASSERT_EQ(r.tooltip.find("DNS: "), r.tooltip.rfind("DNS: "));

  s.route.dns_servers = {IpAddress("192.168.1.20")};
  r = Formatter().render(lanprobe::app::classify(s));
  ASSERT_TRUE(r.tooltip.find("DNS: ") == std::string::npos);
}

TEST(local_address_ranges) {
  using lanprobe::model::is_local_address;
  ASSERT_TRUE(is_local_address(IpAddress("192.168.0.1")));
  ASSERT_TRUE(is_local_address(IpAddress("172.31.255.1")));
  ASSERT_TRUE(!is_local_address(IpAddress("172.32.0.1")));
  ASSERT_TRUE(is_local_address(IpAddress("127.0.0.53")));
  ASSERT_TRUE(!is_local_address(IpAddress("8.8.8.8")));
  ASSERT_TRUE(is_local_address(IpAddress("fd00::1")));
  ASSERT_TRUE(is_local_address(IpAddress("fe80::1")));
  ASSERT_TRUE(is_local_address(IpAddress("::1")));
  ASSERT_TRUE(!is_local_address(IpAddress("2606:4700::1111")));
}
