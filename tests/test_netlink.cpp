#include "minitest.hpp"
#include "util/Netlink.hpp"

#include <sys/socket.h>
#include <chrono>
#include <utility>

TEST(rtnl_dump_smoke) {
  lanprobe::util::RtnlSocket sock(std::chrono::milliseconds(500));
  if (!sock.open()) {
    // sandboxed builds may not allow NETLINK_ROUTE
    ASSERT_TRUE(!sock.error().empty());
    return;
  }
  std::vector<lanprobe::util::NeighborRow> rows;
  if (!sock.dump_neighbors(rows)) {
    ASSERT_TRUE(!sock.error().empty());
    return;
  }
  for (const auto& r : rows) {
    ASSERT_TRUE(r.family == AF_INET || r.family == AF_INET6);
    ASSERT_TRUE(r.addr_len == 4 || r.addr_len == 16);
    ASSERT_TRUE(r.lladdr_len <= 6);
    ASSERT_TRUE(r.ifindex > 0);
  }
}

TEST(rtnl_socket_move_transfers_fd) {
  lanprobe::util::RtnlSocket a(std::chrono::milliseconds(100));
  if (!a.open()) return; // graceful skip
  lanprobe::util::RtnlSocket b(std::move(a));
  ASSERT_TRUE(b.is_open());
  ASSERT_TRUE(!a.is_open());
}
