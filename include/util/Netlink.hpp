#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lanprobe::util {

// One row of the kernel neighbor table as dumped by RTM_GETNEIGH.
struct NeighborRow {
  int ifindex{0};
  int family{0};                     // AF_INET or AF_INET6
  std::array<uint8_t, 16> addr{};
  size_t addr_len{0};
  std::array<uint8_t, 6> lladdr{};
  size_t lladdr_len{0};              // 0 when unresolved
  uint16_t nud_state{0};
};

// Kernel NUD_* bit to its `ip neigh` name ("REACHABLE", "STALE", ...).
const char* nud_state_name(uint16_t nud_state);

// NETLINK_ROUTE socket with a bounded receive timeout. Move-only.
class RtnlSocket {
public:
  explicit RtnlSocket(std::chrono::milliseconds recv_timeout = std::chrono::milliseconds(1000));
  ~RtnlSocket();
  RtnlSocket(const RtnlSocket&) = delete;
  RtnlSocket& operator=(const RtnlSocket&) = delete;
  RtnlSocket(RtnlSocket&& other) noexcept;
  RtnlSocket& operator=(RtnlSocket&& other) noexcept;

  // False if the socket could not be created/bound; error() says why.
  [[nodiscard]] bool open();
  [[nodiscard]] bool is_open() const noexcept { return fd_ != -1; }
  [[nodiscard]] const std::string& error() const noexcept { return error_; }

  // Dump the neighbor table of both address families. Returns false on
  // send/receive failure or timeout.
  [[nodiscard]] bool dump_neighbors(std::vector<NeighborRow>& out);

private:
  void close_fd() noexcept;

  int fd_{-1};
  uint32_t seq_{0};
  std::chrono::milliseconds recv_timeout_;
  std::string error_;
};

} // namespace lanprobe::util
