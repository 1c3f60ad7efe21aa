#include "util/Netlink.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <linux/neighbour.h>

namespace lanprobe::util {

const char* nud_state_name(uint16_t nud_state) {
  // Kernel reports a single state bit per entry; check the most specific first
  if (nud_state & NUD_PERMANENT) return "PERMANENT";
  if (nud_state & NUD_NOARP) return "NOARP";
  if (nud_state & NUD_REACHABLE) return "REACHABLE";
  if (nud_state & NUD_STALE) return "STALE";
  if (nud_state & NUD_DELAY) return "DELAY";
  if (nud_state & NUD_PROBE) return "PROBE";
  if (nud_state & NUD_FAILED) return "FAILED";
  if (nud_state & NUD_INCOMPLETE) return "INCOMPLETE";
  return "NONE";
}

RtnlSocket::RtnlSocket(std::chrono::milliseconds recv_timeout) : recv_timeout_(recv_timeout) {}

RtnlSocket::~RtnlSocket() { close_fd(); }

RtnlSocket::RtnlSocket(RtnlSocket&& other) noexcept
  : fd_(other.fd_), seq_(other.seq_), recv_timeout_(other.recv_timeout_), error_(std::move(other.error_)) {
  other.fd_ = -1;
}

RtnlSocket& RtnlSocket::operator=(RtnlSocket&& other) noexcept {
  if (this != &other) {
    close_fd();
    fd_ = other.fd_; other.fd_ = -1;
    seq_ = other.seq_;
    recv_timeout_ = other.recv_timeout_;
    error_ = std::move(other.error_);
  }
  return *this;
}

void RtnlSocket::close_fd() noexcept {
  if (fd_ != -1) { ::close(fd_); fd_ = -1; }
}

bool RtnlSocket::open() {
  close_fd();
  fd_ = ::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_ROUTE);
  if (fd_ == -1) {
    error_ = std::string("socket: ") + std::strerror(errno);
    return false;
  }

  // Bound every receive so a wedged kernel reply cannot hang the run
  struct timeval tv;
  tv.tv_sec = static_cast<time_t>(recv_timeout_.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((recv_timeout_.count() % 1000) * 1000);
  if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == -1) {
    error_ = std::string("setsockopt(SO_RCVTIMEO): ") + std::strerror(errno);
    close_fd();
    return false;
  }

  struct sockaddr_nl addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.nl_family = AF_NETLINK;
  if (::bind(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == -1) {
    error_ = std::string("bind: ") + std::strerror(errno);
    close_fd();
    return false;
  }
  return true;
}

static void parse_neigh(const struct nlmsghdr* nh, std::vector<NeighborRow>& out) {
  const auto* ndm = static_cast<const struct ndmsg*>(NLMSG_DATA(nh));
  int attr_len = static_cast<int>(nh->nlmsg_len) - static_cast<int>(NLMSG_LENGTH(sizeof(*ndm)));
  if (attr_len < 0) return;
  if (ndm->ndm_family != AF_INET && ndm->ndm_family != AF_INET6) return;

  NeighborRow row;
  row.ifindex = ndm->ndm_ifindex;
  row.family = ndm->ndm_family;
  row.nud_state = ndm->ndm_state;

  // attributes follow the aligned ndmsg header
  auto* rta = reinterpret_cast<const struct rtattr*>(
      reinterpret_cast<const char*>(ndm) + NLMSG_ALIGN(sizeof(struct ndmsg)));
  for (; RTA_OK(rta, attr_len); rta = RTA_NEXT(rta, attr_len)) {
    size_t plen = RTA_PAYLOAD(rta);
    if (rta->rta_type == NDA_DST && (plen == 4 || plen == 16)) {
      std::memcpy(row.addr.data(), RTA_DATA(rta), plen);
      row.addr_len = plen;
    } else if (rta->rta_type == NDA_LLADDR && plen == 6) {
      std::memcpy(row.lladdr.data(), RTA_DATA(rta), plen);
      row.lladdr_len = plen;
    }
  }
  if (row.addr_len == 0) return;
  out.push_back(row);
}

bool RtnlSocket::dump_neighbors(std::vector<NeighborRow>& out) {
  if (fd_ == -1 && !open()) return false;

  struct {
    struct nlmsghdr nlh;
    struct ndmsg ndm;
  } req;
  std::memset(&req, 0, sizeof(req));
  req.nlh.nlmsg_len = NLMSG_LENGTH(sizeof(struct ndmsg));
  req.nlh.nlmsg_type = RTM_GETNEIGH;
  req.nlh.nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
  req.nlh.nlmsg_seq = ++seq_;
  req.ndm.ndm_family = AF_UNSPEC;

  struct sockaddr_nl kernel;
  std::memset(&kernel, 0, sizeof(kernel));
  kernel.nl_family = AF_NETLINK;
  if (::sendto(fd_, &req, req.nlh.nlmsg_len, 0,
               reinterpret_cast<struct sockaddr*>(&kernel), sizeof(kernel)) < 0) {
    error_ = std::string("sendto: ") + std::strerror(errno);
    return false;
  }

  alignas(struct nlmsghdr) char buf[32768];
  for (;;) {
    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) error_ = "neighbor dump timed out";
      else error_ = std::string("recv: ") + std::strerror(errno);
      return false;
    }
    if (n == 0) {
      error_ = "netlink socket closed";
      return false;
    }
    int len = static_cast<int>(n);
    for (auto* nh = reinterpret_cast<struct nlmsghdr*>(buf); NLMSG_OK(nh, len); nh = NLMSG_NEXT(nh, len)) {
      if (nh->nlmsg_seq != seq_) continue;
      if (nh->nlmsg_type == NLMSG_DONE) return true;
      if (nh->nlmsg_type == NLMSG_ERROR) {
        const auto* e = static_cast<const struct nlmsgerr*>(NLMSG_DATA(nh));
        error_ = std::string("netlink: ") + std::strerror(-e->error);
        return false;
      }
      if (nh->nlmsg_type == RTM_NEWNEIGH) parse_neigh(nh, out);
    }
  }
}

} // namespace lanprobe::util
