#include "collectors/HostnameCollector.hpp"

#include <condition_variable>
#include <cstring>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace lanprobe::collectors {

using lanprobe::model::IpAddress;

std::optional<std::string> resolve_reverse(const IpAddress& ip) {
  sockaddr_storage ss{};
  socklen_t len = 0;
  if (ip.is_v4()) {
    auto* sa = reinterpret_cast<sockaddr_in*>(&ss);
    sa->sin_family = AF_INET;
    std::memcpy(&sa->sin_addr, ip.bytes().data(), 4);
    len = sizeof(sockaddr_in);
  } else {
    auto* sa = reinterpret_cast<sockaddr_in6*>(&ss);
    sa->sin6_family = AF_INET6;
    std::memcpy(&sa->sin6_addr, ip.bytes().data(), 16);
    len = sizeof(sockaddr_in6);
  }
  char host[NI_MAXHOST] = {0};
  int rc = ::getnameinfo(reinterpret_cast<sockaddr*>(&ss), len, host, sizeof(host), nullptr, 0, NI_NAMEREQD);
  if (rc != 0 || host[0] == '\0') return std::nullopt;
  return std::string(host);
}

namespace {

// Outlives sample() when lookups are abandoned at the deadline.
struct PendingNames {
  std::mutex mu;
  std::condition_variable cv;
  std::map<IpAddress, std::string> names;
  std::vector<std::string> errors;
  std::size_t remaining{0};
};

} // namespace

HostnameCollector::HostnameCollector(std::chrono::milliseconds budget, Resolver resolver)
  : budget_(budget), resolver_(std::move(resolver)) {}

std::map<IpAddress, std::string> HostnameCollector::sample(const std::vector<IpAddress>& ips) {
  warnings_.clear();
  std::set<IpAddress> unique(ips.begin(), ips.end());
  if (unique.empty() || !resolver_) return {};
  if (unique.size() > kMaxLookups) {
    warnings_.push_back(std::to_string(unique.size() - kMaxLookups) + " addresses over the lookup limit skipped");
    unique.erase(std::next(unique.begin(), kMaxLookups), unique.end());
  }

  const auto deadline = std::chrono::steady_clock::now() + budget_;
  auto state = std::make_shared<PendingNames>();
  state->remaining = unique.size();

  std::size_t spawned = 0;
  for (const auto& ip : unique) {
    try {
      std::thread([state, resolver = resolver_, ip]() {
        std::optional<std::string> name;
        std::string error;
        try {
          name = resolver(ip);
        } catch (const std::exception& e) {
          error = ip.str() + ": " + e.what();
        }
        std::lock_guard<std::mutex> lock(state->mu);
        if (name && !name->empty()) state->names[ip] = *name;
        if (!error.empty()) state->errors.push_back(std::move(error));
        --state->remaining;
        state->cv.notify_all();
      }).detach();
      ++spawned;
    } catch (const std::system_error& e) {
      warnings_.push_back(std::string("thread spawn failed: ") + e.what() + "; " +
                          std::to_string(unique.size() - spawned) + " lookups skipped");
      std::lock_guard<std::mutex> lock(state->mu);
      state->remaining -= unique.size() - spawned;
      break;
    }
  }

  std::unique_lock<std::mutex> lock(state->mu);
  state->cv.wait_until(lock, deadline, [&state]() { return state->remaining == 0; });
  if (state->remaining > 0)
    warnings_.push_back(std::to_string(state->remaining) + " lookups still pending at deadline");
  for (auto& e : state->errors) warnings_.push_back(std::move(e));
  state->errors.clear();
  return state->names;
}

} // namespace lanprobe::collectors
