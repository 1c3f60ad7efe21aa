#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "model/Address.hpp"

namespace lanprobe::collectors {

// One blocking reverse lookup; nullopt when the address has no name.
using Resolver = std::function<std::optional<std::string>(const lanprobe::model::IpAddress&)>;

// getnameinfo(NI_NAMEREQD) through the system resolver (hosts file, DNS,
// whatever nsswitch is configured with).
std::optional<std::string> resolve_reverse(const lanprobe::model::IpAddress& ip);

// Reverse names for neighbor addresses under one shared deadline.
//
// getnameinfo() cannot be cancelled, so each lookup runs on a detached
// thread that reports into shared state. sample() returns at the deadline
// with whatever has arrived; late answers are discarded.
class HostnameCollector {
public:
  static constexpr std::size_t kMaxLookups = 64;

  explicit HostnameCollector(std::chrono::milliseconds budget, Resolver resolver = resolve_reverse);

  std::map<lanprobe::model::IpAddress, std::string> sample(const std::vector<lanprobe::model::IpAddress>& ips);
  [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }

private:
  std::chrono::milliseconds budget_;
  Resolver resolver_;
  std::vector<std::string> warnings_;
};

} // namespace lanprobe::collectors
