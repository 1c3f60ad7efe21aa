#include "model/Address.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cctype>
#include <cstdio>
#include <cstring>

namespace lanprobe::model {

InvalidFormat::InvalidFormat(std::string field, std::string raw)
  : std::runtime_error("invalid " + field + ": '" + raw + "'"),
    field_(std::move(field)), raw_(std::move(raw)) {}

// ---------------- InterfaceName ----------------

bool InterfaceName::valid(std::string_view raw) noexcept {
  if (raw.empty() || raw.size() > kMaxLen) return false;
  if (raw == "." || raw == "..") return false;
  for (char c : raw) {
    if (c == '/' || c == ':' || c == '\0') return false;
    if (std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

InterfaceName::InterfaceName(std::string_view raw) {
  if (!valid(raw)) throw InvalidFormat("interface name", std::string(raw));
  value_ = std::string(raw);
}

std::optional<InterfaceName> InterfaceName::try_parse(std::string_view raw) {
  if (!valid(raw)) return std::nullopt;
  return InterfaceName(raw);
}

// ---------------- MacAddress ----------------

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

static bool parse_mac(std::string_view raw, MacAddress::Bytes& out) {
  // six octets of exactly two hex digits, five ':' separators
  if (raw.size() != 17) return false;
  for (size_t i = 0; i < 6; ++i) {
    size_t p = i * 3;
    int hi = hex_value(raw[p]), lo = hex_value(raw[p + 1]);
    if (hi < 0 || lo < 0) return false;
    if (i < 5 && raw[p + 2] != ':') return false;
    out[i] = static_cast<uint8_t>(hi * 16 + lo);
  }
  return true;
}

MacAddress::MacAddress(std::string_view raw) {
  if (!parse_mac(raw, bytes_)) throw InvalidFormat("MAC address", std::string(raw));
}

std::optional<MacAddress> MacAddress::try_parse(std::string_view raw) {
  Bytes b{};
  if (!parse_mac(raw, b)) return std::nullopt;
  return MacAddress(b);
}

bool MacAddress::is_zero() const noexcept {
  for (auto b : bytes_) if (b != 0) return false;
  return true;
}

std::string MacAddress::str() const {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5]);
  return std::string(buf);
}

// ---------------- IpAddress ----------------

static bool parse_ip(std::string_view raw, IpAddress::Family& fam, std::array<uint8_t, 16>& out) {
  if (raw.empty() || raw.size() >= INET6_ADDRSTRLEN) return false;
  std::string s(raw); // inet_pton needs NUL termination
  out.fill(0);
  if (s.find(':') == std::string::npos) {
    in_addr a4{};
    if (::inet_pton(AF_INET, s.c_str(), &a4) != 1) return false;
    std::memcpy(out.data(), &a4, 4);
    fam = IpAddress::Family::V4;
    return true;
  }
  in6_addr a6{};
  if (::inet_pton(AF_INET6, s.c_str(), &a6) != 1) return false;
  std::memcpy(out.data(), &a6, 16);
  fam = IpAddress::Family::V6;
  return true;
}

IpAddress::IpAddress(std::string_view raw) {
  if (!parse_ip(raw, family_, bytes_)) throw InvalidFormat("IP address", std::string(raw));
}

std::optional<IpAddress> IpAddress::try_parse(std::string_view raw) {
  IpAddress ip;
  if (!parse_ip(raw, ip.family_, ip.bytes_)) return std::nullopt;
  return ip;
}

IpAddress IpAddress::v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) noexcept {
  IpAddress ip;
  ip.family_ = Family::V4;
  ip.bytes_[0] = a; ip.bytes_[1] = b; ip.bytes_[2] = c; ip.bytes_[3] = d;
  return ip;
}

IpAddress IpAddress::v6(const std::array<uint8_t, 16>& bytes) noexcept {
  IpAddress ip;
  ip.family_ = Family::V6;
  ip.bytes_ = bytes;
  return ip;
}

IpAddress IpAddress::from_bytes(const uint8_t* data, size_t len) {
  if (len == 4) return v4(data[0], data[1], data[2], data[3]);
  if (len == 16) {
    std::array<uint8_t, 16> b{};
    std::memcpy(b.data(), data, 16);
    return v6(b);
  }
  throw InvalidFormat("IP address", std::to_string(len) + "-byte value");
}

std::string IpAddress::str() const {
  char buf[INET6_ADDRSTRLEN] = {0};
  if (is_v4()) ::inet_ntop(AF_INET, bytes_.data(), buf, sizeof(buf));
  else ::inet_ntop(AF_INET6, bytes_.data(), buf, sizeof(buf));
  return std::string(buf);
}

bool is_local_address(const IpAddress& ip) noexcept {
  const auto& b = ip.bytes();
  if (ip.is_v4()) {
    return b[0] == 10 || b[0] == 127 ||
           (b[0] == 172 && b[1] >= 16 && b[1] <= 31) ||
           (b[0] == 192 && b[1] == 168) ||
           (b[0] == 169 && b[1] == 254);
  }
  if ((b[0] & 0xFE) == 0xFC) return true;                 // fc00::/7
  if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) return true; // fe80::/10
  for (size_t i = 0; i < 15; ++i) if (b[i] != 0) return false;
  return b[15] == 1;                                      // ::1
}

} // namespace lanprobe::model
