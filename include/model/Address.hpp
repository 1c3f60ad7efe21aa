#pragma once
#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lanprobe::model {

// Thrown when raw text or bytes cannot form a valid address value.
class InvalidFormat : public std::runtime_error {
public:
  InvalidFormat(std::string field, std::string raw);
  [[nodiscard]] const std::string& field() const noexcept { return field_; }
  [[nodiscard]] const std::string& raw() const noexcept { return raw_; }
private:
  std::string field_;
  std::string raw_;
};

// Kernel network device name (dev_valid_name rules).
class InterfaceName {
public:
  static constexpr size_t kMaxLen = 15; // IFNAMSIZ - 1

  explicit InterfaceName(std::string_view raw);
  static std::optional<InterfaceName> try_parse(std::string_view raw);
  static bool valid(std::string_view raw) noexcept;

  [[nodiscard]] const std::string& str() const noexcept { return value_; }
  auto operator<=>(const InterfaceName&) const = default;
  bool operator==(const InterfaceName&) const = default;
private:
  std::string value_;
};

class MacAddress {
public:
  using Bytes = std::array<uint8_t, 6>;

  explicit MacAddress(const Bytes& bytes) noexcept : bytes_(bytes) {}
  // Accepts "aa:bb:cc:dd:ee:ff" in either case.
  explicit MacAddress(std::string_view raw);
  static std::optional<MacAddress> try_parse(std::string_view raw);

  [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }
  [[nodiscard]] bool is_zero() const noexcept;
  [[nodiscard]] std::string str() const; // lowercase canonical form
  auto operator<=>(const MacAddress&) const = default;
  bool operator==(const MacAddress&) const = default;
private:
  Bytes bytes_{};
};

class IpAddress {
public:
  enum class Family : uint8_t { V4, V6 };

  // Strict inet_pton grammar for each family.
  explicit IpAddress(std::string_view raw);
  static std::optional<IpAddress> try_parse(std::string_view raw);

  static IpAddress v4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) noexcept;
  static IpAddress v6(const std::array<uint8_t, 16>& bytes) noexcept;
  // len must be 4 or 16; throws InvalidFormat otherwise
  static IpAddress from_bytes(const uint8_t* data, size_t len);

  [[nodiscard]] Family family() const noexcept { return family_; }
  [[nodiscard]] bool is_v4() const noexcept { return family_ == Family::V4; }
  [[nodiscard]] size_t size() const noexcept { return is_v4() ? 4 : 16; }
  [[nodiscard]] const std::array<uint8_t, 16>& bytes() const noexcept { return bytes_; }
  [[nodiscard]] std::string str() const;

  // V4 sorts before V6, then numerically (network byte order).
  auto operator<=>(const IpAddress&) const = default;
  bool operator==(const IpAddress&) const = default;
private:
  IpAddress() = default;
  Family family_{Family::V4};
  std::array<uint8_t, 16> bytes_{}; // V4 uses the first four bytes, rest zero
};

// Private IPv4 (10/8, 172.16/12, 192.168/16), loopback, link-local and IPv6 ULA.
[[nodiscard]] bool is_local_address(const IpAddress& ip) noexcept;

} // namespace lanprobe::model
