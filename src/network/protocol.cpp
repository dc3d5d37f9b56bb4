// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/protocol.hpp"

#include <algorithm>
#include <tuple>

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>
#include <asio/ip/address_v6.hpp>

namespace ukulele {
namespace protocol {

bool IsKnownChannel(uint8_t raw) noexcept {
  return raw >= static_cast<uint8_t>(ChannelID::HEADER) && raw <= static_cast<uint8_t>(ChannelID::VOTE);
}

std::string ChannelName(ChannelID channel) {
  switch (channel) {
    case ChannelID::HEADER:
      return "header";
    case ChannelID::BLOCK:
      return "block";
    case ChannelID::PROPOSAL:
      return "proposal";
    case ChannelID::COMMIT_CERTIFICATE:
      return "cc";
    case ChannelID::VOTE:
      return "vote";
  }
  return "unknown(" + std::to_string(static_cast<int>(channel)) + ")";
}

NetworkAddress::NetworkAddress() noexcept : port(0) {
  ip.fill(0);
}

NetworkAddress::NetworkAddress(const std::array<uint8_t, 16>& addr, uint16_t p) noexcept : ip(addr), port(p) {}

NetworkAddress NetworkAddress::from_string(const std::string& ip_str, uint16_t port) {
  NetworkAddress addr;
  addr.port = port;

  asio::error_code ec;
  auto ip_addr = asio::ip::make_address(ip_str, ec);
  if (ec) {
    addr.ip.fill(0);
    return addr;
  }

  if (ip_addr.is_v4()) {
    // IPv4-mapped IPv6 (::ffff:x.x.x.x)
    auto v6_mapped = asio::ip::make_address_v6(asio::ip::v4_mapped, ip_addr.to_v4());
    auto bytes = v6_mapped.to_bytes();
    std::copy(bytes.begin(), bytes.end(), addr.ip.begin());
  } else {
    auto bytes = ip_addr.to_v6().to_bytes();
    std::copy(bytes.begin(), bytes.end(), addr.ip.begin());
  }
  return addr;
}

bool NetworkAddress::is_ipv4() const noexcept {
  for (size_t i = 0; i < 10; ++i) {
    if (ip[i] != 0)
      return false;
  }
  return ip[10] == 0xff && ip[11] == 0xff;
}

bool NetworkAddress::is_zero() const noexcept {
  return std::all_of(ip.begin(), ip.end(), [](uint8_t b) { return b == 0; });
}

std::optional<std::string> NetworkAddress::to_string() const noexcept {
  try {
    asio::ip::address_v6::bytes_type bytes;
    std::copy(ip.begin(), ip.end(), bytes.begin());
    auto v6 = asio::ip::make_address_v6(bytes);
    if (v6.is_v4_mapped()) {
      return asio::ip::make_address_v4(asio::ip::v4_mapped, v6).to_string();
    }
    return v6.to_string();
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::string NetworkAddress::ToStringWithPort() const {
  auto ip_str = to_string().value_or("invalid");
  if (is_ipv4()) {
    return ip_str + ":" + std::to_string(port);
  }
  return "[" + ip_str + "]:" + std::to_string(port);
}

bool NetworkAddress::operator<(const NetworkAddress& other) const noexcept {
  return std::tie(ip, port) < std::tie(other.ip, other.port);
}

bool NetworkAddress::operator==(const NetworkAddress& other) const noexcept {
  return ip == other.ip && port == other.port;
}

}  // namespace protocol
}  // namespace ukulele
