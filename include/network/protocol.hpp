// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace ukulele {
namespace protocol {

// Logical channels (protocol topics) carried by the transport layer
enum class ChannelID : uint8_t {
  HEADER = 1,
  BLOCK = 2,
  PROPOSAL = 3,
  COMMIT_CERTIFICATE = 4,
  VOTE = 5,
};

// Returns false for values outside the ChannelID enumeration
[[nodiscard]] bool IsKnownChannel(uint8_t raw) noexcept;

[[nodiscard]] std::string ChannelName(ChannelID channel);

// ============================================================================
// SECURITY LIMITS
// ============================================================================

// Hashes enumerated per inventory response (and per data request)
constexpr size_t MAX_INVENTORY_SIZE = 100;

// Single encoded sync message
constexpr size_t MAX_PROTOCOL_MESSAGE_LENGTH = 8010000;  // 8.01 MB

// Longest hash string accepted at the protocol boundary (hex of 64 bytes)
constexpr size_t MAX_HASH_STRING_LENGTH = 128;

// Transactions per block and votes per vote set accepted by the decoders
constexpr size_t MAX_BLOCK_TRANSACTIONS = 100000;
constexpr size_t MAX_VOTES_PER_SET = 10000;

// Network address (18 bytes of identity: 16 IP + 2 port)
struct NetworkAddress {
  std::array<uint8_t, 16> ip;  // IPv6 format (IPv4 mapped)
  uint16_t port;

  NetworkAddress() noexcept;
  NetworkAddress(const std::array<uint8_t, 16>& addr, uint16_t p) noexcept;

  // Parse IPv4 or IPv6 text. Returns a zero address on parse failure.
  [[nodiscard]] static NetworkAddress from_string(const std::string& ip_str, uint16_t port);

  [[nodiscard]] bool is_ipv4() const noexcept;

  // All IP bytes zero (parse failure or uninitialized)
  [[nodiscard]] bool is_zero() const noexcept;

  // IP text without port; std::nullopt if the bytes cannot be formatted
  [[nodiscard]] std::optional<std::string> to_string() const noexcept;

  // "ip:port" (or "[ip]:port" for IPv6), used in logs
  [[nodiscard]] std::string ToStringWithPort() const;

  [[nodiscard]] bool operator<(const NetworkAddress& other) const noexcept;
  [[nodiscard]] bool operator==(const NetworkAddress& other) const noexcept;
};

}  // namespace protocol
}  // namespace ukulele
