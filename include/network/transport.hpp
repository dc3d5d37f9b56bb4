// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace ukulele {
namespace network {

// TransportConnection - the byte-level connection a Peer owns.
// Framing and I/O live in the transport layer; the peer registry only needs
// to close a connection when the peer is replaced or evicted.
class TransportConnection {
public:
  virtual ~TransportConnection() = default;

  // Close the connection. Must be idempotent.
  virtual void close() = 0;

  virtual bool is_open() const = 0;
  virtual std::string remote_address() const = 0;
  virtual uint16_t remote_port() const = 0;
};

using TransportConnectionPtr = std::shared_ptr<TransportConnection>;

}  // namespace network
}  // namespace ukulele
