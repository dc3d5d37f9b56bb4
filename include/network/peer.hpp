// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace ukulele {
namespace network {

class Peer;
using PeerPtr = std::shared_ptr<Peer>;

enum class PeerState {
  RUNNING,  // Connection established and in use
  STOPPED   // Stopped (replaced, evicted or disconnected); never restarted
};

// Peer - handle for one network participant
//
// Identity (id) is stable across reconnects; the registry uses it to detect
// duplicates. The network address is the remote endpoint of the connection.
//
// Threading: id, address and direction are immutable after construction.
// The seed flag and state are atomic because the registry mutates them under
// its own lock while other threads read them.
class Peer : public std::enable_shared_from_this<Peer> {
private:
  // Passkey idiom: allows make_shared while preventing direct construction
  struct PrivateTag {};

public:
  // Outbound peer (we dialed it). Seed peers are configured bootstrap nodes.
  static PeerPtr create_outbound(const std::string& id, const protocol::NetworkAddress& addr,
                                 TransportConnectionPtr connection = nullptr, bool is_seed = false);

  // Inbound peer (they dialed us). The address is taken from the connection
  // when one is given, otherwise from addr.
  static PeerPtr create_inbound(const std::string& id, TransportConnectionPtr connection,
                                const protocol::NetworkAddress& addr = {});

  Peer(PrivateTag, const std::string& id, const protocol::NetworkAddress& addr, TransportConnectionPtr connection,
       bool is_outbound, bool is_seed);
  ~Peer();

  Peer(const Peer&) = delete;
  Peer& operator=(const Peer&) = delete;

  // Stop the peer and close its connection. Returns false if already stopped.
  bool Stop();

  const std::string& ID() const { return id_; }
  const protocol::NetworkAddress& NetAddress() const { return address_; }

  bool IsOutbound() const { return is_outbound_; }
  bool IsSeed() const { return is_seed_.load(std::memory_order_acquire); }
  void SetSeed(bool seed) { is_seed_.store(seed, std::memory_order_release); }

  PeerState state() const { return state_.load(std::memory_order_acquire); }
  bool IsRunning() const { return state() == PeerState::RUNNING; }

  std::chrono::steady_clock::time_point created_at() const { return created_at_; }

private:
  const std::string id_;
  const protocol::NetworkAddress address_;
  TransportConnectionPtr connection_;
  const bool is_outbound_;
  std::atomic<bool> is_seed_;
  std::atomic<PeerState> state_{PeerState::RUNNING};
  const std::chrono::steady_clock::time_point created_at_;
};

}  // namespace network
}  // namespace ukulele
