// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer.hpp"

#include "util/logging.hpp"
#include "util/time.hpp"

namespace ukulele {
namespace network {

namespace {

protocol::NetworkAddress AddressFromConnection(const TransportConnectionPtr& connection,
                                               const protocol::NetworkAddress& fallback) {
  if (!connection) {
    return fallback;
  }
  auto addr = protocol::NetworkAddress::from_string(connection->remote_address(), connection->remote_port());
  return addr.is_zero() ? fallback : addr;
}

}  // namespace

Peer::Peer(PrivateTag, const std::string& id, const protocol::NetworkAddress& addr, TransportConnectionPtr connection,
           bool is_outbound, bool is_seed)
    : id_(id), address_(addr), connection_(std::move(connection)), is_outbound_(is_outbound), is_seed_(is_seed),
      created_at_(util::GetSteadyTime()) {}

Peer::~Peer() {
  try {
    Stop();
  } catch (const std::exception& e) {
    LOG_NET_ERROR("failed to stop peer {} during destruction: {}", id_, e.what());
  }
}

PeerPtr Peer::create_outbound(const std::string& id, const protocol::NetworkAddress& addr,
                              TransportConnectionPtr connection, bool is_seed) {
  return std::make_shared<Peer>(PrivateTag{}, id, addr, std::move(connection), true, is_seed);
}

PeerPtr Peer::create_inbound(const std::string& id, TransportConnectionPtr connection,
                             const protocol::NetworkAddress& addr) {
  auto remote = AddressFromConnection(connection, addr);
  return std::make_shared<Peer>(PrivateTag{}, id, remote, std::move(connection), false, false);
}

bool Peer::Stop() {
  PeerState expected = PeerState::RUNNING;
  if (!state_.compare_exchange_strong(expected, PeerState::STOPPED, std::memory_order_acq_rel)) {
    return false;
  }
  if (connection_) {
    connection_->close();
  }
  LOG_NET_TRACE("peer {} ({}) stopped", id_, address_.ToStringWithPort());
  return true;
}

}  // namespace network
}  // namespace ukulele
