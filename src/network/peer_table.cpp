// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/peer_table.hpp"

#include "util/logging.hpp"

#include <algorithm>

namespace ukulele {
namespace network {

PeerTable::PeerTable() : rng_(std::random_device{}()) {}

bool PeerTable::AddPeer(const PeerPtr& peer) {
  if (!peer) {
    return true;
  }

  // Replaced peer is stopped after the lock is released
  PeerPtr replaced;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = peer_map_.find(peer->ID());
    if (existing != peer_map_.end()) {
      if (existing->second == peer) {
        return true;
      }
      replaced = existing->second;
      auto slot = std::find(peers_.begin(), peers_.end(), replaced);

      // An outbound peer replaced by an inbound reconnect keeps its seed status
      if (replaced->IsOutbound()) {
        peer->SetSeed(replaced->IsSeed());
      }

      if (slot != peers_.end()) {
        *slot = peer;
      } else {
        peers_.push_back(peer);
      }
      UnindexAddressLocked(replaced);
    } else {
      peers_.push_back(peer);
    }

    // Two identities may share an endpoint (e.g. behind one NAT); the address
    // index resolves to the most recently added one.
    peer_map_[peer->ID()] = peer;
    addr_map_[peer->NetAddress()] = peer;

    LOG_NET_DEBUG("added peer {} ({}, {}, seed={}), total {}", peer->ID(), peer->NetAddress().ToStringWithPort(),
                  peer->IsOutbound() ? "outbound" : "inbound", peer->IsSeed(), peers_.size());
  }

  if (replaced) {
    LOG_NET_WARN("stopping duplicated peer: {}", replaced->ID());
    replaced->Stop();
  }
  return true;
}

void PeerTable::UnindexAddressLocked(const PeerPtr& peer) {
  auto addr_it = addr_map_.find(peer->NetAddress());
  if (addr_it == addr_map_.end() || addr_it->second != peer) {
    return;
  }

  // Fall back to the newest remaining peer at the same endpoint, if any
  auto other = std::find_if(peers_.rbegin(), peers_.rend(), [&](const PeerPtr& p) {
    return p != peer && p->NetAddress() == peer->NetAddress();
  });
  if (other != peers_.rend()) {
    addr_it->second = *other;
  } else {
    addr_map_.erase(addr_it);
  }
}

PeerPtr PeerTable::EraseLocked(size_t index) {
  PeerPtr peer = peers_[index];
  peers_.erase(peers_.begin() + static_cast<std::ptrdiff_t>(index));
  peer_map_.erase(peer->ID());
  UnindexAddressLocked(peer);
  return peer;
}

void PeerTable::DeletePeer(const std::string& peer_id) {
  // Declared before the lock: if this is the last reference, ~Peer closes the
  // connection after mutex_ is released.
  PeerPtr removed;
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = peer_map_.find(peer_id);
  if (it == peer_map_.end()) {
    return;
  }

  auto slot = std::find(peers_.begin(), peers_.end(), it->second);
  if (slot != peers_.end()) {
    removed = EraseLocked(static_cast<size_t>(slot - peers_.begin()));
  } else {
    removed = std::move(it->second);
    peer_map_.erase(it);
  }
}

PeerPtr PeerTable::PurgeOldestPeer() {
  std::lock_guard<std::mutex> lock(mutex_);

  for (size_t i = 0; i < peers_.size(); ++i) {
    if (!peers_[i]->IsSeed()) {
      PeerPtr peer = EraseLocked(i);
      LOG_NET_DEBUG("purged oldest non-seed peer {}, {} remaining", peer->ID(), peers_.size());
      return peer;
    }
  }
  return nullptr;
}

PeerPtr PeerTable::GetPeer(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = peer_map_.find(peer_id);
  return it == peer_map_.end() ? nullptr : it->second;
}

PeerPtr PeerTable::GetPeerWithAddr(const protocol::NetworkAddress& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = addr_map_.find(addr);
  return it == addr_map_.end() ? nullptr : it->second;
}

bool PeerTable::PeerExists(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peer_map_.count(peer_id) > 0;
}

bool PeerTable::PeerAddrExists(const protocol::NetworkAddress& addr) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return addr_map_.count(addr) > 0;
}

std::vector<PeerPtr> PeerTable::GetAllPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_;
}

size_t PeerTable::SelectionSize(size_t num_peers) {
  size_t n = std::max(std::min(MIN_GET_SELECTION, num_peers), num_peers * GET_SELECTION_PERCENT / 100);
  return std::min(MAX_GET_SELECTION, n);
}

std::vector<PeerIDAddress> PeerTable::GetSelection() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (peers_.empty()) {
    return {};
  }

  std::vector<PeerPtr> peers = peers_;
  const size_t num_peers = SelectionSize(peers.size());

  // Fisher-Yates over the first num_peers slots only; the rest is discarded
  for (size_t i = 0; i < num_peers; ++i) {
    std::uniform_int_distribution<size_t> dist(i, peers.size() - 1);
    std::swap(peers[i], peers[dist(rng_)]);
  }

  std::vector<PeerIDAddress> selection;
  selection.reserve(num_peers);
  for (size_t i = 0; i < num_peers; ++i) {
    selection.push_back(PeerIDAddress{peers[i]->ID(), peers[i]->NetAddress()});
  }
  return selection;
}

size_t PeerTable::GetTotalNumPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peers_.size();
}

}  // namespace network
}  // namespace ukulele
