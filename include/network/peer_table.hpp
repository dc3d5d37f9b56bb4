// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 PeerTable - registry of known peers

 Indexes
 - by identity (unique): peer ID -> peer
 - by address (unique): remote NetworkAddress -> peer
 - insertion order: drives deterministic iteration and age-based eviction

 Every peer in the ordered list appears in the identity map and its address
 appears in the address map (which resolves to the newest peer at that
 endpoint); both maps hold nothing else. All three
 views are mutated together under mutex_. Connections of replaced or removed
 peers are closed only after mutex_ is released, so a transport callback may
 re-enter the table.

 Replacement
 - AddPeer with an identity already present stops the old peer and takes over
   its slot in the ordered list.
 - When the replaced peer was outbound, the new peer inherits its seed flag
   (a seed that reconnects inbound stays a seed).

 Eviction
 - PurgeOldestPeer removes the least-recently-added non-seed peer from all
   three indexes. Seed peers are never evicted by age.

 Selection
 - GetSelection returns a random subset for peer exchange:
   clamp(max(23% of peers, min(32, peers)), upper = 250), chosen with a
   partial Fisher-Yates shuffle over a copy of the ordered list.
*/

#include "network/peer.hpp"
#include "network/protocol.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace ukulele {
namespace network {

struct PeerIDAddress {
  std::string id;
  protocol::NetworkAddress address;
};

class PeerTable {
public:
  // % of total peers known returned by GetSelection
  static constexpr size_t GET_SELECTION_PERCENT = 23;
  // Min peers returned by GetSelection (bootstrapping)
  static constexpr size_t MIN_GET_SELECTION = 32;
  // Max peers returned by GetSelection
  static constexpr size_t MAX_GET_SELECTION = 250;

  PeerTable();

  PeerTable(const PeerTable&) = delete;
  PeerTable& operator=(const PeerTable&) = delete;

  // Insert or replace (matched by identity). Always succeeds.
  bool AddPeer(const PeerPtr& peer);

  // Remove from every index. No-op if absent.
  void DeletePeer(const std::string& peer_id);

  // Evict the least-recently-added non-seed peer. Returns nullptr if every
  // peer is a seed or the table is empty. The caller decides whether to stop it.
  PeerPtr PurgeOldestPeer();

  // Exact lookups (nullptr if not found)
  PeerPtr GetPeer(const std::string& peer_id) const;
  PeerPtr GetPeerWithAddr(const protocol::NetworkAddress& addr) const;

  bool PeerExists(const std::string& peer_id) const;
  bool PeerAddrExists(const protocol::NetworkAddress& addr) const;

  // Snapshot of the ordered list
  std::vector<PeerPtr> GetAllPeers() const;

  // Random subset for peer exchange. Empty when the table is empty.
  std::vector<PeerIDAddress> GetSelection();

  size_t GetTotalNumPeers() const;

  // Size of GetSelection() for a table holding num_peers peers
  static size_t SelectionSize(size_t num_peers);

private:
  // Must be called with mutex_ held. Returns the removed peer so the caller
  // can release it outside the lock.
  PeerPtr EraseLocked(size_t index);
  void UnindexAddressLocked(const PeerPtr& peer);

  mutable std::mutex mutex_;
  std::vector<PeerPtr> peers_;                                  // insertion order
  std::unordered_map<std::string, PeerPtr> peer_map_;           // id -> peer
  std::map<protocol::NetworkAddress, PeerPtr> addr_map_;        // address -> peer
  std::mt19937_64 rng_;
};

}  // namespace network
}  // namespace ukulele
