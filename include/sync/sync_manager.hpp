// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 * SyncManager - inventory-based block propagation
 *
 * Event loop
 * - One thread drains two queues: inbound sync messages (bounded by
 *   message_queue_size; HandleMessage blocks while full) and blocks resolved by
 *   the RequestManager. Resolved blocks are delivered first.
 * - Messages are processed one at a time, so the protocol handlers never race
 *   each other. Within one peer, delivery order is preserved.
 *
 * Protocol
 * - Inventory request (block channel): walk the local chain from start toward
 *   end along each block's first child, at most MAX_INVENTORY_SIZE hashes, and
 *   answer the origin peer. Unknown start or bad hash: logged, no answer.
 * - Inventory response: each hash becomes a pending hash with the origin peer
 *   as candidate.
 * - Data request (block channel): each locally known block is sent back in its
 *   own DataResponse; unknown hashes are skipped.
 * - Data response: decoded per channel (block, vote, proposal) and routed to
 *   the content handlers. Header and commit-certificate payloads are counted
 *   as unsupported. Certificates embedded in proposals forward their votes to
 *   the consumer without registering block hints.
 *
 * Failures are never reported to the peer. Handlers return false when a
 * message (or all of it) was dropped; counters in GetStats() record why.
 *
 * Lifecycle: Start(parent_token) launches the loop and the RequestManager;
 * Stop() (or cancelling parent_token) ends both; Wait() joins them. A stopped
 * manager is not restarted.
 */

#include "chain/block.hpp"
#include "network/protocol.hpp"
#include "sync/interfaces.hpp"
#include "sync/request_manager.hpp"
#include "sync/sync_config.hpp"
#include "sync/sync_message.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace ukulele {
namespace sync {

struct SyncStats {
  uint64_t messages_processed{0};
  uint64_t malformed_dropped{0};      // undecodable messages, hashes or payloads
  uint64_t unexpected_messages{0};    // unknown message discriminant
  uint64_t unsupported_channel{0};
  uint64_t not_found{0};              // unknown start hash or requested block
  uint64_t inventory_served{0};
  uint64_t data_served{0};
  uint64_t votes_forwarded{0};
  uint64_t blocks_delivered{0};
};

class SyncManager {
public:
  SyncManager(const ChainReader& chain, Dispatcher& dispatcher, MessageConsumer& consumer,
              const ConsensusEngine& consensus, const SyncConfig& config);
  ~SyncManager();

  SyncManager(const SyncManager&) = delete;
  SyncManager& operator=(const SyncManager&) = delete;

  // === Transport-facing surface ===

  // Channels this handler wants delivered
  static std::vector<protocol::ChannelID> GetChannelIDs();

  // Decode raw bytes received from peer_id on channel. out is written only
  // when OK is returned; the payload channel must match the transport channel.
  DecodeStatus ParseMessage(const std::string& peer_id, protocol::ChannelID channel, const std::vector<uint8_t>& data,
                            SyncMessage& out);

  std::vector<uint8_t> EncodeMessage(const MessageContent& content) const;

  // Enqueue an inbound message. Blocks while the queue is full; returns false
  // if the manager stopped before the message could be queued.
  bool HandleMessage(SyncMessage message);

  // === Lifecycle ===

  void Start(std::stop_token parent_token = {});
  void Stop();
  void Wait();

  // Ask peers to enumerate their chain forward from start_hash
  void RequestInventory(const std::vector<std::string>& peer_ids, const chain::BlockHash& start_hash);

  // === Processing (event-loop thread; public for tests) ===

  // Classify and handle one message. Returns false if it was dropped.
  bool ProcessMessage(const SyncMessage& message);

  bool HandleInventoryRequest(const std::string& peer_id, const InventoryRequest& request);
  bool HandleInventoryResponse(const std::string& peer_id, const InventoryResponse& response);
  bool HandleDataRequest(const std::string& peer_id, const DataRequest& request);
  bool HandleDataResponse(const std::string& peer_id, const DataResponse& response);

  bool HandleBlock(chain::BlockPtr block, const std::string& peer_id);
  bool HandleProposal(const chain::Proposal& proposal, const std::string& peer_id);
  // Forwards each certificate vote to the consumer
  void HandleCommitCertificate(const chain::CommitCertificate& cc);
  bool HandleVote(const chain::Vote& vote);

  RequestManager& Requests() { return requests_; }
  size_t QueueSize() const;
  SyncStats GetStats() const;

private:
  void Run(std::stop_token stop_token);
  void OnBlockResolved(chain::BlockPtr block);
  void DeliverBlock(const chain::BlockPtr& block);

  const ChainReader& chain_;
  Dispatcher& dispatcher_;
  MessageConsumer& consumer_;
  const SyncConfig config_;
  const std::string log_prefix_;  // "[node-id] " when print_self_id is set

  RequestManager requests_;

  // Event-loop queues, guarded by queue_mutex_
  mutable std::mutex queue_mutex_;
  std::condition_variable_any queue_cv_;  // inbound or completed non-empty
  std::condition_variable_any space_cv_;  // inbound below capacity
  std::deque<SyncMessage> inbound_;
  std::deque<chain::BlockPtr> completed_;

  std::stop_source stop_source_;
  std::mutex lifecycle_mutex_;
  std::thread thread_;
  bool started_{false};
  std::optional<std::stop_callback<std::function<void()>>> parent_callback_;

  std::atomic<uint64_t> messages_processed_{0};
  std::atomic<uint64_t> malformed_dropped_{0};
  std::atomic<uint64_t> unexpected_messages_{0};
  std::atomic<uint64_t> unsupported_channel_{0};
  std::atomic<uint64_t> not_found_{0};
  std::atomic<uint64_t> inventory_served_{0};
  std::atomic<uint64_t> data_served_{0};
  std::atomic<uint64_t> votes_forwarded_{0};
  std::atomic<uint64_t> blocks_delivered_{0};
};

}  // namespace sync
}  // namespace ukulele
