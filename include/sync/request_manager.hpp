// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RequestManager - pending-hash tracking and data-request retry engine

 Turns "peer P says it has hash H" into "block H fetched and delivered once".

 Entry lifecycle
 - AddHash registers H (or merges candidate peers into the existing entry).
   Hashes already resolved or stored locally are ignored.
 - On each tick, every PENDING entry with a candidate is requested from the
   next candidate (round-robin) and becomes IN_FLIGHT. Requests are batched
   per peer, at most MAX_INVENTORY_SIZE hashes per DataRequest.
 - An IN_FLIGHT entry older than request_timeout is re-armed as PENDING and
   the next tick asks the following candidate. After max_request_attempts
   requests the entry is dropped.
 - AddBlock resolves the block's hash: the entry is removed and the block is
   handed to the sink exactly once (resolved hashes are remembered, bounded by
   resolved_cache_size).
 - Entries with no candidates stay dormant until AddHash supplies one, or
   until dormant_timeout passes and they are dropped.
 - The table holds at most max_pending entries. A new hash arriving at a full
   table evicts the oldest dormant entry; with none to evict it is refused.

 Threading
 - Entry table guarded by mutex_; never held across dispatcher or sink calls.
 - Start() runs an asio io_context on its own thread; a steady_timer drives
   ProcessTimers(). Tests call ProcessTimers() directly with mock time.
*/

#include "chain/block.hpp"
#include "sync/interfaces.hpp"
#include "sync/sync_config.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

namespace ukulele {
namespace sync {

struct RequestStats {
  size_t pending{0};
  uint64_t requests_sent{0};     // DataRequest messages dispatched
  uint64_t hashes_requested{0};  // individual hash requests (incl. retries)
  uint64_t retries{0};           // timed-out requests re-armed
  uint64_t expired{0};           // dropped after max attempts or dormant_timeout
  uint64_t evicted{0};           // dormant entries evicted from a full table
  uint64_t rejected{0};          // new hashes refused by a full table
  uint64_t blocks_resolved{0};
  uint64_t duplicates_ignored{0};
};

// Snapshot of one pending entry
struct PendingInfo {
  std::vector<std::string> candidates;
  bool in_flight{false};
  uint32_t attempts{0};
};

class RequestManager {
public:
  // Receives every resolved block exactly once
  using BlockSink = std::function<void(chain::BlockPtr)>;

  RequestManager(const ChainReader& chain, Dispatcher& dispatcher, const SyncConfig& config, BlockSink sink);
  ~RequestManager();

  RequestManager(const RequestManager&) = delete;
  RequestManager& operator=(const RequestManager&) = delete;

  // Launch the retry loop; it exits when stop_token is cancelled or Stop() is called
  void Start(std::stop_token stop_token);
  void Stop();
  // Blocks until the retry loop has exited
  void Wait();
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  void AddHash(const chain::BlockHash& hash, const std::vector<std::string>& peer_ids);

  // Resolve a fetched block. source_peer (if known) becomes the candidate for
  // its parent when the parent is missing locally. Returns false if the block
  // was null or already resolved.
  bool AddBlock(chain::BlockPtr block, const std::string& source_peer = "");

  // One scan: re-arm timed-out entries, drop exhausted ones, issue requests
  void ProcessTimers();

  bool IsPending(const chain::BlockHash& hash) const;
  bool IsResolved(const chain::BlockHash& hash) const;
  std::optional<PendingInfo> GetPending(const chain::BlockHash& hash) const;
  size_t PendingCount() const;

  RequestStats GetStats() const;

private:
  enum class State { PENDING, IN_FLIGHT };

  struct PendingHash {
    std::vector<std::string> candidates;  // unique, in order learned
    size_t next_candidate{0};
    State state{State::PENDING};
    uint32_t attempts{0};
    std::chrono::steady_clock::time_point last_attempt{};
    std::chrono::steady_clock::time_point added{};
  };

  using PendingMap = std::map<chain::BlockHash, PendingHash>;

  void schedule_next_tick();
  void MergeCandidatesLocked(PendingHash& entry, const std::vector<std::string>& peer_ids);
  void MarkResolvedLocked(const chain::BlockHash& hash);
  // Creates an entry, making room if needed. Returns pending_.end() when full.
  PendingMap::iterator InsertLocked(const chain::BlockHash& hash);
  bool EvictDormantLocked();
  void TrackDormantLocked(const chain::BlockHash& hash);
  bool IsResolvedLocked(const chain::BlockHash& hash) const { return resolved_.count(hash) > 0; }

  const ChainReader& chain_;
  Dispatcher& dispatcher_;
  const SyncConfig config_;
  BlockSink sink_;

  mutable std::mutex mutex_;
  PendingMap pending_;
  std::deque<chain::BlockHash> dormant_order_;  // oldest first; may hold stale hashes
  std::set<chain::BlockHash> resolved_;
  std::deque<chain::BlockHash> resolved_order_;  // FIFO for bounding resolved_

  std::atomic<uint64_t> requests_sent_{0};
  std::atomic<uint64_t> hashes_requested_{0};
  std::atomic<uint64_t> retries_{0};
  std::atomic<uint64_t> expired_{0};
  std::atomic<uint64_t> evicted_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> blocks_resolved_{0};
  std::atomic<uint64_t> duplicates_ignored_{0};

  // Retry loop
  asio::io_context io_context_;
  asio::steady_timer tick_timer_{io_context_};
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
  std::optional<std::stop_callback<std::function<void()>>> stop_callback_;
};

}  // namespace sync
}  // namespace ukulele
