// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/request_manager.hpp"

#include "network/protocol.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace ukulele {
namespace sync {

RequestManager::RequestManager(const ChainReader& chain, Dispatcher& dispatcher, const SyncConfig& config,
                               BlockSink sink)
    : chain_(chain), dispatcher_(dispatcher), config_(config), sink_(std::move(sink)) {
  config_.Validate();
  if (!sink_) {
    throw std::invalid_argument("RequestManager: block sink must be set");
  }
}

RequestManager::~RequestManager() {
  Stop();
  Wait();
}

void RequestManager::Start(std::stop_token stop_token) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (running_.load(std::memory_order_acquire) || thread_.joinable()) {
    LOG_SYNC_WARN("RequestManager: already started");
    return;
  }

  io_context_.restart();
  work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
      asio::make_work_guard(io_context_));
  running_.store(true, std::memory_order_release);
  schedule_next_tick();

  thread_ = std::thread([this]() {
    io_context_.run();
    LOG_SYNC_TRACE("RequestManager: retry loop exited");
  });

  // Runs Stop() inline if the token is already cancelled
  stop_callback_.emplace(stop_token, std::function<void()>([this]() { Stop(); }));
  LOG_SYNC_DEBUG("RequestManager: started (tick {}ms, timeout {}ms, max attempts {})", config_.request_tick.count(),
                 config_.request_timeout.count(), config_.max_request_attempts);
}

void RequestManager::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  // io_context::stop is thread-safe and makes run() return promptly
  io_context_.stop();
}

void RequestManager::Wait() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
  stop_callback_.reset();
  work_guard_.reset();
}

void RequestManager::schedule_next_tick() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }

  tick_timer_.expires_after(config_.request_tick);
  tick_timer_.async_wait([this](const asio::error_code& ec) {
    if (!ec && running_.load(std::memory_order_acquire)) {
      try {
        ProcessTimers();
      } catch (const std::exception& e) {
        LOG_SYNC_ERROR("RequestManager: request tick failed: {}", e.what());
      }
      schedule_next_tick();
    }
  });
}

void RequestManager::MergeCandidatesLocked(PendingHash& entry, const std::vector<std::string>& peer_ids) {
  for (const auto& id : peer_ids) {
    if (id.empty()) {
      continue;
    }
    if (std::find(entry.candidates.begin(), entry.candidates.end(), id) == entry.candidates.end()) {
      entry.candidates.push_back(id);
    }
  }
}

void RequestManager::MarkResolvedLocked(const chain::BlockHash& hash) {
  if (!resolved_.insert(hash).second) {
    return;
  }
  resolved_order_.push_back(hash);
  while (resolved_order_.size() > config_.resolved_cache_size) {
    resolved_.erase(resolved_order_.front());
    resolved_order_.pop_front();
  }
}

RequestManager::PendingMap::iterator RequestManager::InsertLocked(const chain::BlockHash& hash) {
  if (pending_.size() >= config_.max_pending && !EvictDormantLocked()) {
    return pending_.end();
  }
  PendingHash entry;
  entry.added = util::GetSteadyTime();
  return pending_.emplace(hash, std::move(entry)).first;
}

bool RequestManager::EvictDormantLocked() {
  while (!dormant_order_.empty()) {
    chain::BlockHash hash = std::move(dormant_order_.front());
    dormant_order_.pop_front();
    auto it = pending_.find(hash);
    if (it != pending_.end() && it->second.candidates.empty()) {
      LOG_SYNC_TRACE("RequestManager: evicting dormant {}", util::HexStr(hash));
      pending_.erase(it);
      evicted_.fetch_add(1, std::memory_order_relaxed);
      return true;
    }
  }
  return false;
}

void RequestManager::TrackDormantLocked(const chain::BlockHash& hash) {
  dormant_order_.push_back(hash);
  if (dormant_order_.size() <= 2 * config_.max_pending) {
    return;
  }
  // Compact: drop hashes that are gone or have gained a candidate
  std::set<chain::BlockHash> seen;
  std::deque<chain::BlockHash> live;
  for (auto& h : dormant_order_) {
    auto it = pending_.find(h);
    if (it != pending_.end() && it->second.candidates.empty() && seen.insert(h).second) {
      live.push_back(std::move(h));
    }
  }
  dormant_order_.swap(live);
}

void RequestManager::AddHash(const chain::BlockHash& hash, const std::vector<std::string>& peer_ids) {
  if (hash.empty()) {
    return;
  }

  // Block store lookup happens outside mutex_
  if (chain_.FindBlock(hash)) {
    LOG_SYNC_TRACE("RequestManager: {} already stored locally", util::HexStr(hash));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (IsResolvedLocked(hash)) {
    duplicates_ignored_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  auto it = pending_.find(hash);
  const bool inserted = it == pending_.end();
  if (inserted) {
    it = InsertLocked(hash);
    if (it == pending_.end()) {
      rejected_.fetch_add(1, std::memory_order_relaxed);
      LOG_SYNC_WARN_RL("RequestManager: pending table full ({} entries), dropping {}", pending_.size(),
                       util::HexStr(hash));
      return;
    }
  }

  MergeCandidatesLocked(it->second, peer_ids);
  if (inserted) {
    if (it->second.candidates.empty()) {
      TrackDormantLocked(hash);
    }
    LOG_SYNC_TRACE("RequestManager: tracking {} ({} candidates)", util::HexStr(hash), it->second.candidates.size());
  }
}

bool RequestManager::AddBlock(chain::BlockPtr block, const std::string& source_peer) {
  if (!block) {
    return false;
  }

  const chain::BlockHash hash = block->GetHash();
  const bool want_parent = !source_peer.empty() && !block->parent.empty() && !chain_.FindBlock(block->parent);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsResolvedLocked(hash)) {
      duplicates_ignored_.fetch_add(1, std::memory_order_relaxed);
      LOG_SYNC_TRACE("RequestManager: ignoring already resolved block {}", util::HexStr(hash));
      return false;
    }

    MarkResolvedLocked(hash);
    pending_.erase(hash);

    // Orphan back-fill: ask the peer that sent the block for its parent
    if (want_parent && !IsResolvedLocked(block->parent)) {
      auto it = pending_.find(block->parent);
      if (it == pending_.end()) {
        it = InsertLocked(block->parent);
        if (it != pending_.end()) {
          LOG_SYNC_DEBUG("RequestManager: requesting missing parent {} of {} from peer {}",
                         util::HexStr(block->parent), util::HexStr(hash), source_peer);
        } else {
          rejected_.fetch_add(1, std::memory_order_relaxed);
        }
      }
      if (it != pending_.end()) {
        MergeCandidatesLocked(it->second, {source_peer});
      }
    }
  }

  blocks_resolved_.fetch_add(1, std::memory_order_relaxed);
  sink_(std::move(block));
  return true;
}

void RequestManager::ProcessTimers() {
  const auto now = util::GetSteadyTime();
  std::map<std::string, std::vector<std::string>> batches;  // peer -> hex hashes

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = pending_.begin(); it != pending_.end();) {
      PendingHash& entry = it->second;

      if (entry.state == State::IN_FLIGHT) {
        if (now - entry.last_attempt < config_.request_timeout) {
          ++it;
          continue;
        }
        if (config_.max_request_attempts > 0 && entry.attempts >= config_.max_request_attempts) {
          LOG_SYNC_DEBUG("RequestManager: giving up on {} after {} attempts", util::HexStr(it->first),
                         entry.attempts);
          expired_.fetch_add(1, std::memory_order_relaxed);
          it = pending_.erase(it);
          continue;
        }
        retries_.fetch_add(1, std::memory_order_relaxed);
        entry.state = State::PENDING;
      }

      if (entry.candidates.empty()) {
        if (now - entry.added >= config_.dormant_timeout) {
          LOG_SYNC_TRACE("RequestManager: dropping dormant {}", util::HexStr(it->first));
          expired_.fetch_add(1, std::memory_order_relaxed);
          it = pending_.erase(it);
          continue;
        }
        ++it;
        continue;
      }

      const std::string& peer = entry.candidates[entry.next_candidate % entry.candidates.size()];
      entry.next_candidate = (entry.next_candidate + 1) % entry.candidates.size();
      entry.state = State::IN_FLIGHT;
      entry.attempts++;
      entry.last_attempt = now;
      batches[peer].push_back(util::HexStr(it->first));
      ++it;
    }
  }

  for (auto& [peer, hashes] : batches) {
    for (size_t offset = 0; offset < hashes.size(); offset += protocol::MAX_INVENTORY_SIZE) {
      size_t end = std::min(hashes.size(), offset + protocol::MAX_INVENTORY_SIZE);
      DataRequest request;
      request.channel = protocol::ChannelID::BLOCK;
      request.entries.assign(hashes.begin() + offset, hashes.begin() + end);

      LOG_SYNC_TRACE("RequestManager: requesting {} hashes from peer {}", request.entries.size(), peer);
      dispatcher_.GetData({peer}, request);
      requests_sent_.fetch_add(1, std::memory_order_relaxed);
      hashes_requested_.fetch_add(request.entries.size(), std::memory_order_relaxed);
    }
  }
}

bool RequestManager::IsPending(const chain::BlockHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.count(hash) > 0;
}

bool RequestManager::IsResolved(const chain::BlockHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return IsResolvedLocked(hash);
}

std::optional<PendingInfo> RequestManager::GetPending(const chain::BlockHash& hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(hash);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  PendingInfo info;
  info.candidates = it->second.candidates;
  info.in_flight = it->second.state == State::IN_FLIGHT;
  info.attempts = it->second.attempts;
  return info;
}

size_t RequestManager::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

RequestStats RequestManager::GetStats() const {
  RequestStats stats;
  stats.pending = PendingCount();
  stats.requests_sent = requests_sent_.load(std::memory_order_relaxed);
  stats.hashes_requested = hashes_requested_.load(std::memory_order_relaxed);
  stats.retries = retries_.load(std::memory_order_relaxed);
  stats.expired = expired_.load(std::memory_order_relaxed);
  stats.evicted = evicted_.load(std::memory_order_relaxed);
  stats.rejected = rejected_.load(std::memory_order_relaxed);
  stats.blocks_resolved = blocks_resolved_.load(std::memory_order_relaxed);
  stats.duplicates_ignored = duplicates_ignored_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace sync
}  // namespace ukulele
