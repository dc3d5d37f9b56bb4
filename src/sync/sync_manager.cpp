// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_manager.hpp"

#include "util/hex.hpp"
#include "util/logging.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace ukulele {
namespace sync {

using protocol::ChannelID;

namespace {

std::string MakeLogPrefix(const SyncConfig& config, const ConsensusEngine& consensus) {
  if (!config.print_self_id) {
    return {};
  }
  return "[" + consensus.ID() + "] ";
}

// Hash must decode and be non-empty
std::optional<chain::BlockHash> ParseHash(const std::string& hex) {
  auto bytes = util::TryParseHex(hex);
  if (!bytes || bytes->empty()) {
    return std::nullopt;
  }
  return bytes;
}

}  // namespace

SyncManager::SyncManager(const ChainReader& chain, Dispatcher& dispatcher, MessageConsumer& consumer,
                         const ConsensusEngine& consensus, const SyncConfig& config)
    : chain_(chain),
      dispatcher_(dispatcher),
      consumer_(consumer),
      config_(config),
      log_prefix_(MakeLogPrefix(config, consensus)),
      requests_(chain, dispatcher, config, [this](chain::BlockPtr block) { OnBlockResolved(std::move(block)); }) {
  config_.Validate();
}

SyncManager::~SyncManager() {
  Stop();
  Wait();
}

std::vector<ChannelID> SyncManager::GetChannelIDs() {
  return {ChannelID::HEADER, ChannelID::BLOCK, ChannelID::PROPOSAL, ChannelID::COMMIT_CERTIFICATE, ChannelID::VOTE};
}

DecodeStatus SyncManager::ParseMessage(const std::string& peer_id, ChannelID channel, const std::vector<uint8_t>& data,
                                       SyncMessage& out) {
  MessageContent content;
  DecodeStatus status = DecodeMessage(data, content);
  if (status == DecodeStatus::OK && ContentChannel(content) != channel) {
    status = DecodeStatus::MALFORMED;
  }

  if (status != DecodeStatus::OK) {
    if (status == DecodeStatus::UNEXPECTED_MESSAGE) {
      unexpected_messages_.fetch_add(1, std::memory_order_relaxed);
    } else {
      malformed_dropped_.fetch_add(1, std::memory_order_relaxed);
    }
    LOG_SYNC_WARN_RL("{}SyncManager: dropping {} byte message from peer {} on channel {}: {}", log_prefix_,
                     data.size(), peer_id, protocol::ChannelName(channel), DecodeStatusName(status));
    return status;
  }

  out.peer_id = peer_id;
  out.channel = channel;
  out.content = std::move(content);
  return DecodeStatus::OK;
}

std::vector<uint8_t> SyncManager::EncodeMessage(const MessageContent& content) const {
  return sync::EncodeMessage(content);
}

bool SyncManager::HandleMessage(SyncMessage message) {
  auto stop_token = stop_source_.get_token();
  if (stop_token.stop_requested()) {
    return false;
  }
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool has_space =
        space_cv_.wait(lock, stop_token, [this]() { return inbound_.size() < config_.message_queue_size; });
    if (!has_space || stop_token.stop_requested()) {
      return false;
    }
    inbound_.push_back(std::move(message));
  }
  queue_cv_.notify_one();
  return true;
}

void SyncManager::Start(std::stop_token parent_token) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (started_) {
    LOG_SYNC_WARN("{}SyncManager: already started", log_prefix_);
    return;
  }
  started_ = true;

  requests_.Start(stop_source_.get_token());
  thread_ = std::thread([this, token = stop_source_.get_token()]() { Run(token); });
  parent_callback_.emplace(parent_token, std::function<void()>([this]() { Stop(); }));
  LOG_SYNC_INFO("{}SyncManager: started (queue capacity {})", log_prefix_, config_.message_queue_size);
}

void SyncManager::Stop() {
  if (stop_source_.request_stop()) {
    LOG_SYNC_DEBUG("{}SyncManager: stopping", log_prefix_);
  }
  requests_.Stop();
}

void SyncManager::Wait() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  if (thread_.joinable()) {
    thread_.join();
  }
  requests_.Wait();
  parent_callback_.reset();
}

void SyncManager::Run(std::stop_token stop_token) {
  while (true) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_cv_.wait(lock, stop_token, [this]() { return !inbound_.empty() || !completed_.empty(); });
    if (stop_token.stop_requested()) {
      break;
    }

    if (!completed_.empty()) {
      chain::BlockPtr block = std::move(completed_.front());
      completed_.pop_front();
      lock.unlock();
      DeliverBlock(block);
      continue;
    }

    SyncMessage message = std::move(inbound_.front());
    inbound_.pop_front();
    lock.unlock();
    space_cv_.notify_one();

    try {
      ProcessMessage(message);
    } catch (const std::exception& e) {
      LOG_SYNC_ERROR("{}SyncManager: error processing {} from peer {}: {}", log_prefix_,
                     MessageTypeName(TypeOf(message.content)), message.peer_id, e.what());
    }
  }
  LOG_SYNC_DEBUG("{}SyncManager: event loop exited", log_prefix_);
}

void SyncManager::OnBlockResolved(chain::BlockPtr block) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    completed_.push_back(std::move(block));
  }
  queue_cv_.notify_one();
}

void SyncManager::DeliverBlock(const chain::BlockPtr& block) {
  consumer_.AddMessage(ConsensusMessage{block});
  blocks_delivered_.fetch_add(1, std::memory_order_relaxed);
}

void SyncManager::RequestInventory(const std::vector<std::string>& peer_ids, const chain::BlockHash& start_hash) {
  InventoryRequest request;
  request.channel = ChannelID::BLOCK;
  request.start = util::HexStr(start_hash);
  LOG_SYNC_DEBUG("{}SyncManager: requesting inventory from {} peers starting at {}", log_prefix_, peer_ids.size(),
                 request.start);
  dispatcher_.GetInventory(peer_ids, request);
}

bool SyncManager::ProcessMessage(const SyncMessage& message) {
  messages_processed_.fetch_add(1, std::memory_order_relaxed);
  return std::visit(
      [this, &message](const auto& content) -> bool {
        using T = std::decay_t<decltype(content)>;
        if constexpr (std::is_same_v<T, InventoryRequest>) {
          return HandleInventoryRequest(message.peer_id, content);
        } else if constexpr (std::is_same_v<T, InventoryResponse>) {
          return HandleInventoryResponse(message.peer_id, content);
        } else if constexpr (std::is_same_v<T, DataRequest>) {
          return HandleDataRequest(message.peer_id, content);
        } else {
          static_assert(std::is_same_v<T, DataResponse>, "unhandled sync message type");
          return HandleDataResponse(message.peer_id, content);
        }
      },
      message.content);
}

bool SyncManager::HandleInventoryRequest(const std::string& peer_id, const InventoryRequest& request) {
  if (request.channel != ChannelID::BLOCK) {
    unsupported_channel_.fetch_add(1, std::memory_order_relaxed);
    LOG_SYNC_WARN_RL("{}SyncManager: inventory request on unsupported channel {} from peer {}", log_prefix_,
                     protocol::ChannelName(request.channel), peer_id);
    return false;
  }

  auto start = ParseHash(request.start);
  auto end = util::TryParseHex(request.end);  // empty end: walk to the bound
  if (!start || !end) {
    malformed_dropped_.fetch_add(1, std::memory_order_relaxed);
    LOG_SYNC_ERROR_RL("{}SyncManager: undecodable inventory range from peer {}", log_prefix_, peer_id);
    return false;
  }

  chain::BlockHash current_hash = *start;
  auto current = chain_.FindBlock(current_hash);
  if (!current) {
    not_found_.fetch_add(1, std::memory_order_relaxed);
    LOG_SYNC_ERROR_RL("{}SyncManager: inventory start {} from peer {} not found", log_prefix_, request.start, peer_id);
    return false;
  }

  InventoryResponse response;
  response.channel = ChannelID::BLOCK;
  while (true) {
    response.entries.push_back(util::HexStr(current_hash));
    if (current_hash == *end || response.entries.size() >= protocol::MAX_INVENTORY_SIZE ||
        current->children.empty()) {
      break;
    }
    current_hash = current->children.front();
    current = chain_.FindBlock(current_hash);
    if (!current) {
      LOG_SYNC_WARN("{}SyncManager: child {} missing from block store", log_prefix_, util::HexStr(current_hash));
      break;
    }
  }

  LOG_SYNC_TRACE("{}SyncManager: sending {} inventory entries to peer {}", log_prefix_, response.entries.size(),
                 peer_id);
  dispatcher_.SendInventory({peer_id}, response);
  inventory_served_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

bool SyncManager::HandleInventoryResponse(const std::string& peer_id, const InventoryResponse& response) {
  if (response.channel != ChannelID::BLOCK) {
    unsupported_channel_.fetch_add(1, std::memory_order_relaxed);
    LOG_SYNC_WARN_RL("{}SyncManager: inventory response on unsupported channel {} from peer {}", log_prefix_,
                     protocol::ChannelName(response.channel), peer_id);
    return false;
  }

  size_t accepted = 0;
  for (const auto& entry : response.entries) {
    auto hash = ParseHash(entry);
    if (!hash) {
      malformed_dropped_.fetch_add(1, std::memory_order_relaxed);
      LOG_SYNC_ERROR_RL("{}SyncManager: undecodable inventory entry from peer {}", log_prefix_, peer_id);
      continue;
    }
    requests_.AddHash(*hash, {peer_id});
    ++accepted;
  }
  return accepted > 0 || response.entries.empty();
}

bool SyncManager::HandleDataRequest(const std::string& peer_id, const DataRequest& request) {
  if (request.channel != ChannelID::BLOCK) {
    unsupported_channel_.fetch_add(1, std::memory_order_relaxed);
    LOG_SYNC_WARN_RL("{}SyncManager: data request on unsupported channel {} from peer {}", log_prefix_,
                     protocol::ChannelName(request.channel), peer_id);
    return false;
  }

  size_t served = 0;
  for (const auto& entry : request.entries) {
    auto hash = ParseHash(entry);
    if (!hash) {
      malformed_dropped_.fetch_add(1, std::memory_order_relaxed);
      LOG_SYNC_ERROR_RL("{}SyncManager: undecodable data request entry from peer {}", log_prefix_, peer_id);
      continue;
    }

    auto stored = chain_.FindBlock(*hash);
    if (!stored || !stored->block) {
      not_found_.fetch_add(1, std::memory_order_relaxed);
      LOG_SYNC_DEBUG("{}SyncManager: block {} requested by peer {} not found", log_prefix_, entry, peer_id);
      continue;
    }

    DataResponse response;
    response.channel = ChannelID::BLOCK;
    response.payload = stored->block->serialize();
    dispatcher_.SendData({peer_id}, response);
    data_served_.fetch_add(1, std::memory_order_relaxed);
    ++served;
  }
  return served > 0;
}

bool SyncManager::HandleDataResponse(const std::string& peer_id, const DataResponse& response) {
  const uint8_t* data = response.payload.data();
  const size_t size = response.payload.size();

  switch (response.channel) {
  case ChannelID::BLOCK: {
    auto block = std::make_shared<chain::Block>();
    if (!block->deserialize(data, size)) {
      break;
    }
    return HandleBlock(std::move(block), peer_id);
  }
  case ChannelID::VOTE: {
    chain::Vote vote;
    if (!vote.deserialize(data, size)) {
      break;
    }
    return HandleVote(vote);
  }
  case ChannelID::PROPOSAL: {
    chain::Proposal proposal;
    if (!proposal.deserialize(data, size)) {
      break;
    }
    return HandleProposal(proposal, peer_id);
  }
  case ChannelID::COMMIT_CERTIFICATE:
  case ChannelID::HEADER:
    unsupported_channel_.fetch_add(1, std::memory_order_relaxed);
    LOG_SYNC_WARN_RL("{}SyncManager: data response on unsupported channel {} from peer {}", log_prefix_,
                     protocol::ChannelName(response.channel), peer_id);
    return false;
  }

  malformed_dropped_.fetch_add(1, std::memory_order_relaxed);
  LOG_SYNC_ERROR_RL("{}SyncManager: undecodable {} payload ({} bytes) from peer {}", log_prefix_,
                    protocol::ChannelName(response.channel), size, peer_id);
  return false;
}

bool SyncManager::HandleBlock(chain::BlockPtr block, const std::string& peer_id) {
  if (!block) {
    return false;
  }
  requests_.AddBlock(std::move(block), peer_id);
  return true;
}

bool SyncManager::HandleProposal(const chain::Proposal& proposal, const std::string& peer_id) {
  if (proposal.commit_certificate) {
    HandleCommitCertificate(*proposal.commit_certificate);
  }
  return HandleBlock(std::make_shared<const chain::Block>(proposal.block), peer_id);
}

void SyncManager::HandleCommitCertificate(const chain::CommitCertificate& cc) {
  // Certificate votes go straight to the consumer; they are not block hints
  for (const auto& vote : cc.votes.Votes()) {
    consumer_.AddMessage(ConsensusMessage{vote});
    votes_forwarded_.fetch_add(1, std::memory_order_relaxed);
  }
}

bool SyncManager::HandleVote(const chain::Vote& vote) {
  if (vote.block && !vote.block->empty()) {
    // Known to exist, source unspecified
    requests_.AddHash(*vote.block, {});
  }
  consumer_.AddMessage(ConsensusMessage{vote});
  votes_forwarded_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

size_t SyncManager::QueueSize() const {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  return inbound_.size();
}

SyncStats SyncManager::GetStats() const {
  SyncStats stats;
  stats.messages_processed = messages_processed_.load(std::memory_order_relaxed);
  stats.malformed_dropped = malformed_dropped_.load(std::memory_order_relaxed);
  stats.unexpected_messages = unexpected_messages_.load(std::memory_order_relaxed);
  stats.unsupported_channel = unsupported_channel_.load(std::memory_order_relaxed);
  stats.not_found = not_found_.load(std::memory_order_relaxed);
  stats.inventory_served = inventory_served_.load(std::memory_order_relaxed);
  stats.data_served = data_served_.load(std::memory_order_relaxed);
  stats.votes_forwarded = votes_forwarded_.load(std::memory_order_relaxed);
  stats.blocks_delivered = blocks_delivered_.load(std::memory_order_relaxed);
  return stats;
}

}  // namespace sync
}  // namespace ukulele
