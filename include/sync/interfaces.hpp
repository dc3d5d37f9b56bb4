// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 * Capabilities the sync layer consumes from the rest of the node.
 *
 * - ChainReader: read access to the local block store
 * - Dispatcher: sends sync messages to peers (framing and transport are its concern)
 * - MessageConsumer: downstream sink (consensus engine / mempool) for resolved
 *   blocks and votes
 * - ConsensusEngine: local node identity, used in log lines
 *
 * Implementations must be safe to call from the sync and request threads.
 */

#include "chain/block.hpp"
#include "sync/sync_message.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ukulele {
namespace sync {

class ChainReader {
public:
  virtual ~ChainReader() = default;

  // std::nullopt if the block is not stored locally
  virtual std::optional<chain::ExtendedBlock> FindBlock(const chain::BlockHash& hash) const = 0;
};

class Dispatcher {
public:
  virtual ~Dispatcher() = default;

  virtual void GetInventory(const std::vector<std::string>& peer_ids, const InventoryRequest& request) = 0;
  virtual void SendInventory(const std::vector<std::string>& peer_ids, const InventoryResponse& response) = 0;
  virtual void GetData(const std::vector<std::string>& peer_ids, const DataRequest& request) = 0;
  virtual void SendData(const std::vector<std::string>& peer_ids, const DataResponse& response) = 0;
};

// Content handed to the consumption sink
using ConsensusMessage = std::variant<chain::BlockPtr, chain::Vote>;

class MessageConsumer {
public:
  virtual ~MessageConsumer() = default;
  virtual void AddMessage(const ConsensusMessage& message) = 0;
};

class ConsensusEngine {
public:
  virtual ~ConsensusEngine() = default;
  virtual std::string ID() const = 0;
};

}  // namespace sync
}  // namespace ukulele
