// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace ukulele {
namespace sync {

using protocol::ChannelID;

// Ask a peer to enumerate its chain forward from start toward end.
// Hashes are hex strings at the protocol boundary.
struct InventoryRequest {
  ChannelID channel{ChannelID::BLOCK};
  std::string start;
  std::string end;
};

// Ordered list of hashes the sender claims to have
struct InventoryResponse {
  ChannelID channel{ChannelID::BLOCK};
  std::vector<std::string> entries;
};

struct DataRequest {
  ChannelID channel{ChannelID::BLOCK};
  std::vector<std::string> entries;
};

// Single encoded block, vote or proposal
struct DataResponse {
  ChannelID channel{ChannelID::BLOCK};
  std::vector<uint8_t> payload;
};

// Closed set of sync payloads. Alternative order matches MessageType.
using MessageContent = std::variant<InventoryRequest, InventoryResponse, DataRequest, DataResponse>;

// Explicit wire discriminant (first byte of every encoded message)
enum class MessageType : uint8_t {
  INVENTORY_REQUEST = 1,
  INVENTORY_RESPONSE = 2,
  DATA_REQUEST = 3,
  DATA_RESPONSE = 4,
};

MessageType TypeOf(const MessageContent& content);
const char* MessageTypeName(MessageType type);

// Envelope for one inbound message: origin peer, transport channel, payload
struct SyncMessage {
  std::string peer_id;
  ChannelID channel{ChannelID::BLOCK};
  MessageContent content;
};

enum class DecodeStatus {
  OK,
  MALFORMED,           // truncated, trailing bytes, bad channel, bad string
  OVERSIZED,           // message or element count over protocol limits
  UNEXPECTED_MESSAGE,  // discriminant outside MessageType
};

const char* DecodeStatusName(DecodeStatus status);

std::vector<uint8_t> EncodeMessage(const MessageContent& content);

// Decode one message. out is only written when OK is returned.
DecodeStatus DecodeMessage(const uint8_t* data, size_t size, MessageContent& out);
inline DecodeStatus DecodeMessage(const std::vector<uint8_t>& data, MessageContent& out) {
  return DecodeMessage(data.data(), data.size(), out);
}

// Channel carried inside the payload
ChannelID ContentChannel(const MessageContent& content);

}  // namespace sync
}  // namespace ukulele
