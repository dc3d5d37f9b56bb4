// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_message.hpp"

#include "network/message.hpp"

#include <type_traits>

namespace ukulele {
namespace sync {

using message::MessageDeserializer;
using message::MessageSerializer;

namespace {

void WriteHashList(MessageSerializer& s, const std::vector<std::string>& entries) {
  s.write_varint(entries.size());
  for (const auto& entry : entries) {
    s.write_string(entry);
  }
}

// Count is checked before anything is allocated
DecodeStatus ReadHashList(MessageDeserializer& d, std::vector<std::string>& entries) {
  uint64_t count = d.read_varint();
  if (d.has_error()) {
    return DecodeStatus::MALFORMED;
  }
  if (count > protocol::MAX_INVENTORY_SIZE) {
    return DecodeStatus::OVERSIZED;
  }
  entries.clear();
  entries.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    entries.push_back(d.read_string(protocol::MAX_HASH_STRING_LENGTH));
    if (d.has_error()) {
      return DecodeStatus::MALFORMED;
    }
  }
  return DecodeStatus::OK;
}

}  // namespace

MessageType TypeOf(const MessageContent& content) {
  return std::visit(
      [](const auto& msg) -> MessageType {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, InventoryRequest>) {
          return MessageType::INVENTORY_REQUEST;
        } else if constexpr (std::is_same_v<T, InventoryResponse>) {
          return MessageType::INVENTORY_RESPONSE;
        } else if constexpr (std::is_same_v<T, DataRequest>) {
          return MessageType::DATA_REQUEST;
        } else {
          static_assert(std::is_same_v<T, DataResponse>, "unhandled sync message type");
          return MessageType::DATA_RESPONSE;
        }
      },
      content);
}

const char* MessageTypeName(MessageType type) {
  switch (type) {
  case MessageType::INVENTORY_REQUEST:
    return "inventory-request";
  case MessageType::INVENTORY_RESPONSE:
    return "inventory-response";
  case MessageType::DATA_REQUEST:
    return "data-request";
  case MessageType::DATA_RESPONSE:
    return "data-response";
  }
  return "unknown";
}

const char* DecodeStatusName(DecodeStatus status) {
  switch (status) {
  case DecodeStatus::OK:
    return "ok";
  case DecodeStatus::MALFORMED:
    return "malformed";
  case DecodeStatus::OVERSIZED:
    return "oversized";
  case DecodeStatus::UNEXPECTED_MESSAGE:
    return "unexpected-message";
  }
  return "unknown";
}

ChannelID ContentChannel(const MessageContent& content) {
  return std::visit([](const auto& msg) { return msg.channel; }, content);
}

std::vector<uint8_t> EncodeMessage(const MessageContent& content) {
  MessageSerializer s;
  s.write_uint8(static_cast<uint8_t>(TypeOf(content)));
  s.write_uint8(static_cast<uint8_t>(ContentChannel(content)));

  std::visit(
      [&s](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, InventoryRequest>) {
          s.write_string(msg.start);
          s.write_string(msg.end);
        } else if constexpr (std::is_same_v<T, DataResponse>) {
          s.write_var_bytes(msg.payload);
        } else {
          WriteHashList(s, msg.entries);
        }
      },
      content);
  return s.release();
}

DecodeStatus DecodeMessage(const uint8_t* data, size_t size, MessageContent& out) {
  if (size > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    return DecodeStatus::OVERSIZED;
  }

  MessageDeserializer d(data, size);
  uint8_t raw_type = d.read_uint8();
  uint8_t raw_channel = d.read_uint8();
  if (d.has_error()) {
    return DecodeStatus::MALFORMED;
  }
  if (!protocol::IsKnownChannel(raw_channel)) {
    return DecodeStatus::MALFORMED;
  }
  auto channel = static_cast<ChannelID>(raw_channel);

  MessageContent content;
  DecodeStatus status = DecodeStatus::OK;
  switch (static_cast<MessageType>(raw_type)) {
  case MessageType::INVENTORY_REQUEST: {
    InventoryRequest req;
    req.channel = channel;
    req.start = d.read_string(protocol::MAX_HASH_STRING_LENGTH);
    req.end = d.read_string(protocol::MAX_HASH_STRING_LENGTH);
    content = std::move(req);
    break;
  }
  case MessageType::INVENTORY_RESPONSE: {
    InventoryResponse resp;
    resp.channel = channel;
    status = ReadHashList(d, resp.entries);
    content = std::move(resp);
    break;
  }
  case MessageType::DATA_REQUEST: {
    DataRequest req;
    req.channel = channel;
    status = ReadHashList(d, req.entries);
    content = std::move(req);
    break;
  }
  case MessageType::DATA_RESPONSE: {
    DataResponse resp;
    resp.channel = channel;
    resp.payload = d.read_var_bytes(protocol::MAX_PROTOCOL_MESSAGE_LENGTH);
    content = std::move(resp);
    break;
  }
  default:
    return DecodeStatus::UNEXPECTED_MESSAGE;
  }

  if (status != DecodeStatus::OK) {
    return status;
  }
  if (d.has_error() || d.bytes_remaining() != 0) {
    return DecodeStatus::MALFORMED;
  }
  out = std::move(content);
  return DecodeStatus::OK;
}

}  // namespace sync
}  // namespace ukulele
