// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/message.hpp"

#include "network/protocol.hpp"

#include <cstring>

namespace ukulele {
namespace message {

// VarInt implementation
size_t VarInt::encoded_size() const {
  if (value < 0xfd)
    return 1;
  if (value <= 0xffff)
    return 3;
  if (value <= 0xffffffff)
    return 5;
  return 9;
}

size_t VarInt::encode(uint8_t* buffer) const {
  if (value < 0xfd) {
    buffer[0] = static_cast<uint8_t>(value);
    return 1;
  }
  if (value <= 0xffff) {
    buffer[0] = 0xfd;
    buffer[1] = static_cast<uint8_t>(value);
    buffer[2] = static_cast<uint8_t>(value >> 8);
    return 3;
  }
  if (value <= 0xffffffff) {
    buffer[0] = 0xfe;
    for (int i = 0; i < 4; ++i) {
      buffer[1 + i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return 5;
  }
  buffer[0] = 0xff;
  for (int i = 0; i < 8; ++i) {
    buffer[1 + i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return 9;
}

size_t VarInt::decode(const uint8_t* buffer, size_t available) {
  if (available < 1)
    return 0;

  uint8_t first = buffer[0];
  if (first < 0xfd) {
    value = first;
    return 1;
  }

  size_t width = first == 0xfd ? 2 : (first == 0xfe ? 4 : 8);
  if (available < 1 + width)
    return 0;

  value = 0;
  for (size_t i = 0; i < width; ++i) {
    value |= static_cast<uint64_t>(buffer[1 + i]) << (8 * i);
  }

  // Reject non-canonical encodings
  if ((width == 2 && value < 0xfd) || (width == 4 && value <= 0xffff) || (width == 8 && value <= 0xffffffff)) {
    return 0;
  }
  return 1 + width;
}

// MessageSerializer implementation
void MessageSerializer::write_uint8(uint8_t value) {
  buffer_.push_back(value);
}

void MessageSerializer::write_uint16(uint16_t value) {
  buffer_.push_back(static_cast<uint8_t>(value));
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
}

void MessageSerializer::write_uint32(uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_uint64(uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<uint8_t>(value >> (8 * i)));
  }
}

void MessageSerializer::write_int64(int64_t value) {
  write_uint64(static_cast<uint64_t>(value));
}

void MessageSerializer::write_bool(bool value) {
  write_uint8(value ? 1 : 0);
}

void MessageSerializer::write_varint(uint64_t value) {
  uint8_t buf[9];
  size_t len = VarInt(value).encode(buf);
  buffer_.insert(buffer_.end(), buf, buf + len);
}

void MessageSerializer::write_string(const std::string& str) {
  write_varint(str.size());
  buffer_.insert(buffer_.end(), str.begin(), str.end());
}

void MessageSerializer::write_bytes(const uint8_t* data, size_t len) {
  buffer_.insert(buffer_.end(), data, data + len);
}

void MessageSerializer::write_bytes(const std::vector<uint8_t>& data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void MessageSerializer::write_var_bytes(const std::vector<uint8_t>& data) {
  write_varint(data.size());
  write_bytes(data);
}

// MessageDeserializer implementation
MessageDeserializer::MessageDeserializer(const uint8_t* data, size_t size)
    : data_(data), size_(size), position_(0), error_(false) {}

MessageDeserializer::MessageDeserializer(const std::vector<uint8_t>& data)
    : data_(data.data()), size_(data.size()), position_(0), error_(false) {}

bool MessageDeserializer::check_available(size_t bytes) {
  if (error_ || bytes > size_ - position_) {
    error_ = true;
    return false;
  }
  return true;
}

uint8_t MessageDeserializer::read_uint8() {
  if (!check_available(1))
    return 0;
  return data_[position_++];
}

uint16_t MessageDeserializer::read_uint16() {
  if (!check_available(2))
    return 0;
  uint16_t value = static_cast<uint16_t>(data_[position_]) | (static_cast<uint16_t>(data_[position_ + 1]) << 8);
  position_ += 2;
  return value;
}

uint32_t MessageDeserializer::read_uint32() {
  if (!check_available(4))
    return 0;
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    value |= static_cast<uint32_t>(data_[position_ + i]) << (8 * i);
  }
  position_ += 4;
  return value;
}

uint64_t MessageDeserializer::read_uint64() {
  if (!check_available(8))
    return 0;
  uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value |= static_cast<uint64_t>(data_[position_ + i]) << (8 * i);
  }
  position_ += 8;
  return value;
}

int64_t MessageDeserializer::read_int64() {
  return static_cast<int64_t>(read_uint64());
}

bool MessageDeserializer::read_bool() {
  uint8_t v = read_uint8();
  if (v > 1) {
    error_ = true;
    return false;
  }
  return v == 1;
}

uint64_t MessageDeserializer::read_varint() {
  if (error_)
    return 0;
  VarInt vi;
  size_t consumed = vi.decode(data_ + position_, size_ - position_);
  if (consumed == 0) {
    error_ = true;
    return 0;
  }
  position_ += consumed;
  return vi.value;
}

std::string MessageDeserializer::read_string(size_t max_length) {
  uint64_t len = read_varint();
  if (error_ || len > max_length || !check_available(static_cast<size_t>(len))) {
    error_ = true;
    return {};
  }
  std::string str(reinterpret_cast<const char*>(data_ + position_), static_cast<size_t>(len));
  position_ += static_cast<size_t>(len);
  return str;
}

std::vector<uint8_t> MessageDeserializer::read_bytes(size_t count) {
  if (!check_available(count))
    return {};
  std::vector<uint8_t> out(data_ + position_, data_ + position_ + count);
  position_ += count;
  return out;
}

std::vector<uint8_t> MessageDeserializer::read_var_bytes(size_t max_length) {
  uint64_t len = read_varint();
  if (error_ || len > max_length || len > protocol::MAX_PROTOCOL_MESSAGE_LENGTH) {
    error_ = true;
    return {};
  }
  return read_bytes(static_cast<size_t>(len));
}

uint64_t MessageDeserializer::read_count(size_t max_count) {
  uint64_t count = read_varint();
  // A count can never exceed the bytes left, since every element takes at least one byte
  if (error_ || count > max_count || count > bytes_remaining()) {
    error_ = true;
    return 0;
  }
  return count;
}

}  // namespace message
}  // namespace ukulele
