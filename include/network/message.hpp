// Copyright (c) 2009-2022 The Bitcoin Core developers
// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ukulele {
namespace message {

// VarInt - Variable length integer encoding (Bitcoin CompactSize)
class VarInt {
public:
  uint64_t value;

  VarInt() : value(0) {}
  explicit VarInt(uint64_t v) : value(v) {}

  // Get encoded size in bytes
  size_t encoded_size() const;

  // Encode to buffer (at least encoded_size() bytes)
  size_t encode(uint8_t* buffer) const;

  // Decode from buffer, returns bytes consumed (0 on underflow or non-canonical form)
  size_t decode(const uint8_t* buffer, size_t available);
};

// Serialization buffer for building wire-format payloads
class MessageSerializer {
public:
  MessageSerializer() = default;

  void write_uint8(uint8_t value);
  void write_uint16(uint16_t value);
  void write_uint32(uint32_t value);
  void write_uint64(uint64_t value);
  void write_int64(int64_t value);
  void write_bool(bool value);

  void write_varint(uint64_t value);
  void write_string(const std::string& str);
  void write_bytes(const uint8_t* data, size_t len);
  void write_bytes(const std::vector<uint8_t>& data);

  // Varint length prefix followed by the bytes
  void write_var_bytes(const std::vector<uint8_t>& data);

  const std::vector<uint8_t>& data() const { return buffer_; }
  std::vector<uint8_t> release() { return std::move(buffer_); }
  size_t size() const { return buffer_.size(); }

  void clear() { buffer_.clear(); }

private:
  std::vector<uint8_t> buffer_;
};

// Deserialization buffer for parsing wire-format payloads.
// Reads past the end set a sticky error flag and return zero values.
class MessageDeserializer {
public:
  MessageDeserializer(const uint8_t* data, size_t size);
  explicit MessageDeserializer(const std::vector<uint8_t>& data);

  uint8_t read_uint8();
  uint16_t read_uint16();
  uint32_t read_uint32();
  uint64_t read_uint64();
  int64_t read_int64();
  bool read_bool();

  uint64_t read_varint();
  std::string read_string(size_t max_length = SIZE_MAX);
  std::vector<uint8_t> read_bytes(size_t count);

  // Varint length prefix followed by the bytes; errors if length > max_length
  std::vector<uint8_t> read_var_bytes(size_t max_length = SIZE_MAX);

  // Reads a varint element count and errors if it exceeds max_count
  uint64_t read_count(size_t max_count);

  size_t bytes_remaining() const { return size_ - position_; }
  size_t position() const { return position_; }
  bool has_error() const { return error_; }

  // Mark the buffer as malformed (e.g. a semantic check failed)
  void set_error() { error_ = true; }

private:
  const uint8_t* data_;
  size_t size_;
  size_t position_;
  bool error_;

  bool check_available(size_t bytes);
};

}  // namespace message
}  // namespace ukulele
