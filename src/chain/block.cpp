// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "chain/block.hpp"

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "util/hash.hpp"

#include <algorithm>

namespace ukulele {
namespace chain {

using message::MessageDeserializer;
using message::MessageSerializer;

namespace {

// Longest identity string (chain id, proposer, voter) accepted by the decoders
constexpr size_t MAX_ID_LENGTH = 256;
constexpr size_t MAX_HASH_LENGTH = 64;
constexpr size_t MAX_SIGNATURE_LENGTH = 1024;

// Decode a whole buffer with T::Deserialize; trailing bytes are an error
template <typename T>
bool DeserializeExact(T& obj, const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  if (!obj.Deserialize(d) || d.has_error()) {
    return false;
  }
  return d.bytes_remaining() == 0;
}

}  // namespace

// Block

BlockHash Block::GetHash() const {
  // Header fields followed by a commitment to the transaction list
  MessageSerializer txs_s;
  txs_s.write_varint(txs.size());
  for (const auto& tx : txs) {
    txs_s.write_var_bytes(tx);
  }

  MessageSerializer s;
  s.write_string(chain_id);
  s.write_uint64(epoch);
  s.write_uint64(height);
  s.write_var_bytes(parent);
  s.write_int64(timestamp);
  s.write_string(proposer);
  s.write_bytes(util::Hash(txs_s.data()));
  return util::Hash(s.data());
}

void Block::Serialize(MessageSerializer& s) const {
  s.write_string(chain_id);
  s.write_uint64(epoch);
  s.write_uint64(height);
  s.write_var_bytes(parent);
  s.write_int64(timestamp);
  s.write_string(proposer);
  s.write_varint(txs.size());
  for (const auto& tx : txs) {
    s.write_var_bytes(tx);
  }
}

bool Block::Deserialize(MessageDeserializer& d) {
  chain_id = d.read_string(MAX_ID_LENGTH);
  epoch = d.read_uint64();
  height = d.read_uint64();
  parent = d.read_var_bytes(MAX_HASH_LENGTH);
  timestamp = d.read_int64();
  proposer = d.read_string(MAX_ID_LENGTH);

  uint64_t num_txs = d.read_count(protocol::MAX_BLOCK_TRANSACTIONS);
  txs.clear();
  for (uint64_t i = 0; i < num_txs && !d.has_error(); ++i) {
    txs.push_back(d.read_var_bytes());
  }
  return !d.has_error();
}

std::vector<uint8_t> Block::serialize() const {
  MessageSerializer s;
  Serialize(s);
  return s.release();
}

bool Block::deserialize(const uint8_t* data, size_t size) {
  return DeserializeExact(*this, data, size);
}

// Vote

void Vote::Serialize(MessageSerializer& s) const {
  s.write_bool(block.has_value());
  if (block) {
    s.write_var_bytes(*block);
  }
  s.write_uint64(height);
  s.write_uint64(epoch);
  s.write_string(id);
  s.write_var_bytes(signature);
}

bool Vote::Deserialize(MessageDeserializer& d) {
  block.reset();
  if (d.read_bool()) {
    block = d.read_var_bytes(MAX_HASH_LENGTH);
  }
  height = d.read_uint64();
  epoch = d.read_uint64();
  id = d.read_string(MAX_ID_LENGTH);
  signature = d.read_var_bytes(MAX_SIGNATURE_LENGTH);
  return !d.has_error();
}

std::vector<uint8_t> Vote::serialize() const {
  MessageSerializer s;
  Serialize(s);
  return s.release();
}

bool Vote::deserialize(const uint8_t* data, size_t size) {
  return DeserializeExact(*this, data, size);
}

// VoteSet

void VoteSet::AddVote(const Vote& vote) {
  auto it = std::find_if(votes_.begin(), votes_.end(), [&](const Vote& v) {
    return v.id == vote.id && v.block == vote.block && v.epoch == vote.epoch;
  });
  if (it != votes_.end()) {
    *it = vote;
  } else {
    votes_.push_back(vote);
  }
}

void VoteSet::Serialize(MessageSerializer& s) const {
  s.write_varint(votes_.size());
  for (const auto& vote : votes_) {
    vote.Serialize(s);
  }
}

bool VoteSet::Deserialize(MessageDeserializer& d) {
  votes_.clear();
  uint64_t count = d.read_count(protocol::MAX_VOTES_PER_SET);
  for (uint64_t i = 0; i < count && !d.has_error(); ++i) {
    Vote vote;
    if (!vote.Deserialize(d)) {
      return false;
    }
    AddVote(vote);
  }
  return !d.has_error();
}

// CommitCertificate

void CommitCertificate::Serialize(MessageSerializer& s) const {
  s.write_var_bytes(block_hash);
  votes.Serialize(s);
}

bool CommitCertificate::Deserialize(MessageDeserializer& d) {
  block_hash = d.read_var_bytes(MAX_HASH_LENGTH);
  return !d.has_error() && votes.Deserialize(d);
}

std::vector<uint8_t> CommitCertificate::serialize() const {
  MessageSerializer s;
  Serialize(s);
  return s.release();
}

bool CommitCertificate::deserialize(const uint8_t* data, size_t size) {
  return DeserializeExact(*this, data, size);
}

// Proposal

std::vector<uint8_t> Proposal::serialize() const {
  MessageSerializer s;
  block.Serialize(s);
  s.write_string(proposer_id);
  s.write_bool(commit_certificate.has_value());
  if (commit_certificate) {
    commit_certificate->Serialize(s);
  }
  return s.release();
}

bool Proposal::deserialize(const uint8_t* data, size_t size) {
  MessageDeserializer d(data, size);
  if (!block.Deserialize(d)) {
    return false;
  }
  proposer_id = d.read_string(MAX_ID_LENGTH);
  commit_certificate.reset();
  if (d.read_bool()) {
    CommitCertificate cc;
    if (!cc.Deserialize(d)) {
      return false;
    }
    commit_certificate = std::move(cc);
  }
  return !d.has_error() && d.bytes_remaining() == 0;
}

}  // namespace chain
}  // namespace ukulele
