// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ukulele {

namespace message {
class MessageSerializer;
class MessageDeserializer;
}  // namespace message

namespace chain {

// Raw block hash bytes. Hex only at the protocol boundary.
using BlockHash = std::vector<uint8_t>;

// Block - unit of chain data exchanged by the sync layer.
// Validation is the consensus engine's job; this layer only moves blocks.
class Block {
public:
  std::string chain_id;
  uint64_t epoch{0};
  uint64_t height{0};
  BlockHash parent;
  int64_t timestamp{0};
  std::string proposer;
  std::vector<std::vector<uint8_t>> txs;

  // Double SHA-256 of the serialized header (fields plus transaction root)
  BlockHash GetHash() const;

  std::vector<uint8_t> serialize() const;
  // Returns false on malformed input or trailing bytes
  bool deserialize(const uint8_t* data, size_t size);

  void Serialize(message::MessageSerializer& s) const;
  bool Deserialize(message::MessageDeserializer& d);
};

using BlockPtr = std::shared_ptr<const Block>;

// ExtendedBlock - a block as held by the local block store, with the hashes of
// its known children in the order they were recorded.
struct ExtendedBlock {
  BlockPtr block;
  BlockHash hash;
  std::vector<BlockHash> children;
};

// Vote - a validator's vote, optionally referencing a block
class Vote {
public:
  std::optional<BlockHash> block;
  uint64_t height{0};
  uint64_t epoch{0};
  std::string id;  // voter identity
  std::vector<uint8_t> signature;

  std::vector<uint8_t> serialize() const;
  bool deserialize(const uint8_t* data, size_t size);

  void Serialize(message::MessageSerializer& s) const;
  bool Deserialize(message::MessageDeserializer& d);

  bool operator==(const Vote& other) const = default;
};

// VoteSet - votes keyed by (voter, block, epoch); a later vote with the same
// key replaces the earlier one.
class VoteSet {
public:
  void AddVote(const Vote& vote);
  const std::vector<Vote>& Votes() const { return votes_; }
  size_t Size() const { return votes_.size(); }

  void Serialize(message::MessageSerializer& s) const;
  bool Deserialize(message::MessageDeserializer& d);

private:
  std::vector<Vote> votes_;
};

// CommitCertificate - aggregated proof that a block has been finalized
class CommitCertificate {
public:
  BlockHash block_hash;
  VoteSet votes;

  std::vector<uint8_t> serialize() const;
  bool deserialize(const uint8_t* data, size_t size);

  void Serialize(message::MessageSerializer& s) const;
  bool Deserialize(message::MessageDeserializer& d);
};

// Proposal - a proposed block, optionally carrying the commit certificate of
// an earlier block
class Proposal {
public:
  Block block;
  std::string proposer_id;
  std::optional<CommitCertificate> commit_certificate;

  std::vector<uint8_t> serialize() const;
  bool deserialize(const uint8_t* data, size_t size);
};

}  // namespace chain
}  // namespace ukulele
