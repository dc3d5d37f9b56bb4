// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for chain/block.cpp - block, vote and proposal codecs

#include <catch2/catch_test_macros.hpp>

#include "chain/block.hpp"
#include "common/mock_collaborators.hpp"

#include <vector>

using namespace ukulele::chain;
using ukulele::test::MakeBlock;

namespace {

Vote MakeVote(const std::string& voter, std::optional<BlockHash> block, uint64_t epoch = 1) {
    Vote vote;
    vote.block = std::move(block);
    vote.height = 5;
    vote.epoch = epoch;
    vote.id = voter;
    vote.signature = {0x01, 0x02, 0x03};
    return vote;
}

}  // namespace

TEST_CASE("Block - Hash", "[chain][block][unit]") {
    auto block = MakeBlock({}, 1);

    SECTION("Hash is a 32 byte double SHA-256 and stable") {
        auto hash = block->GetHash();
        REQUIRE(hash.size() == 32);
        REQUIRE(block->GetHash() == hash);
    }

    SECTION("Every header field and the transactions affect the hash") {
        const auto base = block->GetHash();

        Block changed = *block;
        changed.height = 2;
        REQUIRE(changed.GetHash() != base);

        changed = *block;
        changed.parent = BlockHash(32, 0x11);
        REQUIRE(changed.GetHash() != base);

        changed = *block;
        changed.proposer = "someone-else";
        REQUIRE(changed.GetHash() != base);

        changed = *block;
        changed.txs.push_back({0x42});
        REQUIRE(changed.GetHash() != base);
    }
}

TEST_CASE("Block - Serialization", "[chain][block][unit]") {
    auto block = MakeBlock(BlockHash(32, 0xab), 7, "proposer-3", 9);
    auto bytes = block->serialize();

    SECTION("Decoded block has the same hash") {
        Block decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()));
        REQUIRE(decoded.GetHash() == block->GetHash());
        REQUIRE(decoded.height == 7);
        REQUIRE(decoded.proposer == "proposer-3");
        REQUIRE(decoded.txs == block->txs);
    }

    SECTION("Truncated input rejected") {
        Block decoded;
        REQUIRE_FALSE(decoded.deserialize(bytes.data(), bytes.size() - 1));
        REQUIRE_FALSE(decoded.deserialize(bytes.data(), 0));
    }

    SECTION("Trailing bytes rejected") {
        bytes.push_back(0x00);
        Block decoded;
        REQUIRE_FALSE(decoded.deserialize(bytes.data(), bytes.size()));
    }
}

TEST_CASE("Vote - Serialization", "[chain][vote][unit]") {
    SECTION("Vote with block reference") {
        auto vote = MakeVote("v1", BlockHash(32, 0x01));
        auto bytes = vote.serialize();
        Vote decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()));
        REQUIRE(decoded == vote);
    }

    SECTION("Nil vote") {
        auto vote = MakeVote("v1", std::nullopt);
        auto bytes = vote.serialize();
        Vote decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()));
        REQUIRE_FALSE(decoded.block.has_value());
    }

    SECTION("Garbage rejected") {
        std::vector<uint8_t> garbage = {0x07, 0x01};
        Vote decoded;
        REQUIRE_FALSE(decoded.deserialize(garbage.data(), garbage.size()));
    }
}

TEST_CASE("VoteSet - Same voter, block and epoch replace", "[chain][vote][unit]") {
    VoteSet set;
    set.AddVote(MakeVote("v1", BlockHash(32, 0x01)));
    set.AddVote(MakeVote("v2", BlockHash(32, 0x01)));
    set.AddVote(MakeVote("v1", BlockHash(32, 0x01)));
    set.AddVote(MakeVote("v1", BlockHash(32, 0x01), 2));
    REQUIRE(set.Size() == 3);
}

TEST_CASE("Proposal - Serialization", "[chain][proposal][unit]") {
    Proposal proposal;
    proposal.block = *MakeBlock(BlockHash(32, 0xcd), 10);
    proposal.proposer_id = "p1";

    SECTION("Without commit certificate") {
        auto bytes = proposal.serialize();
        Proposal decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()));
        REQUIRE(decoded.block.GetHash() == proposal.block.GetHash());
        REQUIRE_FALSE(decoded.commit_certificate.has_value());
    }

    SECTION("With commit certificate") {
        CommitCertificate cc;
        cc.block_hash = BlockHash(32, 0xcd);
        cc.votes.AddVote(MakeVote("v1", cc.block_hash));
        cc.votes.AddVote(MakeVote("v2", cc.block_hash));
        proposal.commit_certificate = cc;

        auto bytes = proposal.serialize();
        Proposal decoded;
        REQUIRE(decoded.deserialize(bytes.data(), bytes.size()));
        REQUIRE(decoded.commit_certificate.has_value());
        REQUIRE(decoded.commit_certificate->block_hash == cc.block_hash);
        REQUIRE(decoded.commit_certificate->votes.Size() == 2);
    }
}

TEST_CASE("CommitCertificate - Serialization", "[chain][unit]") {
    CommitCertificate cc;
    cc.block_hash = BlockHash(32, 0x55);
    cc.votes.AddVote(MakeVote("v1", cc.block_hash));

    auto bytes = cc.serialize();
    CommitCertificate decoded;
    REQUIRE(decoded.deserialize(bytes.data(), bytes.size()));
    REQUIRE(decoded.votes.Votes().front() == cc.votes.Votes().front());

    bytes.pop_back();
    REQUIRE_FALSE(decoded.deserialize(bytes.data(), bytes.size()));
}
