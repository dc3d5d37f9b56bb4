// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for sync/sync_message.cpp - sync wire codec

#include <catch2/catch_test_macros.hpp>

#include "network/message.hpp"
#include "network/protocol.hpp"
#include "sync/sync_message.hpp"

#include <string>
#include <vector>

using namespace ukulele::sync;
using ukulele::protocol::ChannelID;

TEST_CASE("SyncMessage - Discriminant and channel lead the encoding", "[sync][message][unit]") {
    InventoryRequest request;
    request.channel = ChannelID::BLOCK;
    request.start = "aa";
    request.end = "bb";

    auto bytes = EncodeMessage(request);
    REQUIRE(bytes.size() >= 2);
    REQUIRE(bytes[0] == static_cast<uint8_t>(MessageType::INVENTORY_REQUEST));
    REQUIRE(bytes[1] == static_cast<uint8_t>(ChannelID::BLOCK));

    MessageContent decoded;
    REQUIRE(DecodeMessage(bytes, decoded) == DecodeStatus::OK);
    REQUIRE(TypeOf(decoded) == MessageType::INVENTORY_REQUEST);
    const auto& got = std::get<InventoryRequest>(decoded);
    REQUIRE(got.start == "aa");
    REQUIRE(got.end == "bb");
}

TEST_CASE("SyncMessage - Each payload shape decodes to itself", "[sync][message][unit]") {
    SECTION("Inventory response keeps order") {
        InventoryResponse response;
        response.entries = {"01", "02", "03"};
        MessageContent decoded;
        REQUIRE(DecodeMessage(EncodeMessage(response), decoded) == DecodeStatus::OK);
        REQUIRE(std::get<InventoryResponse>(decoded).entries == response.entries);
    }

    SECTION("Data request") {
        DataRequest request;
        request.channel = ChannelID::BLOCK;
        request.entries = {"abcd"};
        MessageContent decoded;
        REQUIRE(DecodeMessage(EncodeMessage(request), decoded) == DecodeStatus::OK);
        REQUIRE(std::get<DataRequest>(decoded).entries == request.entries);
    }

    SECTION("Data response on the vote channel") {
        DataResponse response;
        response.channel = ChannelID::VOTE;
        response.payload = {1, 2, 3, 4};
        MessageContent decoded;
        REQUIRE(DecodeMessage(EncodeMessage(response), decoded) == DecodeStatus::OK);
        REQUIRE(ContentChannel(decoded) == ChannelID::VOTE);
        REQUIRE(std::get<DataResponse>(decoded).payload == response.payload);
    }
}

TEST_CASE("SyncMessage - Decode failures", "[sync][message][unit]") {
    MessageContent out = DataRequest{};

    SECTION("Unknown discriminant is an unexpected message") {
        std::vector<uint8_t> bytes = {0x09, static_cast<uint8_t>(ChannelID::BLOCK)};
        REQUIRE(DecodeMessage(bytes, out) == DecodeStatus::UNEXPECTED_MESSAGE);
    }

    SECTION("Empty and truncated input is malformed") {
        REQUIRE(DecodeMessage(std::vector<uint8_t>{}, out) == DecodeStatus::MALFORMED);

        auto bytes = EncodeMessage(InventoryRequest{ChannelID::BLOCK, "aabb", "ccdd"});
        bytes.pop_back();
        REQUIRE(DecodeMessage(bytes, out) == DecodeStatus::MALFORMED);
    }

    SECTION("Unknown channel is malformed") {
        auto bytes = EncodeMessage(DataRequest{ChannelID::BLOCK, {"aa"}});
        bytes[1] = 0x42;
        REQUIRE(DecodeMessage(bytes, out) == DecodeStatus::MALFORMED);
    }

    SECTION("Trailing bytes are malformed") {
        auto bytes = EncodeMessage(DataRequest{ChannelID::BLOCK, {"aa"}});
        bytes.push_back(0);
        REQUIRE(DecodeMessage(bytes, out) == DecodeStatus::MALFORMED);
    }

    SECTION("More entries than the inventory bound") {
        InventoryResponse response;
        response.entries.assign(ukulele::protocol::MAX_INVENTORY_SIZE + 1, "aa");
        REQUIRE(DecodeMessage(EncodeMessage(response), out) == DecodeStatus::OVERSIZED);
    }

    SECTION("Hash string longer than the limit") {
        DataRequest request;
        request.entries = {std::string(ukulele::protocol::MAX_HASH_STRING_LENGTH + 2, 'a')};
        REQUIRE(DecodeMessage(EncodeMessage(request), out) == DecodeStatus::MALFORMED);
    }

    // out untouched on failure
    REQUIRE(std::holds_alternative<DataRequest>(out));
    REQUIRE(std::get<DataRequest>(out).entries.empty());
}

TEST_CASE("SyncMessage - Names", "[sync][message][unit]") {
    REQUIRE(std::string(MessageTypeName(MessageType::DATA_RESPONSE)) == "data-response");
    REQUIRE(std::string(DecodeStatusName(DecodeStatus::UNEXPECTED_MESSAGE)) == "unexpected-message");
}
