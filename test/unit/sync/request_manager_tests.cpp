// Copyright (c) 2025 The Unicity Foundation
// Unit tests for sync/request_manager.cpp - pending-hash tracking and retries
//
// These tests verify:
// - Exactly-once delivery of resolved blocks
// - Candidate merging and dormant entries
// - Timeout re-arm with candidate rotation, attempt limit
// - Per-peer batching of data requests
// - Parent back-fill for orphan blocks
// - Timer-driven retry loop lifecycle

#include <catch2/catch_test_macros.hpp>

#include "common/mock_collaborators.hpp"
#include "network/protocol.hpp"
#include "sync/request_manager.hpp"
#include "util/hex.hpp"
#include "util/time.hpp"

#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

using namespace ukulele;
using namespace ukulele::sync;
using test::MakeBlock;
using test::MockChain;
using test::MockDispatcher;

namespace {

class RequestFixture {
public:
    explicit RequestFixture(SyncConfig cfg = DefaultConfig())
        : config(cfg), requests(store, dispatcher, config, [this](chain::BlockPtr block) {
              std::lock_guard<std::mutex> lock(mutex);
              delivered.push_back(std::move(block));
          }) {}

    static SyncConfig DefaultConfig() {
        SyncConfig cfg;
        cfg.request_timeout = std::chrono::seconds(5);
        cfg.max_request_attempts = 3;
        return cfg;
    }

    size_t DeliveredCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return delivered.size();
    }

    MockChain store;
    MockDispatcher dispatcher;
    SyncConfig config;
    std::mutex mutex;
    std::vector<chain::BlockPtr> delivered;
    RequestManager requests;
};

chain::BlockHash HashFor(uint32_t i) {
    chain::BlockHash hash(32, 0xab);
    hash[0] = static_cast<uint8_t>(i);
    hash[1] = static_cast<uint8_t>(i >> 8);
    hash[2] = static_cast<uint8_t>(i >> 16);
    return hash;
}

}  // namespace

TEST_CASE("RequestManager - AddHash then AddBlock delivers once", "[sync][request_manager][unit]") {
    RequestFixture f;
    auto block = MakeBlock({}, 1);
    auto hash = block->GetHash();

    f.requests.AddHash(hash, {"peer-a"});
    REQUIRE(f.requests.IsPending(hash));

    REQUIRE(f.requests.AddBlock(block));
    REQUIRE(f.DeliveredCount() == 1);
    REQUIRE(f.delivered[0] == block);
    REQUIRE_FALSE(f.requests.IsPending(hash));
    REQUIRE(f.requests.IsResolved(hash));

    SECTION("Same block again is ignored") {
        REQUIRE_FALSE(f.requests.AddBlock(MakeBlock({}, 1)));
        REQUIRE(f.DeliveredCount() == 1);
        REQUIRE(f.requests.GetStats().duplicates_ignored == 1);
    }

    SECTION("Hint for a resolved hash is a no-op") {
        f.requests.AddHash(hash, {"peer-b"});
        REQUIRE_FALSE(f.requests.IsPending(hash));
        f.requests.ProcessTimers();
        REQUIRE(f.dispatcher.data_requests().empty());
    }

    SECTION("Null block rejected") {
        REQUIRE_FALSE(f.requests.AddBlock(nullptr));
    }
}

TEST_CASE("RequestManager - Unrequested block is still delivered", "[sync][request_manager][unit]") {
    RequestFixture f;
    auto block = MakeBlock({}, 3);
    REQUIRE(f.requests.AddBlock(block));
    REQUIRE(f.DeliveredCount() == 1);
    REQUIRE(f.requests.GetStats().blocks_resolved == 1);
}

TEST_CASE("RequestManager - Candidate merging", "[sync][request_manager][unit]") {
    RequestFixture f;
    chain::BlockHash hash(32, 0x01);

    f.requests.AddHash(hash, {"peer-a", "peer-b"});
    f.requests.AddHash(hash, {"peer-b", "peer-c", ""});

    auto info = f.requests.GetPending(hash);
    REQUIRE(info.has_value());
    REQUIRE(info->candidates == std::vector<std::string>{"peer-a", "peer-b", "peer-c"});
    REQUIRE(f.requests.PendingCount() == 1);

    SECTION("Hashes stored locally are ignored") {
        auto stored = f.store.StoreChain(1);
        f.requests.AddHash(stored[0], {"peer-a"});
        REQUIRE_FALSE(f.requests.IsPending(stored[0]));
    }

    SECTION("Empty hash is ignored") {
        f.requests.AddHash({}, {"peer-a"});
        REQUIRE(f.requests.PendingCount() == 1);
    }
}

TEST_CASE("RequestManager - Dormant entries wait for a candidate", "[sync][request_manager][unit]") {
    util::MockTimeScope mock_time(1000000);
    RequestFixture f;
    chain::BlockHash hash(32, 0x02);

    f.requests.AddHash(hash, {});
    f.requests.ProcessTimers();
    REQUIRE(f.dispatcher.data_requests().empty());
    REQUIRE_FALSE(f.requests.GetPending(hash)->in_flight);

    f.requests.AddHash(hash, {"peer-a"});
    f.requests.ProcessTimers();
    auto sent = f.dispatcher.data_requests();
    REQUIRE(sent.size() == 1);
    REQUIRE(sent[0].peer_ids == std::vector<std::string>{"peer-a"});
    REQUIRE(sent[0].message.channel == protocol::ChannelID::BLOCK);
    REQUIRE(sent[0].message.entries == std::vector<std::string>{util::HexStr(hash)});
}

TEST_CASE("RequestManager - Timeout re-arms and rotates candidates", "[sync][request_manager][unit]") {
    util::MockTimeScope mock_time(1000000);
    RequestFixture f;
    auto block = MakeBlock({}, 1);
    auto hash = block->GetHash();
    f.requests.AddHash(hash, {"peer-a", "peer-b"});

    f.requests.ProcessTimers();
    REQUIRE(f.dispatcher.data_requests().size() == 1);
    REQUIRE(f.requests.GetPending(hash)->in_flight);
    REQUIRE(f.requests.GetPending(hash)->attempts == 1);

    // At most one request in flight: no resend before the timeout
    util::SetMockTime(1000004);
    f.requests.ProcessTimers();
    REQUIRE(f.dispatcher.data_requests().size() == 1);

    util::SetMockTime(1000006);
    f.requests.ProcessTimers();
    auto sent = f.dispatcher.data_requests();
    REQUIRE(sent.size() == 2);
    REQUIRE(sent[0].peer_ids[0] == "peer-a");
    REQUIRE(sent[1].peer_ids[0] == "peer-b");
    REQUIRE(f.requests.GetStats().retries == 1);

    util::SetMockTime(1000012);
    f.requests.ProcessTimers();
    sent = f.dispatcher.data_requests();
    REQUIRE(sent.size() == 3);
    REQUIRE(sent[2].peer_ids[0] == "peer-a");

    SECTION("Entry dropped after max attempts") {
        util::SetMockTime(1000018);
        f.requests.ProcessTimers();
        REQUIRE_FALSE(f.requests.IsPending(hash));
        REQUIRE(f.dispatcher.data_requests().size() == 3);
        REQUIRE(f.requests.GetStats().expired == 1);
    }

    SECTION("Response to an earlier attempt still resolves") {
        REQUIRE(f.requests.AddBlock(block, "peer-a"));
        REQUIRE(f.DeliveredCount() == 1);
        REQUIRE_FALSE(f.requests.IsPending(hash));
    }
}

TEST_CASE("RequestManager - Requests are batched per peer", "[sync][request_manager][unit]") {
    util::MockTimeScope mock_time(1000000);
    RequestFixture f;

    for (int i = 0; i < 250; ++i) {
        chain::BlockHash hash(32, 0x00);
        hash[0] = static_cast<uint8_t>(i);
        hash[1] = static_cast<uint8_t>(i >> 8);
        f.requests.AddHash(hash, {"peer-a"});
    }
    f.requests.AddHash(chain::BlockHash(32, 0xee), {"peer-b"});

    f.requests.ProcessTimers();
    auto sent = f.dispatcher.data_requests();
    REQUIRE(sent.size() == 4);

    size_t to_a = 0;
    for (const auto& request : sent) {
        REQUIRE(request.peer_ids.size() == 1);
        REQUIRE(request.message.entries.size() <= protocol::MAX_INVENTORY_SIZE);
        if (request.peer_ids[0] == "peer-a") {
            to_a += request.message.entries.size();
        }
    }
    REQUIRE(to_a == 250);
    REQUIRE(f.requests.GetStats().requests_sent == 4);
    REQUIRE(f.requests.GetStats().hashes_requested == 251);
}

TEST_CASE("RequestManager - Parent back-fill for orphans", "[sync][request_manager][unit]") {
    RequestFixture f;
    chain::BlockHash unknown_parent(32, 0x77);

    SECTION("Parent requested from the peer that sent the block") {
        f.requests.AddBlock(MakeBlock(unknown_parent, 5), "peer-x");
        auto info = f.requests.GetPending(unknown_parent);
        REQUIRE(info.has_value());
        REQUIRE(info->candidates == std::vector<std::string>{"peer-x"});
    }

    SECTION("No back-fill without a source peer") {
        f.requests.AddBlock(MakeBlock(unknown_parent, 5));
        REQUIRE_FALSE(f.requests.IsPending(unknown_parent));
    }

    SECTION("No back-fill when the parent is stored locally") {
        auto stored = f.store.StoreChain(1);
        f.requests.AddBlock(MakeBlock(stored[0], 1), "peer-x");
        REQUIRE(f.requests.PendingCount() == 0);
    }

    SECTION("No back-fill when the parent was already resolved") {
        auto parent = MakeBlock({}, 0);
        f.requests.AddBlock(parent);
        f.requests.AddBlock(MakeBlock(parent->GetHash(), 1), "peer-x");
        REQUIRE(f.requests.PendingCount() == 0);
    }
}

TEST_CASE("RequestManager - Resolved set is bounded", "[sync][request_manager][unit]") {
    SyncConfig cfg = RequestFixture::DefaultConfig();
    cfg.resolved_cache_size = 2;
    RequestFixture f(cfg);

    auto b1 = MakeBlock({}, 1);
    auto b2 = MakeBlock({}, 2);
    auto b3 = MakeBlock({}, 3);
    f.requests.AddBlock(b1);
    f.requests.AddBlock(b2);
    f.requests.AddBlock(b3);

    REQUIRE_FALSE(f.requests.IsResolved(b1->GetHash()));
    REQUIRE(f.requests.IsResolved(b2->GetHash()));
    REQUIRE(f.requests.IsResolved(b3->GetHash()));
}

TEST_CASE("RequestManager - Pending table is bounded", "[sync][request_manager][unit]") {
    util::MockTimeScope mock_time(1000000);
    SyncConfig cfg = RequestFixture::DefaultConfig();
    cfg.max_pending = 4;
    RequestFixture f(cfg);

    for (uint32_t i = 0; i < 3; ++i) {
        f.requests.AddHash(HashFor(i), {});
    }
    f.requests.AddHash(HashFor(100), {"peer-a"});
    REQUIRE(f.requests.PendingCount() == 4);

    SECTION("New hash evicts the oldest dormant entry") {
        f.requests.AddHash(HashFor(101), {"peer-b"});
        REQUIRE(f.requests.PendingCount() == 4);
        REQUIRE_FALSE(f.requests.IsPending(HashFor(0)));
        REQUIRE(f.requests.IsPending(HashFor(1)));
        REQUIRE(f.requests.IsPending(HashFor(100)));
        REQUIRE(f.requests.GetStats().evicted == 1);
    }

    SECTION("Entries that gained a candidate are not evicted") {
        f.requests.AddHash(HashFor(0), {"peer-a"});
        f.requests.AddHash(HashFor(101), {});
        REQUIRE(f.requests.IsPending(HashFor(0)));
        REQUIRE_FALSE(f.requests.IsPending(HashFor(1)));
    }

    SECTION("Full table with nothing dormant refuses new hashes") {
        for (uint32_t i = 0; i < 3; ++i) {
            f.requests.AddHash(HashFor(i), {"peer-a"});
        }
        f.requests.AddHash(HashFor(101), {});
        REQUIRE(f.requests.PendingCount() == 4);
        REQUIRE_FALSE(f.requests.IsPending(HashFor(101)));
        REQUIRE(f.requests.GetStats().rejected == 1);

        // Known hashes still merge candidates
        f.requests.AddHash(HashFor(100), {"peer-b"});
        REQUIRE(f.requests.GetPending(HashFor(100))->candidates.size() == 2);
    }

    SECTION("Flood of vote hints stays within the bound") {
        for (uint32_t i = 1000; i < 21000; ++i) {
            f.requests.AddHash(HashFor(i), {});
        }
        REQUIRE(f.requests.PendingCount() == 4);
        REQUIRE(f.requests.IsPending(HashFor(100)));
        REQUIRE(f.requests.IsPending(HashFor(20999)));
    }
}

TEST_CASE("RequestManager - Dormant entries expire", "[sync][request_manager][unit]") {
    util::MockTimeScope mock_time(1000000);
    SyncConfig cfg = RequestFixture::DefaultConfig();
    cfg.dormant_timeout = std::chrono::seconds(60);
    RequestFixture f(cfg);

    for (uint32_t i = 0; i < 500; ++i) {
        f.requests.AddHash(HashFor(i), {});
    }
    f.requests.AddHash(HashFor(1000), {"peer-a"});

    util::SetMockTime(1000030);
    f.requests.ProcessTimers();
    REQUIRE(f.requests.PendingCount() == 501);

    util::SetMockTime(1000061);
    f.requests.ProcessTimers();
    REQUIRE(f.requests.PendingCount() == 1);
    REQUIRE(f.requests.IsPending(HashFor(1000)));
    REQUIRE(f.requests.GetStats().expired == 500);

    SECTION("Block arriving after expiry is still delivered") {
        auto block = MakeBlock({}, 7);
        f.requests.AddHash(block->GetHash(), {});
        util::SetMockTime(1000200);
        f.requests.ProcessTimers();
        REQUIRE_FALSE(f.requests.IsPending(block->GetHash()));
        REQUIRE(f.requests.AddBlock(block));
        REQUIRE(f.DeliveredCount() == 1);
    }
}

TEST_CASE("RequestManager - Construction validates", "[sync][request_manager][unit]") {
    MockChain store;
    MockDispatcher dispatcher;
    SyncConfig cfg;

    REQUIRE_THROWS_AS(RequestManager(store, dispatcher, cfg, nullptr), std::invalid_argument);

    cfg.request_timeout = std::chrono::milliseconds(0);
    REQUIRE_THROWS_AS(RequestManager(store, dispatcher, cfg, [](chain::BlockPtr) {}), std::invalid_argument);
}

TEST_CASE("RequestManager - Timer-driven retry loop", "[sync][request_manager][threading]") {
    SyncConfig cfg = RequestFixture::DefaultConfig();
    cfg.request_tick = std::chrono::milliseconds(10);
    RequestFixture f(cfg);

    std::stop_source stop;
    f.requests.Start(stop.get_token());
    REQUIRE(f.requests.IsRunning());

    f.requests.AddHash(chain::BlockHash(32, 0x09), {"peer-a"});
    for (int i = 0; i < 200 && f.dispatcher.data_requests().empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    REQUIRE(f.dispatcher.data_requests().size() == 1);

    stop.request_stop();
    f.requests.Wait();
    REQUIRE_FALSE(f.requests.IsRunning());

    // Wait and Stop are safe to repeat
    f.requests.Stop();
    f.requests.Wait();
}

TEST_CASE("RequestManager - Already cancelled token", "[sync][request_manager][threading]") {
    RequestFixture f;
    std::stop_source stop;
    stop.request_stop();

    f.requests.Start(stop.get_token());
    f.requests.Wait();
    REQUIRE_FALSE(f.requests.IsRunning());
}
