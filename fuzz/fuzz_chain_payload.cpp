// Fuzz target for block, vote and proposal deserialization
// These arrive as DataResponse payloads from arbitrary peers.
//
// First byte selects the payload type, the rest is the payload.

#include "chain/block.hpp"
#include <cstdint>
#include <cstddef>

using namespace ukulele::chain;

namespace {

template <typename T>
void CheckRoundTrip(const uint8_t *data, size_t size) {
    T value;
    if (!value.deserialize(data, size)) {
        return;
    }

    auto serialized = value.serialize();
    T value2;
    if (!value2.deserialize(serialized.data(), serialized.size())) {
        // Deserialize() failed on serialize() output - BUG!
        __builtin_trap();
    }
    if (value2.serialize() != serialized) {
        __builtin_trap();
    }
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1) {
        return 0;
    }
    const uint8_t selector = data[0];
    ++data;
    --size;

    switch (selector % 4) {
    case 0: {
        CheckRoundTrip<Block>(data, size);
        Block block;
        if (block.deserialize(data, size)) {
            Block copy;
            auto bytes = block.serialize();
            if (copy.deserialize(bytes.data(), bytes.size()) && copy.GetHash() != block.GetHash()) {
                // Hash computation not deterministic - BUG!
                __builtin_trap();
            }
        }
        break;
    }
    case 1: {
        CheckRoundTrip<Vote>(data, size);
        Vote vote;
        if (vote.deserialize(data, size)) {
            auto bytes = vote.serialize();
            Vote copy;
            if (!copy.deserialize(bytes.data(), bytes.size()) || !(copy == vote)) {
                __builtin_trap();
            }
        }
        break;
    }
    case 2:
        CheckRoundTrip<Proposal>(data, size);
        break;
    default:
        CheckRoundTrip<CommitCertificate>(data, size);
        break;
    }

    return 0;
}
