// Fuzz target for sync message decoding
// Tests DecodeMessage on untrusted peer bytes

#include "sync/sync_message.hpp"
#include <cstdint>
#include <cstddef>
#include <variant>

using namespace ukulele::sync;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    MessageContent content;
    DecodeStatus status = DecodeMessage(data, size, content);
    if (status != DecodeStatus::OK) {
        return 0;
    }

    // Decoded messages must re-encode to the exact input bytes
    auto encoded = EncodeMessage(content);
    if (encoded.size() != size) {
        __builtin_trap();
    }
    for (size_t i = 0; i < size; ++i) {
        if (encoded[i] != data[i]) {
            __builtin_trap();
        }
    }

    // Hash lists never exceed the inventory limit
    if (const auto* inv = std::get_if<InventoryResponse>(&content)) {
        if (inv->entries.size() > ukulele::protocol::MAX_INVENTORY_SIZE) {
            __builtin_trap();
        }
    }
    if (const auto* req = std::get_if<DataRequest>(&content)) {
        if (req->entries.size() > ukulele::protocol::MAX_INVENTORY_SIZE) {
            __builtin_trap();
        }
    }

    MessageContent again;
    if (DecodeMessage(encoded, again) != DecodeStatus::OK) {
        __builtin_trap();
    }
    if (TypeOf(again) != TypeOf(content) || ContentChannel(again) != ContentChannel(content)) {
        __builtin_trap();
    }

    return 0;
}
