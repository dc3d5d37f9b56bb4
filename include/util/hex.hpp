// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ukulele {
namespace util {

// Lowercase hex encoding of a byte sequence
std::string HexStr(std::span<const uint8_t> bytes);

// Strict hex decoding. Accepts upper and lower case digits; rejects odd length
// and any non-hex character. The empty string decodes to an empty vector.
std::optional<std::vector<uint8_t>> TryParseHex(std::string_view str);

}  // namespace util
}  // namespace ukulele
