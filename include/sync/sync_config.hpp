// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace ukulele {
namespace sync {

// SyncConfig - tunables for the sync manager and the request engine.
//
// JSON layout:
//   {
//     "sync": { "message_queue_size": 2000, "request_tick_ms": 1000,
//               "request_timeout_ms": 10000, "max_request_attempts": 20,
//               "resolved_cache_size": 65536, "max_pending": 16384,
//               "dormant_timeout_ms": 300000 },
//     "log":  { "print_self_id": false, "level": "info" }
//   }
// Missing keys keep their defaults.
struct SyncConfig {
  size_t message_queue_size{2000};
  std::chrono::milliseconds request_tick{1000};
  std::chrono::milliseconds request_timeout{10000};
  uint32_t max_request_attempts{20};  // 0 = retry forever
  size_t resolved_cache_size{65536};
  // Bound on tracked pending hashes. When full, the oldest entry with no
  // candidate peer is evicted; if there is none the new hash is refused.
  size_t max_pending{16384};
  // Entries with no candidate peer are dropped after this long
  std::chrono::milliseconds dormant_timeout{300000};

  bool print_self_id{false};
  std::string log_level{"info"};

  // Throws std::invalid_argument on zero capacities, zero durations, wrong
  // JSON types or an unknown log level.
  void Validate() const;

  static SyncConfig FromJson(const nlohmann::json& j);

  // Logs and returns std::nullopt if the file cannot be read, parsed or validated
  static std::optional<SyncConfig> LoadFromFile(const std::string& path);
};

}  // namespace sync
}  // namespace ukulele
