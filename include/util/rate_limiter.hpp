// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Rate limiter for logging triggered by peer input

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ukulele {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Every callsite (file:line) owns a bucket of N tokens that refills linearly
 * over the configured period. Peers can make the sync layer log on every
 * malformed inventory or data message; the bucket bounds that output.
 *
 * Suppressed lines are counted per callsite so operators can still observe
 * how much was dropped.
 */
class RateLimiter {
public:
  // Returns true if the line at callsite_key may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Number of lines suppressed at callsite_key since the limiter was created
  uint64_t suppressed_count(const std::string& callsite_key) const;

  // Total number of suppressed lines across all callsites
  uint64_t total_suppressed() const;

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens;
    std::chrono::steady_clock::time_point last_refill;
    bool initialized;
    uint64_t suppressed;

    TokenBucket() : tokens(0.0), last_refill(GetSteadyTime()), initialized(false), suppressed(0) {}
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
  uint64_t total_suppressed_{0};
};

}  // namespace util
}  // namespace ukulele
