// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/rate_limiter.hpp"

#include <algorithm>

namespace ukulele {
namespace util {

bool RateLimiter::should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto now = GetSteadyTime();
  auto& bucket = buckets_[callsite_key];

  // First access starts with a full bucket (burst)
  if (!bucket.initialized) {
    bucket.tokens = static_cast<double>(tokens_per_period);
    bucket.last_refill = now;
    bucket.initialized = true;
  }

  auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - bucket.last_refill).count();
  if (elapsed > 0 && period_seconds > 0) {
    double refill_rate = static_cast<double>(tokens_per_period) / period_seconds;
    bucket.tokens = std::min(bucket.tokens + (refill_rate * elapsed), static_cast<double>(tokens_per_period));
    bucket.last_refill = now;
  }

  if (bucket.tokens >= 1.0) {
    bucket.tokens -= 1.0;
    return true;
  }

  ++bucket.suppressed;
  ++total_suppressed_;
  return false;
}

uint64_t RateLimiter::suppressed_count(const std::string& callsite_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = buckets_.find(callsite_key);
  return it == buckets_.end() ? 0 : it->second.suppressed;
}

uint64_t RateLimiter::total_suppressed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_suppressed_;
}

RateLimiter& RateLimiter::instance() {
  static RateLimiter instance;
  return instance;
}

}  // namespace util
}  // namespace ukulele
