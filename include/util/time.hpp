// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace ukulele {
namespace util {

// Wall-clock time in seconds since epoch (mockable)
int64_t GetTime();

// Monotonic time (mockable). With mock time active the steady clock advances
// by exactly the mock-time delta, so timeouts can be driven from tests.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in seconds since epoch (0 disables mocking)
void SetMockTime(int64_t time);
int64_t GetMockTime();

// RAII helper for tests: enables mock time for the lifetime of the scope
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace ukulele
