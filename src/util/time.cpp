// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace ukulele {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

// Reference points used to map mock seconds onto the steady clock.
// Protected by g_steady_mutex.
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_steady_initialized) {
    g_real_steady_reference = std::chrono::steady_clock::now();
    g_mock_steady_reference = mock;
    g_steady_initialized = true;
  }
  return g_real_steady_reference + std::chrono::seconds(mock - g_mock_steady_reference);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the steady reference while mock time moves forward; reset it only
  // when mocking is switched off.
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace ukulele
