// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ukulele {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * One named logger per component ("default", "network", "sync", "chain"),
 * all sharing the same sinks. Initialization runs exactly once
 * (std::call_once); logger access is mutex protected.
 */
class LogManager {
public:
  // Initialize logging with the given minimum level. Only the first call
  // has an effect.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "sync.log");

  // Flush and drop all loggers. Later logging calls re-initialize.
  static void Shutdown();

  // Logger for a component. Unknown components get the default logger.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level for all components
  static void SetLogLevel(const std::string& level);

  // Set log level for one component
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace ukulele

#define LOG_TRACE(...) ukulele::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) ukulele::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) ukulele::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) ukulele::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) ukulele::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...) ukulele::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...) ukulele::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...) ukulele::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...) ukulele::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...) ukulele::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_SYNC_TRACE(...) ukulele::util::LogManager::GetLogger("sync")->trace(__VA_ARGS__)
#define LOG_SYNC_DEBUG(...) ukulele::util::LogManager::GetLogger("sync")->debug(__VA_ARGS__)
#define LOG_SYNC_INFO(...) ukulele::util::LogManager::GetLogger("sync")->info(__VA_ARGS__)
#define LOG_SYNC_WARN(...) ukulele::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__)
#define LOG_SYNC_ERROR(...) ukulele::util::LogManager::GetLogger("sync")->error(__VA_ARGS__)

#define LOG_CHAIN_DEBUG(...) ukulele::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_WARN(...) ukulele::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Use for lines triggered by untrusted peer input (malformed hashes, undecodable
// payloads, unsupported channels). 200 lines per hour per callsite.

#include "util/rate_limiter.hpp"

#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_NET_WARN_RL(...)                                                                                           \
  do {                                                                                                                 \
    if (ukulele::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      ukulele::util::LogManager::GetLogger("network")->warn(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)

#define LOG_SYNC_ERROR_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (ukulele::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      ukulele::util::LogManager::GetLogger("sync")->error(__VA_ARGS__);                                                \
    }                                                                                                                  \
  } while (0)

#define LOG_SYNC_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (ukulele::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                                 \
      ukulele::util::LogManager::GetLogger("sync")->warn(__VA_ARGS__);                                                 \
    }                                                                                                                  \
  } while (0)
