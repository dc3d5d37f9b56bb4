// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "sync/sync_config.hpp"

#include "util/logging.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ukulele {
namespace sync {

namespace {

bool IsValidLevel(const std::string& level) {
  return spdlog::level::from_str(level) != spdlog::level::off || level == "off";
}

template <typename T>
T GetOr(const json& section, const char* key, T fallback) {
  if (!section.contains(key)) {
    return fallback;
  }
  try {
    return section.at(key).get<T>();
  } catch (const json::exception& e) {
    throw std::invalid_argument(std::string("SyncConfig: bad value for '") + key + "': " + e.what());
  }
}

}  // namespace

void SyncConfig::Validate() const {
  if (message_queue_size == 0) {
    throw std::invalid_argument("SyncConfig: message_queue_size must be positive");
  }
  if (request_tick.count() <= 0) {
    throw std::invalid_argument("SyncConfig: request_tick_ms must be positive");
  }
  if (request_timeout.count() <= 0) {
    throw std::invalid_argument("SyncConfig: request_timeout_ms must be positive");
  }
  if (resolved_cache_size == 0) {
    throw std::invalid_argument("SyncConfig: resolved_cache_size must be positive");
  }
  if (max_pending == 0) {
    throw std::invalid_argument("SyncConfig: max_pending must be positive");
  }
  if (dormant_timeout.count() <= 0) {
    throw std::invalid_argument("SyncConfig: dormant_timeout_ms must be positive");
  }
  if (!IsValidLevel(log_level)) {
    throw std::invalid_argument("SyncConfig: unknown log level '" + log_level + "'");
  }
}

SyncConfig SyncConfig::FromJson(const json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("SyncConfig: top-level value must be an object");
  }

  SyncConfig config;
  if (j.contains("sync")) {
    const json& s = j.at("sync");
    if (!s.is_object()) {
      throw std::invalid_argument("SyncConfig: 'sync' must be an object");
    }
    config.message_queue_size = GetOr<size_t>(s, "message_queue_size", config.message_queue_size);
    config.request_tick = std::chrono::milliseconds(GetOr<int64_t>(s, "request_tick_ms", config.request_tick.count()));
    config.request_timeout =
        std::chrono::milliseconds(GetOr<int64_t>(s, "request_timeout_ms", config.request_timeout.count()));
    config.max_request_attempts = GetOr<uint32_t>(s, "max_request_attempts", config.max_request_attempts);
    config.resolved_cache_size = GetOr<size_t>(s, "resolved_cache_size", config.resolved_cache_size);
    config.max_pending = GetOr<size_t>(s, "max_pending", config.max_pending);
    config.dormant_timeout =
        std::chrono::milliseconds(GetOr<int64_t>(s, "dormant_timeout_ms", config.dormant_timeout.count()));
  }
  if (j.contains("log")) {
    const json& l = j.at("log");
    if (!l.is_object()) {
      throw std::invalid_argument("SyncConfig: 'log' must be an object");
    }
    config.print_self_id = GetOr<bool>(l, "print_self_id", config.print_self_id);
    config.log_level = GetOr<std::string>(l, "level", config.log_level);
  }

  config.Validate();
  return config;
}

std::optional<SyncConfig> SyncConfig::LoadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("SyncConfig: cannot open {}", path);
    return std::nullopt;
  }

  try {
    json j;
    file >> j;
    return FromJson(j);
  } catch (const std::exception& e) {
    LOG_ERROR("SyncConfig: failed to load {}: {}", path, e.what());
    return std::nullopt;
  }
}

}  // namespace sync
}  // namespace ukulele
