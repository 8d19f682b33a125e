/**
 * @file service_config.hpp
 * @brief Typed settings of the task service and their sources.
 *
 * Resolution order (later wins):
 *   1. compiled defaults (ServiceConfig{})
 *   2. config file, via ConfigStore ("task", "worker", "server", "log")
 *   3. environment variables (TASK_SIMULATED_DURATION, WORKER_TIMEOUT, ...)
 */

#ifndef WQ_SERVICE_CONFIG_HPP_
#define WQ_SERVICE_CONFIG_HPP_

#include "wq/config.hpp"
#include "wq/log.hpp"
#include "wq/vocabulary.hpp"

#include <cstdint>
#include <cstdlib>
#include <string>

namespace wq {

/**
 * @brief Settings consumed by the Dispatcher and its workers.
 */
struct DispatcherConfig {
  uint32_t simulated_duration_ms{500U};
  uint32_t simulated_error_percentage{20U};
  uint32_t retry_delay_ms{1000U};
  uint32_t idle_timeout_ms{5000U};
  uint32_t max_retries{3U};            ///< Maximum attempts per task.
  uint32_t max_workers{0U};            ///< 0 = hardware concurrency.
  uint32_t retry_poll_ms{5U};          ///< Pending-retry promotion tick.
  uint32_t completed_retention{10000U};

  uint32_t EffectiveMaxWorkers() const noexcept {
    return (max_workers == 0U) ? HardwareConcurrency() : max_workers;
  }
};

struct ServiceConfig {
  DispatcherConfig dispatcher;
  std::string host{"0.0.0.0"};
  uint16_t port{3000U};
  std::string log_path{"./logs/task_service.log"};
  log::Level log_level{log::Level::kInfo};
};

// ============================================================================
// Loading
// ============================================================================

/**
 * @brief Overlay values present in @p store onto @p cfg.
 */
inline void ApplyConfigStore(const ConfigStore& store, ServiceConfig& cfg) {
  DispatcherConfig& d = cfg.dispatcher;
  d.simulated_duration_ms =
      store.GetUint32("task", "simulated_duration_ms", d.simulated_duration_ms);
  d.simulated_error_percentage = store.GetUint32(
      "task", "simulated_error_percentage", d.simulated_error_percentage);
  d.retry_delay_ms = store.GetUint32("task", "retry_delay_ms", d.retry_delay_ms);
  d.max_retries = store.GetUint32("task", "max_retries", d.max_retries);
  d.idle_timeout_ms =
      store.GetUint32("worker", "idle_timeout_ms", d.idle_timeout_ms);
  d.max_workers = store.GetUint32("worker", "max_workers", d.max_workers);
  d.retry_poll_ms = store.GetUint32("worker", "retry_poll_ms", d.retry_poll_ms);
  d.completed_retention =
      store.GetUint32("task", "completed_retention", d.completed_retention);

  cfg.host = store.GetString("server", "host", cfg.host.c_str());
  cfg.port = store.GetPort("server", "port", cfg.port);
  cfg.log_path = store.GetString("log", "path", cfg.log_path.c_str());

  const char* level = store.GetString("log", "level", nullptr);
  if (level != nullptr && !log::ParseLevel(level, cfg.log_level)) {
    WQ_LOG_WARN("Config", "unknown log.level '%s', keeping default", level);
  }
}

/// Environment lookup signature (SystemEnv in production).
using EnvLookupFn = const char* (*)(const char* name);

inline const char* SystemEnv(const char* name) { return std::getenv(name); }

namespace detail {

inline void EnvUint32(EnvLookupFn lookup, const char* name, uint32_t& out) {
  const char* raw = lookup(name);
  if (raw == nullptr || *raw == '\0') return;
  char* end = nullptr;
  long long v = std::strtoll(raw, &end, 10);
  if (end == raw || *end != '\0' || v < 0 || v > static_cast<long long>(UINT32_MAX)) {
    WQ_LOG_WARN("Config", "ignoring %s='%s' (not a non-negative integer)",
                name, raw);
    return;
  }
  out = static_cast<uint32_t>(v);
}

}  // namespace detail

/**
 * @brief Overlay environment variables onto @p cfg.
 *
 * Malformed numeric values are ignored with a warning.
 */
inline void ApplyEnvironment(ServiceConfig& cfg,
                             EnvLookupFn lookup = &SystemEnv) {
  DispatcherConfig& d = cfg.dispatcher;
  detail::EnvUint32(lookup, "TASK_SIMULATED_DURATION", d.simulated_duration_ms);
  detail::EnvUint32(lookup, "TASK_SIMULATED_ERROR_PERCENTAGE",
                    d.simulated_error_percentage);
  detail::EnvUint32(lookup, "TASK_ERROR_RETRY_DELAY", d.retry_delay_ms);
  detail::EnvUint32(lookup, "TASK_MAX_RETRIES", d.max_retries);
  detail::EnvUint32(lookup, "WORKER_TIMEOUT", d.idle_timeout_ms);
  detail::EnvUint32(lookup, "WORKER_MAX", d.max_workers);

  uint32_t port = cfg.port;
  detail::EnvUint32(lookup, "SERVER_PORT", port);
  if (port <= 65535U) {
    cfg.port = static_cast<uint16_t>(port);
  } else {
    WQ_LOG_WARN("Config", "ignoring SERVER_PORT=%u (out of range)", port);
  }

  if (const char* host = lookup("SERVER_HOST"); host != nullptr && *host != '\0') {
    cfg.host = host;
  }
  if (const char* path = lookup("LOG_PATH"); path != nullptr && *path != '\0') {
    cfg.log_path = path;
  }
  if (const char* level = lookup("LOG_LEVEL"); level != nullptr) {
    if (!log::ParseLevel(level, cfg.log_level)) {
      WQ_LOG_WARN("Config", "ignoring LOG_LEVEL='%s'", level);
    }
  }
}

/**
 * @brief Reject settings the dispatcher cannot honour.
 */
inline expected<void, ConfigError> ValidateServiceConfig(
    const ServiceConfig& cfg) {
  const DispatcherConfig& d = cfg.dispatcher;
  if (d.simulated_error_percentage > 100U) {
    WQ_LOG_ERROR("Config", "simulated_error_percentage=%u exceeds 100",
                 d.simulated_error_percentage);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (d.max_retries == 0U) {
    WQ_LOG_ERROR("Config", "max_retries must be at least 1");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (d.idle_timeout_ms == 0U || d.retry_poll_ms == 0U) {
    WQ_LOG_ERROR("Config", "idle_timeout_ms and retry_poll_ms must be > 0");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  if (cfg.port == 0U) {
    WQ_LOG_ERROR("Config", "server port must be > 0");
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<void, ConfigError>::success();
}

/**
 * @brief Defaults, then @p path (when non-empty), then the environment.
 *
 * A missing file is not an error: the service runs on defaults and env.
 */
inline expected<ServiceConfig, ConfigError> LoadServiceConfig(
    const char* path, EnvLookupFn lookup = &SystemEnv) {
  ServiceConfig cfg;
  if (path != nullptr && *path != '\0') {
    MultiConfig store;
    auto r = store.LoadFile(path);
    if (r.has_value()) {
      ApplyConfigStore(store, cfg);
      WQ_LOG_INFO("Config", "loaded %u entries from %s", store.EntryCount(),
                  path);
    } else if (r.get_error() == ConfigError::kFileNotFound) {
      WQ_LOG_WARN("Config", "%s not found, using defaults", path);
    } else {
      WQ_LOG_ERROR("Config", "failed to load %s: %s", path,
                   ConfigErrorName(r.get_error()));
      return expected<ServiceConfig, ConfigError>::error(r.get_error());
    }
  }
  ApplyEnvironment(cfg, lookup);

  auto v = ValidateServiceConfig(cfg);
  if (!v.has_value()) {
    return expected<ServiceConfig, ConfigError>::error(v.get_error());
  }
  return expected<ServiceConfig, ConfigError>::success(std::move(cfg));
}

}  // namespace wq

#endif  // WQ_SERVICE_CONFIG_HPP_
