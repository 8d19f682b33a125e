/**
 * @file log.hpp
 * @brief Lightweight diagnostic logging with printf-style macros.
 *
 * Output format (stderr):
 *   [2026-10-19 12:00:00.123] [INFO] [Dispatch] worker-3 spawned (pool=3/8)
 *
 * Two filters apply:
 *   - compile time: WQ_LOG_MIN_LEVEL (0=DEBUG .. 4=FATAL, 5=OFF) removes
 *     macro bodies below the floor;
 *   - run time: SetLevel() drops records below the current threshold.
 *
 * Records from concurrent threads are serialized under one mutex so lines
 * never interleave.
 */

#ifndef WQ_LOG_HPP_
#define WQ_LOG_HPP_

#include "wq/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <mutex>

#include <strings.h>

#ifndef WQ_LOG_MIN_LEVEL
#ifdef NDEBUG
#define WQ_LOG_MIN_LEVEL 1
#else
#define WQ_LOG_MIN_LEVEL 0
#endif
#endif

namespace wq {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> initialized{false};
  return initialized;
}

inline std::mutex& OutputMutex() noexcept {
  static std::mutex mtx;
  return mtx;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug: return "DEBUG";
    case Level::kInfo:  return "INFO";
    case Level::kWarn:  return "WARN";
    case Level::kError: return "ERROR";
    case Level::kFatal: return "FATAL";
    default:            return "OFF";
  }
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

/// @brief Format local wall-clock time as "YYYY-MM-DD HH:MM:SS.mmm".
inline void FormatNow(char* buf, size_t bufsz) noexcept {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  struct std::tm tm_local {};
  localtime_r(&t, &tm_local);
  (void)std::snprintf(buf, bufsz, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, static_cast<int>(ms));
}

}  // namespace detail

// ============================================================================
// Runtime Control
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...).
 * @return true and sets @p out on a recognized name.
 */
inline bool ParseLevel(const char* name, Level& out) noexcept {
  if (name == nullptr) return false;
  struct Pair { const char* name; Level level; };
  static constexpr Pair kNames[] = {
      {"debug", Level::kDebug}, {"info", Level::kInfo},
      {"warn", Level::kWarn},   {"warning", Level::kWarn},
      {"error", Level::kError}, {"fatal", Level::kFatal},
      {"off", Level::kOff},
  };
  for (const auto& p : kNames) {
    if (strcasecmp(name, p.name) == 0) {
      out = p.level;
      return true;
    }
  }
  return false;
}

inline void Init() noexcept {
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  std::lock_guard<std::mutex> lock(detail::OutputMutex());
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

// ============================================================================
// Write Path
// ============================================================================

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) <
      static_cast<uint8_t>(detail::LogLevelRef().load(
          std::memory_order_relaxed))) {
    return;
  }

  char message[512];
  (void)std::vsnprintf(message, sizeof(message), fmt, args);

  char ts_buf[32];
  detail::FormatNow(ts_buf, sizeof(ts_buf));

  std::lock_guard<std::mutex> lock(detail::OutputMutex());
#ifdef NDEBUG
  (void)file;
  (void)line;
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf,
                     detail::LevelTag(level), category, message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%d)\n", ts_buf,
                     detail::LevelTag(level), category, message,
                     detail::Basename(file), line);
#endif
  if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace wq

// ============================================================================
// Macros
// ============================================================================

#define WQ_LOG_DEBUG(cat, fmt, ...)                                         \
  do {                                                                      \
    if (WQ_LOG_MIN_LEVEL <= 0) {                                            \
      ::wq::log::LogWrite(::wq::log::Level::kDebug, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                       \
  } while (0)

#define WQ_LOG_INFO(cat, fmt, ...)                                          \
  do {                                                                      \
    if (WQ_LOG_MIN_LEVEL <= 1) {                                            \
      ::wq::log::LogWrite(::wq::log::Level::kInfo, cat, __FILE__,          \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                       \
  } while (0)

#define WQ_LOG_WARN(cat, fmt, ...)                                          \
  do {                                                                      \
    if (WQ_LOG_MIN_LEVEL <= 2) {                                            \
      ::wq::log::LogWrite(::wq::log::Level::kWarn, cat, __FILE__,          \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                       \
  } while (0)

#define WQ_LOG_ERROR(cat, fmt, ...)                                         \
  do {                                                                      \
    if (WQ_LOG_MIN_LEVEL <= 3) {                                            \
      ::wq::log::LogWrite(::wq::log::Level::kError, cat, __FILE__,         \
                          __LINE__, fmt, ##__VA_ARGS__);                    \
    }                                                                       \
  } while (0)

#define WQ_LOG_FATAL(cat, fmt, ...)                                         \
  do {                                                                      \
    ::wq::log::LogWrite(::wq::log::Level::kFatal, cat, __FILE__, __LINE__, \
                        fmt, ##__VA_ARGS__);                                \
    std::abort();                                                           \
  } while (0)

#endif  // WQ_LOG_HPP_
