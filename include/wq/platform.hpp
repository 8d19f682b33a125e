/**
 * @file platform.hpp
 * @brief Platform detection, assertion macro and host queries.
 */

#ifndef WQ_PLATFORM_HPP_
#define WQ_PLATFORM_HPP_

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <thread>

namespace wq {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define WQ_PLATFORM_LINUX 1
#endif

// Sockets use Linux flags (SOCK_CLOEXEC, MSG_NOSIGNAL, accept4).
#if defined(WQ_PLATFORM_LINUX)
#define WQ_HAS_NETWORK 1
#else
#define WQ_HAS_NETWORK 0
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/// Debug builds only: report the failed condition and abort.
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "WQ_ASSERT(%s) failed at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define WQ_ASSERT(cond) ((void)0)
#else
#define WQ_ASSERT(cond)                                                     \
  ((cond) ? ((void)0) : ::wq::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Host Queries
// ============================================================================

/**
 * @brief Number of hardware threads, never less than 1.
 *
 * std::thread::hardware_concurrency() may report 0 when the value is not
 * computable; the worker cap must still admit one worker.
 */
inline uint32_t HardwareConcurrency() noexcept {
  const unsigned n = std::thread::hardware_concurrency();
  return (n == 0U) ? 1U : static_cast<uint32_t>(n);
}

}  // namespace wq

#endif  // WQ_PLATFORM_HPP_
