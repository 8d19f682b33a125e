/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM latch for the service main thread.
 *
 * The signal handler only stores an atomic flag and writes one byte to a
 * self-pipe, both async-signal-safe. Wait() blocks on the pipe, so the main
 * thread sleeps until a signal (or Request()) arrives and then tears the
 * service down in its own order.
 */

#ifndef WQ_SHUTDOWN_HPP_
#define WQ_SHUTDOWN_HPP_

#include "wq/platform.hpp"
#include "wq/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <unistd.h>

namespace wq {

enum class ShutdownError : uint8_t {
  kPipeCreationFailed = 0,
  kSignalInstallFailed,
  kAlreadyInstantiated,
};

class ShutdownSignal;

namespace detail {

/// The single instance the signal handler writes to.
inline ShutdownSignal*& ShutdownInstance() noexcept {
  static ShutdownSignal* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Process-wide shutdown latch. At most one instance may be valid.
 *
 * @code
 *   wq::ShutdownSignal stop;
 *   stop.InstallSignalHandlers();
 *   server.Start(...);
 *   stop.Wait();
 *   server.Stop();
 * @endcode
 */
class ShutdownSignal final {
 public:
  ShutdownSignal() noexcept {
    if (detail::ShutdownInstance() != nullptr) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::ShutdownInstance() = this;
    valid_ = true;
  }

  ~ShutdownSignal() {
    if (detail::ShutdownInstance() == this) {
      detail::ShutdownInstance() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;
  ShutdownSignal(ShutdownSignal&&) = delete;
  ShutdownSignal& operator=(ShutdownSignal&&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /// Route SIGINT and SIGTERM to this latch (sigaction, SA_RESTART).
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          detail::ShutdownInstance() != nullptr
              ? ShutdownError::kAlreadyInstantiated
              : ShutdownError::kPipeCreationFailed);
    }

    struct sigaction sa {};
    sa.sa_handler = &ShutdownSignal::OnSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /// Trip the latch from code; @p signo 0 means "not a signal".
  void Request(int signo = 0) noexcept { Trip(signo); }

  bool IsRequested() const noexcept {
    return requested_.load(std::memory_order_acquire);
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

  /// Block until the latch trips. Returns immediately if it already has.
  void Wait() noexcept {
    while (!IsRequested() && pipe_fd_[0] >= 0) {
      uint8_t byte = 0U;
      const ssize_t n = ::read(pipe_fd_[0], &byte, 1);
      if (n < 0 && errno != EINTR) {
        break;
      }
    }
  }

 private:
  static void OnSignal(int signo) {
    ShutdownSignal* self = detail::ShutdownInstance();
    if (self != nullptr) {
      self->Trip(signo);
    }
  }

  void Trip(int signo) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true,
                                           std::memory_order_acq_rel)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1U;
        (void)::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  int pipe_fd_[2] = {-1, -1};
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  bool valid_{false};
};

}  // namespace wq

#endif  // WQ_SHUTDOWN_HPP_
