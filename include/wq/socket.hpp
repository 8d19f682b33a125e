/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file socket.hpp
 * @brief RAII TCP stream socket and listener over POSIX sockets (IPv4).
 *
 * Both types hold a detail::OwnedFd and are move-only. Descriptors are
 * opened close-on-exec; blocking calls retry on EINTR. WaitReadable() wraps
 * poll(2) so accept and receive loops can check a stop flag between waits.
 */

#ifndef WQ_SOCKET_HPP_
#define WQ_SOCKET_HPP_

#include "wq/platform.hpp"
#include "wq/vocabulary.hpp"

#if WQ_HAS_NETWORK

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <utility>

namespace wq {

constexpr int32_t kDefaultBacklog = 128;

// ============================================================================
// SocketError
// ============================================================================

enum class SocketError : uint8_t {
  kInvalidFd = 0,
  kInvalidAddress,
  kBindFailed,
  kListenFailed,
  kConnectFailed,
  kSendFailed,
  kRecvFailed,
  kAcceptFailed,
  kSetOptFailed,
  kPollFailed,
  kTimeout,
};

inline const char* SocketErrorName(SocketError e) noexcept {
  switch (e) {
    case SocketError::kInvalidFd:      return "invalid fd";
    case SocketError::kInvalidAddress: return "invalid address";
    case SocketError::kBindFailed:     return "bind failed";
    case SocketError::kListenFailed:   return "listen failed";
    case SocketError::kConnectFailed:  return "connect failed";
    case SocketError::kSendFailed:     return "send failed";
    case SocketError::kRecvFailed:     return "recv failed";
    case SocketError::kAcceptFailed:   return "accept failed";
    case SocketError::kSetOptFailed:   return "setsockopt failed";
    case SocketError::kPollFailed:     return "poll failed";
    case SocketError::kTimeout:        return "timeout";
  }
  return "unknown";
}

using SocketStatus = expected<void, SocketError>;

namespace detail {

/// Move-only owner of one descriptor; closes it on destruction.
class OwnedFd {
 public:
  OwnedFd() noexcept = default;
  explicit OwnedFd(int32_t fd) noexcept : fd_(fd) {}
  ~OwnedFd() { Reset(); }

  OwnedFd(OwnedFd&& other) noexcept : fd_(other.Release()) {}
  OwnedFd& operator=(OwnedFd&& other) noexcept {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  OwnedFd(const OwnedFd&) = delete;
  OwnedFd& operator=(const OwnedFd&) = delete;

  int32_t Get() const noexcept { return fd_; }
  bool Valid() const noexcept { return fd_ >= 0; }

  int32_t Release() noexcept {
    const int32_t fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset(int32_t fd = -1) noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int32_t fd_{-1};
};

inline expected<OwnedFd, SocketError> OpenStreamFd() noexcept {
  const int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return expected<OwnedFd, SocketError>::error(SocketError::kInvalidFd);
  }
  return expected<OwnedFd, SocketError>::success(OwnedFd(fd));
}

/// Map a POSIX return code to a SocketStatus.
inline SocketStatus Check(int rc, SocketError on_failure) noexcept {
  return (rc < 0) ? SocketStatus::error(on_failure) : SocketStatus::success();
}

/// poll(2) one fd for input. true = readable, false = timed out or EINTR.
inline expected<bool, SocketError> PollReadable(int32_t fd,
                                                int32_t timeout_ms) noexcept {
  if (fd < 0) {
    return expected<bool, SocketError>::error(SocketError::kInvalidFd);
  }
  pollfd pfd{};
  pfd.fd = fd;
  pfd.events = POLLIN;
  const int rc = ::poll(&pfd, 1, timeout_ms);
  if (rc < 0 && errno != EINTR) {
    return expected<bool, SocketError>::error(SocketError::kPollFailed);
  }
  return expected<bool, SocketError>::success(rc > 0);
}

}  // namespace detail

// ============================================================================
// SocketAddress
// ============================================================================

class SocketAddress {
 public:
  SocketAddress() noexcept { std::memset(&addr_, 0, sizeof(addr_)); }

  /**
   * @param ip   Dotted-decimal IPv4 string ("0.0.0.0", "127.0.0.1", ...).
   * @param port Host byte order; 0 lets the kernel choose on bind.
   */
  static expected<SocketAddress, SocketError> FromIpv4(const char* ip,
                                                       uint16_t port) noexcept {
    SocketAddress sa;
    sa.addr_.sin_family = AF_INET;
    sa.addr_.sin_port = htons(port);
    if (ip == nullptr || ::inet_pton(AF_INET, ip, &sa.addr_.sin_addr) != 1) {
      return expected<SocketAddress, SocketError>::error(
          SocketError::kInvalidAddress);
    }
    return expected<SocketAddress, SocketError>::success(sa);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  const sockaddr* Raw() const noexcept {
    return reinterpret_cast<const sockaddr*>(&addr_);
  }

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast) -- POSIX sockaddr cast
  sockaddr* RawMut() noexcept { return reinterpret_cast<sockaddr*>(&addr_); }

  socklen_t Size() const noexcept {
    return static_cast<socklen_t>(sizeof(addr_));
  }

  uint16_t Port() const noexcept { return ntohs(addr_.sin_port); }

 private:
  sockaddr_in addr_;
};

// ============================================================================
// TcpSocket
// ============================================================================

/// Connected stream socket (client side, or one accepted connection).
class TcpSocket {
 public:
  TcpSocket() noexcept = default;

  static expected<TcpSocket, SocketError> Create() noexcept {
    auto fd = detail::OpenStreamFd();
    if (!fd.has_value()) {
      return expected<TcpSocket, SocketError>::error(fd.get_error());
    }
    return expected<TcpSocket, SocketError>::success(
        TcpSocket(std::move(fd).value()));
  }

  SocketStatus Connect(const SocketAddress& addr) noexcept {
    if (!fd_.Valid()) return SocketStatus::error(SocketError::kInvalidFd);
    int rc;
    do {
      rc = ::connect(fd_.Get(), addr.Raw(), addr.Size());
    } while (rc < 0 && errno == EINTR);
    return detail::Check(rc, SocketError::kConnectFailed);
  }

  /// One send(2); EINTR is retried. Never raises SIGPIPE.
  expected<int32_t, SocketError> Send(const void* data, size_t len) noexcept {
    if (!fd_.Valid()) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::send(fd_.Get(), data, len, MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kSendFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  /// Send until all @p len bytes are written or an error occurs.
  SocketStatus SendAll(const void* data, size_t len) noexcept {
    const auto* p = static_cast<const uint8_t*>(data);
    while (len > 0U) {
      auto r = Send(p, len);
      if (!r.has_value()) return SocketStatus::error(r.get_error());
      p += r.value();
      len -= static_cast<size_t>(r.value());
    }
    return SocketStatus::success();
  }

  /// @return Bytes received; 0 means the peer closed its write side.
  expected<int32_t, SocketError> Recv(void* buf, size_t len) noexcept {
    if (!fd_.Valid()) {
      return expected<int32_t, SocketError>::error(SocketError::kInvalidFd);
    }
    ssize_t n;
    do {
      n = ::recv(fd_.Get(), buf, len, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
      return expected<int32_t, SocketError>::error(SocketError::kRecvFailed);
    }
    return expected<int32_t, SocketError>::success(static_cast<int32_t>(n));
  }

  expected<bool, SocketError> WaitReadable(int32_t timeout_ms) noexcept {
    return detail::PollReadable(fd_.Get(), timeout_ms);
  }

  /// Half-close: the peer reads end-of-stream after the data already sent.
  void ShutdownWrite() noexcept {
    if (fd_.Valid()) {
      (void)::shutdown(fd_.Get(), SHUT_WR);
    }
  }

  void Close() noexcept { fd_.Reset(); }

  int32_t Fd() const noexcept { return fd_.Get(); }
  bool IsValid() const noexcept { return fd_.Valid(); }

 private:
  friend class TcpListener;

  explicit TcpSocket(detail::OwnedFd fd) noexcept : fd_(std::move(fd)) {}

  detail::OwnedFd fd_;
};

// ============================================================================
// TcpListener
// ============================================================================

class TcpListener {
 public:
  TcpListener() noexcept = default;

  static expected<TcpListener, SocketError> Create() noexcept {
    auto fd = detail::OpenStreamFd();
    if (!fd.has_value()) {
      return expected<TcpListener, SocketError>::error(fd.get_error());
    }
    return expected<TcpListener, SocketError>::success(
        TcpListener(std::move(fd).value()));
  }

  SocketStatus SetReuseAddr(bool enable) noexcept {
    if (!fd_.Valid()) return SocketStatus::error(SocketError::kInvalidFd);
    const int opt = enable ? 1 : 0;
    return detail::Check(
        ::setsockopt(fd_.Get(), SOL_SOCKET, SO_REUSEADDR, &opt,
                     static_cast<socklen_t>(sizeof(opt))),
        SocketError::kSetOptFailed);
  }

  SocketStatus Bind(const SocketAddress& addr) noexcept {
    if (!fd_.Valid()) return SocketStatus::error(SocketError::kInvalidFd);
    return detail::Check(::bind(fd_.Get(), addr.Raw(), addr.Size()),
                         SocketError::kBindFailed);
  }

  SocketStatus Listen(int32_t backlog = kDefaultBacklog) noexcept {
    if (!fd_.Valid()) return SocketStatus::error(SocketError::kInvalidFd);
    return detail::Check(::listen(fd_.Get(), backlog),
                         SocketError::kListenFailed);
  }

  /// Accept one pending connection. Call after WaitReadable() reports true.
  expected<TcpSocket, SocketError> Accept() noexcept {
    if (!fd_.Valid()) {
      return expected<TcpSocket, SocketError>::error(SocketError::kInvalidFd);
    }
    int32_t client;
    do {
      client = ::accept4(fd_.Get(), nullptr, nullptr, SOCK_CLOEXEC);
    } while (client < 0 && errno == EINTR);
    if (client < 0) {
      return expected<TcpSocket, SocketError>::error(
          SocketError::kAcceptFailed);
    }
    return expected<TcpSocket, SocketError>::success(
        TcpSocket(detail::OwnedFd(client)));
  }

  expected<bool, SocketError> WaitReadable(int32_t timeout_ms) noexcept {
    return detail::PollReadable(fd_.Get(), timeout_ms);
  }

  /// Port actually bound; differs from the requested one after binding 0.
  expected<uint16_t, SocketError> LocalPort() const noexcept {
    if (!fd_.Valid()) {
      return expected<uint16_t, SocketError>::error(SocketError::kInvalidFd);
    }
    SocketAddress addr;
    socklen_t len = addr.Size();
    if (::getsockname(fd_.Get(), addr.RawMut(), &len) < 0) {
      return expected<uint16_t, SocketError>::error(SocketError::kInvalidFd);
    }
    return expected<uint16_t, SocketError>::success(addr.Port());
  }

  void Close() noexcept { fd_.Reset(); }

  int32_t Fd() const noexcept { return fd_.Get(); }
  bool IsValid() const noexcept { return fd_.Valid(); }

 private:
  explicit TcpListener(detail::OwnedFd fd) noexcept : fd_(std::move(fd)) {}

  detail::OwnedFd fd_;
};

}  // namespace wq

#endif  // WQ_HAS_NETWORK

#endif  // WQ_SOCKET_HPP_
