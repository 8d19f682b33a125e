/**
 * @file http_server.hpp
 * @brief Minimal HTTP/1.1 server: request parsing and a polling accept loop.
 *
 * One request per connection, answered with "Connection: close". The accept
 * thread polls the listener with a short timeout so Stop() returns promptly.
 * Connections are served one at a time on the accept thread; handlers are
 * expected to return quickly (task submission never waits for processing).
 */

#ifndef WQ_HTTP_SERVER_HPP_
#define WQ_HTTP_SERVER_HPP_

#include "wq/log.hpp"
#include "wq/platform.hpp"
#include "wq/socket.hpp"
#include "wq/vocabulary.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <strings.h>

namespace wq {

// ============================================================================
// Request parsing
// ============================================================================

constexpr size_t kHttpMaxHeaderBytes = 8U * 1024U;
constexpr size_t kHttpMaxBodyBytes = 64U * 1024U;

enum class HttpParseError : uint8_t {
  kIncomplete = 0,  ///< Need more bytes.
  kMalformed,       ///< Answer 400.
  kBodyTooLarge,    ///< Answer 413.
};

struct HttpRequest {
  std::string method;
  std::string target;
  std::string version;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  /// Case-insensitive header lookup; nullptr when absent.
  const std::string* FindHeader(const char* name) const noexcept {
    for (const auto& h : headers) {
      if (::strcasecmp(h.first.c_str(), name) == 0) {
        return &h.second;
      }
    }
    return nullptr;
  }
};

struct HttpResponse {
  int32_t status{200};
  std::string body;
  std::string content_type{"application/json"};
};

namespace detail {

inline std::string TrimWhitespace(const std::string& s) {
  const size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return std::string();
  const size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1U);
}

inline bool IsToken(const std::string& s) noexcept {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isupper(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

inline bool ParseContentLength(const std::string& v, size_t& out) noexcept {
  if (v.empty() || v.size() > 19U) return false;
  size_t n = 0U;
  for (char c : v) {
    if (c < '0' || c > '9') return false;
    n = n * 10U + static_cast<size_t>(c - '0');
  }
  out = n;
  return true;
}

}  // namespace detail

/**
 * @brief Parse one request from the bytes received so far.
 *
 * Returns kIncomplete until the header block and the Content-Length body
 * have both arrived. Chunked transfer encoding is not supported.
 */
inline expected<HttpRequest, HttpParseError> ParseHttpRequest(
    const std::string& buf) {
  using Result = expected<HttpRequest, HttpParseError>;

  const size_t head_end = buf.find("\r\n\r\n");
  if (head_end == std::string::npos) {
    return Result::error(buf.size() > kHttpMaxHeaderBytes
                             ? HttpParseError::kMalformed
                             : HttpParseError::kIncomplete);
  }
  if (head_end > kHttpMaxHeaderBytes) {
    return Result::error(HttpParseError::kMalformed);
  }

  HttpRequest req;

  // Request line
  size_t line_end = buf.find("\r\n");
  const std::string request_line = buf.substr(0, line_end);
  const size_t sp1 = request_line.find(' ');
  const size_t sp2 = (sp1 == std::string::npos)
                         ? std::string::npos
                         : request_line.find(' ', sp1 + 1U);
  if (sp2 == std::string::npos ||
      request_line.find(' ', sp2 + 1U) != std::string::npos) {
    return Result::error(HttpParseError::kMalformed);
  }
  req.method = request_line.substr(0, sp1);
  req.target = request_line.substr(sp1 + 1U, sp2 - sp1 - 1U);
  req.version = request_line.substr(sp2 + 1U);
  if (!detail::IsToken(req.method) || req.target.empty() ||
      req.target[0] != '/' || req.version.compare(0, 7, "HTTP/1.") != 0) {
    return Result::error(HttpParseError::kMalformed);
  }

  // Header fields
  size_t pos = line_end + 2U;
  while (pos < head_end) {
    line_end = buf.find("\r\n", pos);
    const std::string line = buf.substr(pos, line_end - pos);
    const size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0U) {
      return Result::error(HttpParseError::kMalformed);
    }
    req.headers.emplace_back(line.substr(0, colon),
                             detail::TrimWhitespace(line.substr(colon + 1U)));
    pos = line_end + 2U;
  }

  if (req.FindHeader("Transfer-Encoding") != nullptr) {
    return Result::error(HttpParseError::kMalformed);
  }

  size_t content_length = 0U;
  if (const std::string* cl = req.FindHeader("Content-Length")) {
    if (!detail::ParseContentLength(*cl, content_length)) {
      return Result::error(HttpParseError::kMalformed);
    }
    if (content_length > kHttpMaxBodyBytes) {
      return Result::error(HttpParseError::kBodyTooLarge);
    }
  }

  const size_t body_start = head_end + 4U;
  if (buf.size() - body_start < content_length) {
    return Result::error(HttpParseError::kIncomplete);
  }
  req.body = buf.substr(body_start, content_length);
  return Result::success(std::move(req));
}

inline const char* HttpStatusText(int32_t status) noexcept {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    default:  return "Unknown";
  }
}

inline std::string FormatHttpResponse(const HttpResponse& resp) {
  std::string out = "HTTP/1.1 ";
  out += std::to_string(resp.status);
  out += ' ';
  out += HttpStatusText(resp.status);
  out += "\r\nContent-Type: ";
  out += resp.content_type;
  out += "\r\nContent-Length: ";
  out += std::to_string(resp.body.size());
  out += "\r\nConnection: close\r\n\r\n";
  out += resp.body;
  return out;
}

// ============================================================================
// HttpServer
// ============================================================================

/**
 * @brief Request handler. Called on the server thread.
 */
using HttpHandlerFn = HttpResponse (*)(const HttpRequest& request,
                                       void* context);

struct HttpServerConfig {
  uint32_t poll_interval_ms{100U};   ///< Accept poll period (Stop latency).
  uint32_t read_timeout_ms{2000U};   ///< Per-connection receive deadline.
};

#if WQ_HAS_NETWORK

class HttpServer final {
 public:
  HttpServer(HttpHandlerFn handler, void* context,
             const HttpServerConfig& config = HttpServerConfig{}) noexcept
      : handler_(handler), context_(context), cfg_(config) {}

  ~HttpServer() { Stop(); }

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * @brief Bind @p host:@p port and start the accept thread.
   *
   * Port 0 binds an ephemeral port; read it back with Port().
   */
  expected<void, SocketError> Start(const std::string& host, uint16_t port) {
    WQ_ASSERT(handler_ != nullptr);
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, SocketError>::error(SocketError::kBindFailed);
    }

    auto addr = SocketAddress::FromIpv4(host.c_str(), port);
    if (!addr.has_value()) {
      WQ_LOG_ERROR("Http", "invalid listen address %s", host.c_str());
      return expected<void, SocketError>::error(addr.get_error());
    }
    auto created = TcpListener::Create();
    if (!created.has_value()) {
      return expected<void, SocketError>::error(created.get_error());
    }
    TcpListener listener = std::move(created).value();

    auto r = listener.SetReuseAddr(true);
    if (r.has_value()) r = listener.Bind(addr.value());
    if (r.has_value()) r = listener.Listen();
    if (!r.has_value()) {
      WQ_LOG_ERROR("Http", "cannot listen on %s:%u: %s", host.c_str(),
                   static_cast<unsigned>(port), SocketErrorName(r.get_error()));
      return r;
    }

    auto bound = listener.LocalPort();
    port_ = bound.has_value() ? bound.value() : port;
    listener_ = std::move(listener);
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&HttpServer::AcceptLoop, this);
    WQ_LOG_INFO("Http", "listening on %s:%u", host.c_str(),
                static_cast<unsigned>(port_));
    return expected<void, SocketError>::success();
  }

  void Stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable()) {
      thread_.join();
      WQ_LOG_INFO("Http", "stopped (%llu requests served)",
                  static_cast<unsigned long long>(requests_served_.load()));
    }
    listener_.Close();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint16_t Port() const noexcept { return port_; }

  uint64_t RequestsServed() const noexcept {
    return requests_served_.load(std::memory_order_relaxed);
  }

 private:
  void AcceptLoop() {
    const auto poll_ms = static_cast<int32_t>(cfg_.poll_interval_ms);
    while (running_.load(std::memory_order_acquire)) {
      auto ready = listener_.WaitReadable(poll_ms);
      if (!ready.has_value()) {
        WQ_LOG_ERROR("Http", "poll on listener failed: %s",
                     SocketErrorName(ready.get_error()));
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
        continue;
      }
      if (!ready.value()) continue;

      auto client = listener_.Accept();
      if (!client.has_value()) {
        WQ_LOG_WARN("Http", "accept failed");
        continue;
      }
      TcpSocket conn = std::move(client).value();
      ServeConnection(conn);
    }
  }

  void ServeConnection(TcpSocket& conn) {
    std::string buf;
    char chunk[4096];
    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(cfg_.read_timeout_ms);

    while (true) {
      auto parsed = ParseHttpRequest(buf);
      if (parsed.has_value()) {
        const HttpRequest& req = parsed.value();
        HttpResponse resp = handler_(req, context_);
        WQ_LOG_DEBUG("Http", "%s %s -> %d", req.method.c_str(),
                     req.target.c_str(), resp.status);
        Reply(conn, resp);
        return;
      }
      if (parsed.get_error() == HttpParseError::kMalformed) {
        Reply(conn, ErrorResponse(400, "bad request"));
        return;
      }
      if (parsed.get_error() == HttpParseError::kBodyTooLarge) {
        Reply(conn, ErrorResponse(413, "payload too large"));
        return;
      }

      const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now()).count();
      if (left <= 0 || !running_.load(std::memory_order_acquire)) {
        WQ_LOG_DEBUG("Http", "connection timed out with %zu bytes", buf.size());
        return;
      }
      auto ready = conn.WaitReadable(static_cast<int32_t>(left));
      if (!ready.has_value()) return;
      if (!ready.value()) continue;

      auto n = conn.Recv(chunk, sizeof(chunk));
      if (!n.has_value()) {
        WQ_LOG_DEBUG("Http", "recv failed: %s", SocketErrorName(n.get_error()));
        return;
      }
      if (n.value() == 0) {
        if (!buf.empty()) {
          Reply(conn, ErrorResponse(400, "bad request"));
        }
        return;
      }
      buf.append(chunk, static_cast<size_t>(n.value()));
    }
  }

  void Reply(TcpSocket& conn, const HttpResponse& resp) {
    const std::string wire = FormatHttpResponse(resp);
    auto sent = conn.SendAll(wire.data(), wire.size());
    if (!sent.has_value()) {
      WQ_LOG_WARN("Http", "response not delivered: %s",
                  SocketErrorName(sent.get_error()));
    }
    conn.ShutdownWrite();
    requests_served_.fetch_add(1U, std::memory_order_relaxed);
  }

  static HttpResponse ErrorResponse(int32_t status, const char* message) {
    HttpResponse resp;
    resp.status = status;
    resp.body = std::string("{\"error\":\"") + message + "\"}";
    return resp;
  }

  HttpHandlerFn handler_;
  void* context_;
  const HttpServerConfig cfg_;

  TcpListener listener_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  uint16_t port_{0U};
  std::atomic<uint64_t> requests_served_{0U};
};

#endif  // WQ_HAS_NETWORK

}  // namespace wq

#endif  // WQ_HTTP_SERVER_HPP_
